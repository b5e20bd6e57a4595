#ifndef FLOWAPI_CONFIG_PARSER_HPP
#define FLOWAPI_CONFIG_PARSER_HPP

#include "pipeline_def.hpp"
#include <string>

namespace flowapi {

/**
 * @brief Parses a server configuration from a file
 *
 * Files ending in .json are read as JSON; anything else as YAML. Relative
 * extension paths are resolved against the directory of the file.
 *
 * @param file_path Path to the configuration file
 * @return Parsed server configuration
 * @throws ConfigParseError if the file cannot be read or is invalid
 */
ServerConfig parse_server_config_from_file(const std::string& file_path);

/**
 * @brief Parses a server configuration from a JSON string
 *
 * @throws ConfigParseError if JSON is invalid or a field is malformed
 */
ServerConfig parse_server_config_from_string(const std::string& json_string);

/**
 * @brief Parses a server configuration from a YAML string
 *
 * @throws ConfigParseError if YAML is invalid or a field is malformed
 */
ServerConfig parse_server_config_from_yaml(const std::string& yaml_string);

/**
 * @brief Parses a server configuration from an already decoded document
 *
 * @throws ConfigParseError if a field is missing or malformed
 */
ServerConfig parse_server_config(const Value& document);

/**
 * @brief Converts a YAML document to the JSON document model
 *
 * Quoted scalars stay strings; plain scalars become null, booleans, integers
 * or floats when they read as such.
 *
 * @throws ConfigParseError if the text is not valid YAML
 */
Value yaml_to_json(const std::string& yaml_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace flowapi

#endif // FLOWAPI_CONFIG_PARSER_HPP
