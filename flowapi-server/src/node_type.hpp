/**
 * @file node_type.hpp
 * @brief Abstract interface for pluggable pipeline node capabilities
 *
 * A node capability is the executable behavior behind a `(type, version)`
 * pair. Capabilities are stateless with respect to requests: one instance is
 * shared by every node of that type in every compiled pipeline, and is invoked
 * concurrently from many requests.
 */

#ifndef FLOWAPI_NODE_TYPE_HPP
#define FLOWAPI_NODE_TYPE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <memory>

namespace flowapi {

/**
 * @brief Document model for data, state and node configuration
 */
using Value = nlohmann::json;

/**
 * @brief Two-part version number, written "major.minor"
 */
struct Version {
    unsigned int major_version;
    unsigned int minor_version;

    Version() : major_version(0), minor_version(0) {}
    Version(unsigned int major_, unsigned int minor_)
        : major_version(major_), minor_version(minor_) {}

    /**
     * @brief Parse "major.minor" or "major"
     *
     * @throws ConfigParseError If the text is not one or two non-negative integers
     */
    static Version parse(const std::string& text);

    std::string to_string() const {
        return std::to_string(major_version) + "." + std::to_string(minor_version);
    }

    bool operator==(const Version& other) const {
        return major_version == other.major_version && minor_version == other.minor_version;
    }
    bool operator!=(const Version& other) const { return !(*this == other); }
    bool operator<(const Version& other) const {
        if (major_version != other.major_version) {
            return major_version < other.major_version;
        }
        return minor_version < other.minor_version;
    }
};

/**
 * @brief Result of one node execution
 */
struct NodeOutput {
    Value data;     ///< Replacement for the context's data
    Value state;    ///< Replacement for the context's state
};

/**
 * @brief Executable behavior of a node type
 *
 * Usage Example:
 *   @code
 *   class UppercaseNode : public INodeCapability {
 *   public:
 *       NodeOutput execute(Value data, Value state, const Value& config) const override {
 *           std::string field = config.value("field", "text");
 *           std::string text = data[field].get<std::string>();
 *           std::transform(text.begin(), text.end(), text.begin(), ::toupper);
 *           data[field] = text;
 *           return {std::move(data), std::move(state)};
 *       }
 *   };
 *   @endcode
 */
class INodeCapability {
public:
    virtual ~INodeCapability() = default;

    /**
     * @brief Transform (data, state) according to config
     *
     * @param data Current payload, moved in
     * @param state Current accumulator, moved in
     * @param config The node's configuration from the pipeline declaration
     * @return New (data, state) pair
     *
     * @throws std::exception Any failure; the executor wraps it in OperatorError
     *
     * @note Must be safe to call concurrently with different data/state
     */
    virtual NodeOutput execute(Value data, Value state, const Value& config) const = 0;

    /**
     * @brief Reject a malformed node configuration at compile time
     *
     * Default implementation accepts any configuration.
     *
     * @throws std::exception Describing why the configuration is invalid
     */
    virtual void validate(const Value& config) const {
        (void)config;
    }
};

} // namespace flowapi

#endif // FLOWAPI_NODE_TYPE_HPP
