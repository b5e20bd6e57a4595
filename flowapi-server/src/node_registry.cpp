/**
 * @file node_registry.cpp
 * @brief Implementation of NodeTypeRegistry
 */

#include "node_registry.hpp"
#include "errors.hpp"
#include <cctype>

namespace flowapi {

namespace {

bool parse_component(const std::string& text, unsigned int& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    unsigned int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + static_cast<unsigned int>(c - '0');
    }
    out = value;
    return true;
}

} // namespace

Version Version::parse(const std::string& text) {
    Version version;
    size_t dot_pos = text.find('.');
    bool ok;
    if (dot_pos == std::string::npos) {
        ok = parse_component(text, version.major_version);
    } else {
        ok = parse_component(text.substr(0, dot_pos), version.major_version) &&
             parse_component(text.substr(dot_pos + 1), version.minor_version);
    }
    if (!ok) {
        throw ConfigParseError("Invalid version '" + text + "' (expected major.minor)");
    }
    return version;
}

void NodeTypeRegistry::register_type(
    const std::string& type,
    const Version& version,
    CapabilityPtr capability
) {
    std::string key = type_key(type, version);

    if (frozen_) {
        throw RegistryFrozen(key);
    }
    if (type.empty()) {
        throw RegistryError("Node type name cannot be empty");
    }
    if (!capability) {
        throw RegistryError("Null capability for node type: " + key);
    }

    auto registry_key = std::make_pair(type, version);
    if (registry_.find(registry_key) != registry_.end()) {
        throw DuplicateNodeType(key);
    }
    registry_[registry_key] = std::move(capability);
}

NodeTypeRegistry::CapabilityPtr NodeTypeRegistry::resolve(
    const std::string& type,
    const Version& version
) const {
    auto it = registry_.find(std::make_pair(type, version));
    if (it == registry_.end()) {
        std::string available;
        for (const auto& pair : registry_) {
            if (pair.first.first != type) continue;
            if (!available.empty()) available += ", ";
            available += pair.first.second.to_string();
        }
        std::string message = type_key(type, version);
        if (!available.empty()) {
            message += " (registered versions: " + available + ")";
        }
        throw UnknownNodeType(message);
    }
    return it->second;
}

bool NodeTypeRegistry::is_registered(const std::string& type, const Version& version) const {
    return registry_.find(std::make_pair(type, version)) != registry_.end();
}

std::vector<std::string> NodeTypeRegistry::list_types() const {
    std::vector<std::string> types;
    types.reserve(registry_.size());
    for (const auto& pair : registry_) {
        types.push_back(type_key(pair.first.first, pair.first.second));
    }
    return types;
}

} // namespace flowapi
