/**
 * @file sample_extension.cpp
 * @brief Extension library used by the loader tests
 *
 * Registers Uppercase 1.0, which upper-cases every string in data.param.
 */

#include "../../src/node_registry.hpp"
#include <memory>
#include <algorithm>
#include <cctype>

namespace {

class UppercaseNode : public flowapi::INodeCapability {
public:
    flowapi::NodeOutput execute(flowapi::Value data, flowapi::Value state,
                                const flowapi::Value&) const override {
        if (data.contains("param") && data["param"].is_object()) {
            for (auto& item : data["param"].items()) {
                if (item.value().is_string()) {
                    std::string text = item.value().get<std::string>();
                    std::transform(text.begin(), text.end(), text.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                    item.value() = text;
                }
            }
        }
        return {std::move(data), std::move(state)};
    }
};

} // namespace

extern "C" int flowapi_register_extension(flowapi::NodeTypeRegistry* registry) {
    registry->register_type("Uppercase", flowapi::Version(1, 0), std::make_shared<UppercaseNode>());
    return 0;
}
