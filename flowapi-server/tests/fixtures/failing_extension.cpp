/**
 * @file failing_extension.cpp
 * @brief Extension library whose registration reports failure
 */

#include "../../src/node_registry.hpp"

extern "C" int flowapi_register_extension(flowapi::NodeTypeRegistry*) {
    return 3;
}
