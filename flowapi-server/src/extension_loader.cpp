#include "extension_loader.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <dlfcn.h>

namespace flowapi {

ExtensionLoader::~ExtensionLoader() {
    for (auto it = handles_.rbegin(); it != handles_.rend(); ++it) {
        dlclose(*it);
    }
}

std::string ExtensionLoader::library_file_name(const std::string& identifier) {
    if (identifier.find('/') != std::string::npos ||
        identifier.find(".so") != std::string::npos) {
        return identifier;
    }
    return "lib" + identifier + ".so";
}

void ExtensionLoader::load(const std::string& identifier, NodeTypeRegistry& registry) {
    if (identifier.empty()) {
        throw ExtensionLoadError("empty extension identifier");
    }

    std::string file_name = library_file_name(identifier);

    void* handle = dlopen(file_name.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* reason = dlerror();
        throw ExtensionLoadError(file_name + ": " + (reason ? reason : "unknown error"));
    }

    dlerror();
    void* symbol = dlsym(handle, FLOWAPI_EXTENSION_ENTRY_POINT);
    const char* symbol_error = dlerror();
    if (symbol_error || !symbol) {
        dlclose(handle);
        throw ExtensionLoadError(file_name + ": missing entry point " FLOWAPI_EXTENSION_ENTRY_POINT);
    }

    // Registered capabilities may live in the library: keep it loaded even on failure
    handles_.push_back(handle);

    auto entry_point = reinterpret_cast<ExtensionEntryPoint>(symbol);
    size_t types_before = registry.size();

    int result;
    try {
        result = entry_point(&registry);
    } catch (const std::exception& e) {
        throw ExtensionLoadError(file_name + ": registration failed: " + e.what());
    }
    if (result != 0) {
        throw ExtensionLoadError(file_name + ": registration returned " + std::to_string(result));
    }

    loaded_.push_back(file_name);

    Logger::get_instance().log_event(LogLevel::INFO, "Extension loaded", {
        {"event", "extension_loaded"},
        {"extension", file_name},
        {"node_types_added", std::to_string(registry.size() - types_before)}
    });
}

} // namespace flowapi
