#include "infrastructure/plugin/SharedLibrary.hpp"

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace journal::infra {

namespace {

std::string lastLoaderError() {
#ifdef _WIN32
    return "error code " + std::to_string(GetLastError());
#else
    const char* message = dlerror();
    return message ? message : "unknown loader error";
#endif
}

} // namespace

core::PluginResult<std::shared_ptr<SharedLibrary>> SharedLibrary::open(const std::filesystem::path& path) {
#ifdef _WIN32
    void* handle = LoadLibraryA(path.string().c_str());
#else
    void* handle = dlopen(path.string().c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
    if (!handle) {
        auto message = lastLoaderError();
        spdlog::error("Failed to open plugin library {}: {}", path.string(), message);
        return core::PluginResult<std::shared_ptr<SharedLibrary>>::err(
            core::PluginErrorCode::EntryPointNotFound,
            "Failed to open " + path.filename().string() + ": " + message);
    }

    return core::PluginResult<std::shared_ptr<SharedLibrary>>::ok(
        std::shared_ptr<SharedLibrary>(new SharedLibrary(handle, path)));
}

SharedLibrary::SharedLibrary(void* handle, std::filesystem::path path)
    : handle_(handle)
    , path_(std::move(path)) {
}

SharedLibrary::~SharedLibrary() {
    if (!handle_) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(handle_));
#else
    dlclose(handle_);
#endif
    spdlog::debug("Plugin library closed: {}", path_.string());
}

void* SharedLibrary::symbol(const std::string& name) const {
    if (!handle_) return nullptr;
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(handle_), name.c_str()));
#else
    return dlsym(handle_, name.c_str());
#endif
}

} // namespace journal::infra
