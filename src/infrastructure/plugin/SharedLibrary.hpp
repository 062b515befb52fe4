#pragma once

#include "core/plugin/PluginResult.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace journal::infra {

/**
 * @brief Owning handle to a dynamically loaded module.
 *
 * The library is closed when the last reference goes away, so every object
 * created by the module must hold a reference for as long as it lives.
 */
class SharedLibrary {
public:
    /**
     * @brief Opens a module with immediate symbol binding.
     * @param path Module path.
     * @return The library, or EntryPointNotFound with the loader's message.
     */
    static core::PluginResult<std::shared_ptr<SharedLibrary>> open(const std::filesystem::path& path);

    ~SharedLibrary();

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    /**
     * @brief Looks up an exported symbol.
     * @param name Symbol name.
     * @return Symbol address, or nullptr if not exported.
     */
    [[nodiscard]] void* symbol(const std::string& name) const;

    template <typename Func>
    [[nodiscard]] Func function(const std::string& name) const {
        return reinterpret_cast<Func>(symbol(name));
    }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    SharedLibrary(void* handle, std::filesystem::path path);

    void* handle_{nullptr};
    std::filesystem::path path_;
};

} // namespace journal::infra
