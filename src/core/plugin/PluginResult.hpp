/**
 * @file PluginResult.hpp
 * @brief Error codes and result type returned by plugin host operations.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

namespace journal::core {

/**
 * @brief Categorized failures of the plugin host.
 */
enum class PluginErrorCode : int {
    ManifestInvalid = 0,      ///< A required manifest field is blank or malformed
    ManifestNotFound = 1,     ///< The package has no plugin.json entry
    PackageCorrupt = 2,       ///< The package could not be decoded
    PluginNotFound = 3,       ///< No catalogue entry for the id
    AlreadyLoaded = 4,        ///< The id already has a live instance
    NotLoaded = 5,            ///< The id has no live instance
    EntryPointNotFound = 6,   ///< The entry point could not be resolved
    PluginInitFailed = 7,     ///< The plugin's initialize() failed or threw
    PluginShutdownFailed = 8, ///< The plugin's shutdown() failed or threw
    StoreWriteFailed = 9,     ///< I/O on the plugin store failed
    LoadTimeout = 10,         ///< Reading the package exceeded the timeout
    AnalyzerFailed = 11,      ///< A capability invocation threw or timed out
    PermissionDenied = 12     ///< The plugin lacks the permission for a context call
};

/**
 * @brief Converts an error code to its string representation.
 * @param code The error code to convert.
 * @return String name of the code.
 */
inline std::string pluginErrorCodeToString(PluginErrorCode code) {
    switch (code) {
        case PluginErrorCode::ManifestInvalid: return "ManifestInvalid";
        case PluginErrorCode::ManifestNotFound: return "ManifestNotFound";
        case PluginErrorCode::PackageCorrupt: return "PackageCorrupt";
        case PluginErrorCode::PluginNotFound: return "PluginNotFound";
        case PluginErrorCode::AlreadyLoaded: return "AlreadyLoaded";
        case PluginErrorCode::NotLoaded: return "NotLoaded";
        case PluginErrorCode::EntryPointNotFound: return "EntryPointNotFound";
        case PluginErrorCode::PluginInitFailed: return "PluginInitFailed";
        case PluginErrorCode::PluginShutdownFailed: return "PluginShutdownFailed";
        case PluginErrorCode::StoreWriteFailed: return "StoreWriteFailed";
        case PluginErrorCode::LoadTimeout: return "LoadTimeout";
        case PluginErrorCode::AnalyzerFailed: return "AnalyzerFailed";
        case PluginErrorCode::PermissionDenied: return "PermissionDenied";
        default: return "Unknown";
    }
}

/**
 * @brief A plugin host failure with a human-readable message.
 */
struct PluginError {
    PluginErrorCode code{PluginErrorCode::PluginInitFailed};
    std::string message;

    /**
     * @brief Formats the error for logs and user-facing messages.
     * @return String in format "Code: message".
     */
    [[nodiscard]] std::string toString() const {
        return pluginErrorCodeToString(code) + ": " + message;
    }
};

/**
 * @brief Holds either a value or a PluginError.
 *
 * @code
 *   auto result = manager.install(bytes);
 *   if (!result) {
 *       spdlog::error("Install failed: {}", result.error().toString());
 *   }
 * @endcode
 */
template <typename T>
class PluginResult {
public:
    static PluginResult ok(T value) { return PluginResult(std::move(value)); }
    static PluginResult err(PluginError error) { return PluginResult(std::move(error)); }
    static PluginResult err(PluginErrorCode code, std::string message) {
        return PluginResult(PluginError{code, std::move(message)});
    }

    [[nodiscard]] bool hasValue() const noexcept { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool hasError() const noexcept { return std::holds_alternative<PluginError>(data_); }
    explicit operator bool() const noexcept { return hasValue(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const PluginError& error() const& { return std::get<PluginError>(data_); }

    [[nodiscard]] T valueOr(T defaultValue) const& {
        return hasValue() ? value() : std::move(defaultValue);
    }

private:
    explicit PluginResult(T value) : data_(std::move(value)) {}
    explicit PluginResult(PluginError error) : data_(std::move(error)) {}

    std::variant<T, PluginError> data_;
};

/**
 * @brief Specialization for operations without a success value.
 */
template <>
class PluginResult<void> {
public:
    static PluginResult ok() { return PluginResult(); }
    static PluginResult err(PluginError error) { return PluginResult(std::move(error)); }
    static PluginResult err(PluginErrorCode code, std::string message) {
        return PluginResult(PluginError{code, std::move(message)});
    }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const PluginError& error() const& { return error_; }

private:
    PluginResult() : success_(true) {}
    explicit PluginResult(PluginError error) : success_(false), error_(std::move(error)) {}

    bool success_{false};
    PluginError error_;
};

} // namespace journal::core
