/**
 * @file INotificationService.hpp
 * @brief Interface for user-facing notifications posted by plugins.
 */

#pragma once

#include <string>

namespace journal::core {

enum class NotificationSeverity : int { Info = 0, Warning = 1, Error = 2, Success = 3 };

inline std::string notificationSeverityToString(NotificationSeverity severity) {
    switch (severity) {
        case NotificationSeverity::Info: return "Info";
        case NotificationSeverity::Warning: return "Warning";
        case NotificationSeverity::Error: return "Error";
        case NotificationSeverity::Success: return "Success";
        default: return "Unknown";
    }
}

/**
 * @brief Notification channel provided by the host.
 *
 * Implementations must be safe under concurrent calls.
 */
class INotificationService {
public:
    virtual ~INotificationService() = default;

    /**
     * @brief Shows a notification to the user.
     * @param source Id of the plugin (or host component) posting the notification.
     * @param title Notification title.
     * @param message Notification body.
     * @param severity Severity level.
     */
    virtual void showNotification(const std::string& source, const std::string& title,
                                  const std::string& message, NotificationSeverity severity) = 0;
};

} // namespace journal::core
