#pragma once

#include "core/services/INotificationService.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace journal::infra {

/**
 * @brief A notification as it was posted.
 */
struct PostedNotification {
    std::string source;
    std::string title;
    std::string message;
    core::NotificationSeverity severity{core::NotificationSeverity::Info};
    std::chrono::system_clock::time_point postedAt;
};

/**
 * @brief Notification service that writes to the application log.
 *
 * Keeps the most recent notifications for inspection. Thread-safe.
 */
class LogNotificationService : public core::INotificationService {
public:
    explicit LogNotificationService(std::size_t historyLimit = 100);

    void showNotification(const std::string& source, const std::string& title,
                          const std::string& message, core::NotificationSeverity severity) override;

    /**
     * @brief Gets the retained notifications, oldest first.
     */
    [[nodiscard]] std::vector<PostedNotification> history() const;

    void clearHistory();

private:
    std::size_t historyLimit_;
    mutable std::mutex mutex_;
    std::deque<PostedNotification> history_;
};

} // namespace journal::infra
