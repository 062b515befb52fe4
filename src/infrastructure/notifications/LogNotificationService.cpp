#include "infrastructure/notifications/LogNotificationService.hpp"

#include <spdlog/spdlog.h>

namespace journal::infra {

LogNotificationService::LogNotificationService(std::size_t historyLimit)
    : historyLimit_(historyLimit) {
}

void LogNotificationService::showNotification(const std::string& source, const std::string& title,
                                              const std::string& message,
                                              core::NotificationSeverity severity) {
    switch (severity) {
        case core::NotificationSeverity::Warning:
            spdlog::warn("[{}] {}: {}", source, title, message);
            break;
        case core::NotificationSeverity::Error:
            spdlog::error("[{}] {}: {}", source, title, message);
            break;
        case core::NotificationSeverity::Info:
        case core::NotificationSeverity::Success:
        default:
            spdlog::info("[{}] {}: {}", source, title, message);
            break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back({source, title, message, severity, std::chrono::system_clock::now()});
    while (history_.size() > historyLimit_) {
        history_.pop_front();
    }
}

std::vector<PostedNotification> LogNotificationService::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {history_.begin(), history_.end()};
}

void LogNotificationService::clearHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

} // namespace journal::infra
