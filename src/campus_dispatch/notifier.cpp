#include "campus_dispatch/notifier.hpp"

namespace campus_dispatch {

std::string_view to_string(NotificationKind kind) noexcept {
    switch (kind) {
        case NotificationKind::GuardAlert:
            return "GUARD_ALERT";
        case NotificationKind::AssignmentConfirmed:
            return "ASSIGNMENT_CONFIRMED";
    }
    return "UNKNOWN";
}

LoggingNotifier::LoggingNotifier()
    : logger_(get_logger("notifier")) {}

void LoggingNotifier::notify(const Notification& notification) {
    logger_->info(
        R"({{"type":"{}","guard":"{}","incident":{},"alert":{},"title":{},"body":{}}})",
        to_string(notification.kind),
        notification.guard_id,
        notification.incident_id,
        notification.alert_id.has_value() ? std::to_string(notification.alert_id.value()) : "null",
        json_quote(notification.title),
        json_quote(notification.body)
    );
}

}  // namespace campus_dispatch
