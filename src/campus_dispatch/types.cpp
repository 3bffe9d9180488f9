#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

std::string_view to_string(SignalType type) noexcept {
    switch (type) {
        case SignalType::StudentSos:
            return "STUDENT_SOS";
        case SignalType::StudentReport:
            return "STUDENT_REPORT";
        case SignalType::AiVision:
            return "AI_VISION";
        case SignalType::AiAudio:
            return "AI_AUDIO";
        case SignalType::PanicButton:
            return "PANIC_BUTTON";
    }
    return "UNKNOWN";
}

std::string_view to_string(IncidentStatus status) noexcept {
    switch (status) {
        case IncidentStatus::Created:
            return "CREATED";
        case IncidentStatus::Assigned:
            return "ASSIGNED";
        case IncidentStatus::InProgress:
            return "IN_PROGRESS";
        case IncidentStatus::Resolved:
            return "RESOLVED";
    }
    return "UNKNOWN";
}

std::string_view to_string(IncidentPriority priority) noexcept {
    switch (priority) {
        case IncidentPriority::Low:
            return "LOW";
        case IncidentPriority::Medium:
            return "MEDIUM";
        case IncidentPriority::High:
            return "HIGH";
        case IncidentPriority::Critical:
            return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string_view to_string(AlertStatus status) noexcept {
    switch (status) {
        case AlertStatus::Sent:
            return "SENT";
        case AlertStatus::Accepted:
            return "ACCEPTED";
        case AlertStatus::Declined:
            return "DECLINED";
        case AlertStatus::Expired:
            return "EXPIRED";
    }
    return "UNKNOWN";
}

std::string_view to_string(ActorKind kind) noexcept {
    switch (kind) {
        case ActorKind::Anonymous:
            return "ANONYMOUS";
        case ActorKind::Student:
            return "STUDENT";
        case ActorKind::Guard:
            return "GUARD";
        case ActorKind::Device:
            return "DEVICE";
        case ActorKind::AiDetector:
            return "AI_DETECTOR";
    }
    return "UNKNOWN";
}

std::string_view to_string(BuzzerStatus status) noexcept {
    switch (status) {
        case BuzzerStatus::Inactive:
            return "INACTIVE";
        case BuzzerStatus::Pending:
            return "PENDING";
        case BuzzerStatus::Active:
            return "ACTIVE";
        case BuzzerStatus::Acknowledged:
            return "ACKNOWLEDGED";
    }
    return "UNKNOWN";
}

bool is_open(IncidentStatus status) noexcept {
    return status != IncidentStatus::Resolved;
}

bool is_terminal(AlertStatus status) noexcept {
    return status != AlertStatus::Sent;
}

IncidentPriority priority_for_signal(SignalType type) noexcept {
    switch (type) {
        case SignalType::PanicButton:
        case SignalType::AiVision:
            return IncidentPriority::Critical;
        case SignalType::AiAudio:
            return IncidentPriority::High;
        case SignalType::StudentSos:
        case SignalType::StudentReport:
            return IncidentPriority::Medium;
    }
    return IncidentPriority::Medium;
}

}  // namespace campus_dispatch
