#include "campus_dispatch/audit_log.hpp"

#include <algorithm>
#include <iterator>

namespace campus_dispatch {

std::string_view to_string(AuditEventKind kind) noexcept {
    switch (kind) {
        case AuditEventKind::IncidentCreated:
            return "INCIDENT_CREATED";
        case AuditEventKind::SignalMerged:
            return "SIGNAL_MERGED";
        case AuditEventKind::PriorityChanged:
            return "PRIORITY_CHANGED";
        case AuditEventKind::StatusChanged:
            return "STATUS_CHANGED";
        case AuditEventKind::AlertSent:
            return "ALERT_SENT";
        case AuditEventKind::AlertFailed:
            return "ALERT_FAILED";
        case AuditEventKind::AlertAccepted:
            return "ALERT_ACCEPTED";
        case AuditEventKind::AlertDeclined:
            return "ALERT_DECLINED";
        case AuditEventKind::AlertExpired:
            return "ALERT_EXPIRED";
        case AuditEventKind::GuardAssigned:
            return "GUARD_ASSIGNED";
        case AuditEventKind::GuardUnassigned:
            return "GUARD_UNASSIGNED";
        case AuditEventKind::IncidentResolved:
            return "INCIDENT_RESOLVED";
        case AuditEventKind::AllGuardsExhausted:
            return "ALL_GUARDS_EXHAUSTED";
    }
    return "UNKNOWN";
}

void AuditLog::record(const AuditEvent& event) {
    std::scoped_lock lock(mutex_);
    list_events_.push_back(event);
}

std::vector<AuditEvent> AuditLog::events_for(IncidentId incident_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<AuditEvent> list_matching;
    std::copy_if(list_events_.begin(), list_events_.end(), std::back_inserter(list_matching), [incident_id](const AuditEvent& event) {
        return event.incident_id == incident_id;
    });
    return list_matching;
}

std::vector<AuditEvent> AuditLog::events() const {
    std::scoped_lock lock(mutex_);
    return list_events_;
}

std::size_t AuditLog::count(AuditEventKind kind) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(list_events_.begin(), list_events_.end(), [kind](const AuditEvent& event) {
        return event.kind == kind;
    }));
}

std::size_t AuditLog::count(IncidentId incident_id, AuditEventKind kind) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(list_events_.begin(), list_events_.end(), [incident_id, kind](const AuditEvent& event) {
        return event.incident_id == incident_id && event.kind == kind;
    }));
}

}  // namespace campus_dispatch
