// === Alert Lifecycle =========================================================
//
// Lock order: incident lock, then the store/ledger/alert-table mutexes, each
// held only for the duration of one call. Alert ids are resolved to their
// incident before the incident lock is taken and re-read once it is held.

#include "campus_dispatch/alert_lifecycle.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "campus_dispatch/errors.hpp"

namespace campus_dispatch {

namespace {
constexpr std::string_view k_alert_title{"Incoming Alert"};
constexpr std::string_view k_assignment_title{"Assignment Confirmed"};
}  // namespace

std::string_view to_string(AlertOutcome outcome) noexcept {
    switch (outcome) {
        case AlertOutcome::Accepted:
            return "ACCEPTED";
        case AlertOutcome::Declined:
            return "DECLINED";
        case AlertOutcome::Expired:
            return "EXPIRED";
        case AlertOutcome::AlreadyAssigned:
            return "ALREADY_ASSIGNED";
        case AlertOutcome::StaleOrTerminal:
            return "STALE_OR_TERMINAL";
    }
    return "UNKNOWN";
}

AlertLifecycleManager::AlertLifecycleManager(
    AlertPolicy policy,
    const BeaconGraph& beacon_graph,
    IncidentStore& incident_store,
    const GuardRegistry& guard_registry,
    AssignmentLedger& assignment_ledger,
    const DispatchSearch& dispatch_search,
    Notifier& notifier,
    AuditSink& audit_sink
)
    : policy_(policy),
      beacon_graph_(beacon_graph),
      incident_store_(incident_store),
      guard_registry_(guard_registry),
      assignment_ledger_(assignment_ledger),
      dispatch_search_(dispatch_search),
      notifier_(notifier),
      audit_sink_(audit_sink),
      logger_(get_logger("alerts")) {
    if (policy_.max_guards == 0) {
        throw std::invalid_argument("Alert policy max_guards must be positive");
    }
    if (!std::isfinite(policy_.response_deadline.count()) || policy_.response_deadline.count() <= 0.0) {
        throw std::invalid_argument("Alert policy response_deadline must be positive and finite");
    }
}

DispatchBatch AlertLifecycleManager::dispatch_initial_alerts(IncidentId incident_id, std::optional<std::size_t> max_guards) {
    Outbox outbox;
    DispatchBatch batch{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        const Incident incident = incident_store_.incident(incident_id);
        batch = dispatch_locked(incident, max_guards.value_or(policy_.max_guards), outbox);
    }
    deliver(outbox);
    return batch;
}

AlertResult AlertLifecycleManager::accept(AlertId alert_id, const GuardId& guard_id) {
    const IncidentId incident_id = alert(alert_id).incident_id;
    Outbox outbox;
    AlertResult result{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        result.alert = alert(alert_id);
        if (result.alert.guard_id != guard_id) {
            throw GuardMismatch("Alert " + std::to_string(alert_id) + " is not addressed to guard " + guard_id);
        }

        const std::optional<GuardAssignment> active = assignment_ledger_.active_for_incident(incident_id);
        const bool held_by_rival = active.has_value() && active->guard_id != guard_id;
        if (result.alert.status != AlertStatus::Sent) {
            result.outcome = (result.alert.status == AlertStatus::Expired && held_by_rival) ? AlertOutcome::AlreadyAssigned
                                                                                            : AlertOutcome::StaleOrTerminal;
            logger_->info(
                R"({{"action":"accept","alert":{},"guard":"{}","status":"{}","outcome":"{}"}})",
                alert_id,
                guard_id,
                to_string(result.alert.status),
                to_string(result.outcome)
            );
            return result;
        }
        if (held_by_rival) {
            result.alert = expire_alert_locked(alert_id, "already_assigned");
            result.outcome = AlertOutcome::AlreadyAssigned;
            return result;
        }

        try {
            result.assignment = assignment_ledger_.activate(incident_id, guard_id);
        } catch (const IntegrityViolation& exc) {
            // The guard committed to another incident since the alert went out.
            logger_->warn(
                R"({{"action":"accept","alert":{},"guard":"{}","error":{}}})",
                alert_id,
                guard_id,
                json_quote(exc.what())
            );
            result.alert = expire_alert_locked(alert_id, "guard_busy");
            result.outcome = AlertOutcome::AlreadyAssigned;
            escalate_locked(incident_id, outbox, result);
        }

        if (result.assignment.has_value()) {
            const GuardAssignment& assignment = result.assignment.value();
            result.alert = update_alert(alert_id, AlertStatus::Accepted, assignment.identifier);
            const Incident incident = incident_store_.mark_assigned(incident_id, guard_id);
            audit_sink_.record(AuditEvent{
                AuditEventKind::AlertAccepted,
                incident_id,
                guard_id,
                alert_id,
                fmt::format(R"({{"rank":{}}})", result.alert.priority_rank)
            });
            const std::size_t stood_down = expire_pending_locked(incident_id, "stood_down");
            audit_sink_.record(AuditEvent{
                AuditEventKind::GuardAssigned,
                incident_id,
                guard_id,
                alert_id,
                fmt::format(R"({{"assignment":{},"manual":false}})", assignment.identifier)
            });
            notify_assignment(incident, assignment, outbox);
            result.outcome = AlertOutcome::Accepted;
            logger_->info(
                R"({{"action":"accept","alert":{},"incident":{},"guard":"{}","assignment":{},"stood_down":{}}})",
                alert_id,
                incident_id,
                guard_id,
                assignment.identifier,
                stood_down
            );
        }
    }
    deliver(outbox);
    return result;
}

AlertResult AlertLifecycleManager::decline(AlertId alert_id, const GuardId& guard_id) {
    const IncidentId incident_id = alert(alert_id).incident_id;
    Outbox outbox;
    AlertResult result{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        result.alert = alert(alert_id);
        if (result.alert.guard_id != guard_id) {
            throw GuardMismatch("Alert " + std::to_string(alert_id) + " is not addressed to guard " + guard_id);
        }
        if (result.alert.status != AlertStatus::Sent) {
            result.outcome = AlertOutcome::StaleOrTerminal;
            return result;
        }

        result.alert = update_alert(alert_id, AlertStatus::Declined);
        incident_store_.record_alert_declined(incident_id);
        audit_sink_.record(AuditEvent{
            AuditEventKind::AlertDeclined,
            incident_id,
            guard_id,
            alert_id,
            fmt::format(R"({{"rank":{}}})", result.alert.priority_rank)
        });
        logger_->info(
            R"({{"action":"decline","alert":{},"incident":{},"guard":"{}","rank":{}}})",
            alert_id,
            incident_id,
            guard_id,
            result.alert.priority_rank
        );
        result.outcome = AlertOutcome::Declined;
        escalate_locked(incident_id, outbox, result);
    }
    deliver(outbox);
    return result;
}

AlertResult AlertLifecycleManager::expire(AlertId alert_id) {
    const IncidentId incident_id = alert(alert_id).incident_id;
    Outbox outbox;
    AlertResult result{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        result.alert = alert(alert_id);
        if (is_terminal(result.alert.status)) {
            result.outcome = AlertOutcome::StaleOrTerminal;
            return result;
        }
        result.alert = expire_alert_locked(alert_id, "deadline");
        result.outcome = AlertOutcome::Expired;
        escalate_locked(incident_id, outbox, result);
    }
    deliver(outbox);
    return result;
}

EscalationSummary AlertLifecycleManager::expire_due_alerts(TimePoint now) {
    std::vector<AlertId> list_overdue;
    {
        std::scoped_lock lock(alerts_mutex_);
        for (const auto& [alert_id, guard_alert] : map_alerts_) {
            if (guard_alert.status == AlertStatus::Sent && guard_alert.response_deadline.has_value()
                && guard_alert.response_deadline.value() < now) {
                list_overdue.push_back(alert_id);
            }
        }
    }

    EscalationSummary summary{};
    for (const AlertId alert_id : list_overdue) {
        try {
            const AlertResult result = expire(alert_id);
            if (result.outcome == AlertOutcome::Expired) {
                ++summary.expired;
            }
            if (result.escalated_alert.has_value()) {
                ++summary.escalated;
            }
        } catch (const std::exception& exc) {
            ++summary.failed;
            logger_->error(R"({{"action":"expire_due","alert":{},"error":{}}})", alert_id, json_quote(exc.what()));
        }
    }
    if (!list_overdue.empty()) {
        logger_->info(
            R"({{"action":"expire_due","overdue":{},"expired":{},"escalated":{},"failed":{}}})",
            list_overdue.size(),
            summary.expired,
            summary.escalated,
            summary.failed
        );
    }
    return summary;
}

GuardAssignment AlertLifecycleManager::assign_manually(IncidentId incident_id, const GuardId& guard_id) {
    const GuardProfile profile = guard_registry_.guard(guard_id);
    if (!profile.is_on_duty || !profile.account_active) {
        throw GuardUnavailable("Guard " + guard_id + " is off duty or disabled");
    }

    Outbox outbox;
    Reassignment reassignment{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        const Incident current = incident_store_.incident(incident_id);
        if (!is_open(current.status)) {
            throw InvalidStatusTransition(current.status, IncidentStatus::Assigned);
        }
        const std::optional<GuardAssignment> active = assignment_ledger_.active_for_incident(incident_id);
        if (active.has_value() && active->guard_id == guard_id) {
            return active.value();
        }

        try {
            reassignment = assignment_ledger_.reassign(incident_id, guard_id);
        } catch (const IntegrityViolation& exc) {
            throw GuardUnavailable(exc.what());
        }
        if (reassignment.released.has_value()) {
            audit_sink_.record(AuditEvent{
                AuditEventKind::GuardUnassigned,
                incident_id,
                reassignment.released->guard_id,
                std::nullopt,
                R"({"reason":"reassigned"})"
            });
        }
        expire_pending_locked(incident_id, "manual_assignment");
        const Incident incident = incident_store_.mark_assigned(incident_id, guard_id);
        audit_sink_.record(AuditEvent{
            AuditEventKind::GuardAssigned,
            incident_id,
            guard_id,
            std::nullopt,
            fmt::format(R"({{"assignment":{},"manual":true}})", reassignment.assignment.identifier)
        });
        notify_assignment(incident, reassignment.assignment, outbox);
        logger_->info(
            R"({{"action":"assign_manually","incident":{},"guard":"{}","replaced":"{}"}})",
            incident_id,
            guard_id,
            reassignment.released.has_value() ? reassignment.released->guard_id : std::string{}
        );
    }
    deliver(outbox);
    return reassignment.assignment;
}

DispatchBatch AlertLifecycleManager::unassign(IncidentId incident_id) {
    Outbox outbox;
    DispatchBatch batch{};
    {
        auto incident_lock = incident_locks_.lock(incident_id);
        const Incident current = incident_store_.incident(incident_id);
        const std::optional<GuardAssignment> released = assignment_ledger_.release_for_incident(incident_id);
        if (!released.has_value()) {
            throw InvalidStatusTransition("Incident " + std::to_string(incident_id) + " has no assigned guard");
        }
        audit_sink_.record(AuditEvent{
            AuditEventKind::GuardUnassigned,
            incident_id,
            released->guard_id,
            std::nullopt,
            R"({"reason":"unassigned"})"
        });
        const Incident incident = incident_store_.mark_unassigned(current.identifier);
        logger_->info(
            R"({{"action":"unassign","incident":{},"guard":"{}"}})",
            incident_id,
            released->guard_id
        );
        batch = dispatch_locked(incident, policy_.max_guards, outbox);
    }
    deliver(outbox);
    return batch;
}

Incident AlertLifecycleManager::resolve_incident(IncidentId incident_id, const std::string& resolved_by, const std::string& notes) {
    if (notes.empty()) {
        throw MissingResolutionNotes(incident_id);
    }
    auto incident_lock = incident_locks_.lock(incident_id);
    const Incident incident = incident_store_.mark_resolved(incident_id, resolved_by, notes);
    const std::optional<GuardAssignment> released = assignment_ledger_.release_for_incident(incident_id);
    if (released.has_value()) {
        audit_sink_.record(AuditEvent{
            AuditEventKind::GuardUnassigned,
            incident_id,
            released->guard_id,
            std::nullopt,
            R"({"reason":"resolved"})"
        });
    }
    const std::size_t stood_down = expire_pending_locked(incident_id, "resolved");
    logger_->info(
        R"({{"action":"resolve","incident":{},"resolved_by":{},"stood_down":{}}})",
        incident_id,
        json_quote(resolved_by),
        stood_down
    );
    return incident;
}

Incident AlertLifecycleManager::start_response(IncidentId incident_id, const GuardId& guard_id) {
    auto incident_lock = incident_locks_.lock(incident_id);
    const std::optional<GuardAssignment> active = assignment_ledger_.active_for_incident(incident_id);
    if (!active.has_value() || active->guard_id != guard_id) {
        throw GuardMismatch("Guard " + guard_id + " is not assigned to incident " + std::to_string(incident_id));
    }
    return incident_store_.mark_in_progress(incident_id);
}

GuardAlert AlertLifecycleManager::alert(AlertId alert_id) const {
    std::scoped_lock lock(alerts_mutex_);
    const auto iterator_alert = map_alerts_.find(alert_id);
    if (iterator_alert == map_alerts_.end()) {
        throw UnknownAlert(alert_id);
    }
    return iterator_alert->second;
}

std::vector<GuardAlert> AlertLifecycleManager::alerts_for(IncidentId incident_id) const {
    std::scoped_lock lock(alerts_mutex_);
    std::vector<GuardAlert> list_alerts;
    const auto iterator_ids = map_alerts_by_incident_.find(incident_id);
    if (iterator_ids == map_alerts_by_incident_.end()) {
        return list_alerts;
    }
    list_alerts.reserve(iterator_ids->second.size());
    for (const AlertId alert_id : iterator_ids->second) {
        list_alerts.push_back(map_alerts_.at(alert_id));
    }
    return list_alerts;
}

const AlertPolicy& AlertLifecycleManager::policy() const noexcept {
    return policy_;
}

DispatchBatch AlertLifecycleManager::dispatch_locked(const Incident& incident, std::size_t max_guards, Outbox& outbox) {
    DispatchBatch batch{};
    if (!is_open(incident.status) || assignment_ledger_.active_for_incident(incident.identifier).has_value()) {
        batch.skipped = true;
        logger_->info(
            R"({{"action":"dispatch","incident":{},"skipped":"{}"}})",
            incident.identifier,
            to_string(incident.status)
        );
        return batch;
    }

    const std::vector<GuardCandidate> list_candidates =
        dispatch_search_.find_candidate_guards(incident.beacon_id, max_guards, alerted_guards(incident.identifier));
    std::uint32_t next_rank = max_rank(incident.identifier) + 1;
    for (const GuardCandidate& candidate : list_candidates) {
        batch.alerts.push_back(create_alert_locked(incident, candidate, next_rank++, outbox));
    }

    if (batch.alerts.empty()) {
        batch.no_candidate_guards = true;
        audit_sink_.record(AuditEvent{
            AuditEventKind::AllGuardsExhausted,
            incident.identifier,
            std::nullopt,
            std::nullopt,
            fmt::format(R"({{"beacon":{},"stage":"initial"}})", json_quote(incident.beacon_id))
        });
        logger_->warn(
            R"({{"action":"dispatch","incident":{},"beacon":"{}","error":"no_candidate_guards"}})",
            incident.identifier,
            incident.beacon_id
        );
        return batch;
    }

    incident_store_.record_alerts_sent(incident.identifier, static_cast<std::uint32_t>(batch.alerts.size()));
    logger_->info(
        R"({{"action":"dispatch","incident":{},"alerts":{},"first_rank":{}}})",
        incident.identifier,
        batch.alerts.size(),
        batch.alerts.front().priority_rank
    );
    return batch;
}

void AlertLifecycleManager::escalate_locked(IncidentId incident_id, Outbox& outbox, AlertResult& result) {
    const Incident incident = incident_store_.incident(incident_id);
    if (!is_open(incident.status) || assignment_ledger_.active_for_incident(incident_id).has_value()) {
        return;
    }

    // The search restarts from the incident beacon; exclusion keeps it from re-alerting anyone.
    const std::vector<GuardCandidate> list_candidates =
        dispatch_search_.find_candidate_guards(incident.beacon_id, 1, alerted_guards(incident_id));
    if (!list_candidates.empty()) {
        result.escalated_alert = create_alert_locked(incident, list_candidates.front(), max_rank(incident_id) + 1, outbox);
        incident_store_.record_alerts_sent(incident_id, 1);
        logger_->info(
            R"({{"action":"escalate","incident":{},"guard":"{}","rank":{},"via":"{}"}})",
            incident_id,
            result.escalated_alert->guard_id,
            result.escalated_alert->priority_rank,
            result.escalated_alert->via_beacon
        );
        return;
    }

    result.no_candidate_guards = true;
    const std::size_t pending = pending_count(incident_id);
    if (pending == 0) {
        audit_sink_.record(AuditEvent{
            AuditEventKind::AllGuardsExhausted,
            incident_id,
            std::nullopt,
            std::nullopt,
            fmt::format(R"({{"beacon":{},"stage":"escalation"}})", json_quote(incident.beacon_id))
        });
    }
    logger_->warn(
        R"({{"action":"escalate","incident":{},"error":"no_candidate_guards","pending":{}}})",
        incident_id,
        pending
    );
}

GuardAlert AlertLifecycleManager::create_alert_locked(
    const Incident& incident,
    const GuardCandidate& candidate,
    std::uint32_t priority_rank,
    Outbox& outbox
) {
    const TimePoint now = SteadyClock::now();
    GuardAlert guard_alert{};
    guard_alert.identifier = next_alert_id_++;
    guard_alert.incident_id = incident.identifier;
    guard_alert.guard_id = candidate.guard_id;
    guard_alert.status = AlertStatus::Sent;
    guard_alert.priority_rank = priority_rank;
    guard_alert.sent_at = now;
    guard_alert.response_deadline = now + std::chrono::duration_cast<SteadyClock::duration>(policy_.response_deadline);
    guard_alert.via_beacon = candidate.via_beacon;
    guard_alert.hop_priority = candidate.hop_priority;
    {
        std::scoped_lock lock(alerts_mutex_);
        map_alerts_.emplace(guard_alert.identifier, guard_alert);
        map_alerts_by_incident_[incident.identifier].push_back(guard_alert.identifier);
    }

    audit_sink_.record(AuditEvent{
        AuditEventKind::AlertSent,
        incident.identifier,
        guard_alert.guard_id,
        guard_alert.identifier,
        fmt::format(
            R"({{"rank":{},"via":{},"hop_priority":{},"hops":{}}})",
            priority_rank,
            json_quote(candidate.via_beacon),
            candidate.hop_priority,
            candidate.route.size() - 1
        )
    });

    Notification notification{};
    notification.guard_id = guard_alert.guard_id;
    notification.kind = NotificationKind::GuardAlert;
    notification.incident_id = incident.identifier;
    notification.alert_id = guard_alert.identifier;
    notification.title = std::string{k_alert_title};
    notification.body = fmt::format("{} priority incident at {}", to_string(incident.priority), location_name(incident.beacon_id));
    outbox.push_back(std::move(notification));
    return guard_alert;
}

GuardAlert AlertLifecycleManager::update_alert(AlertId alert_id, AlertStatus status, std::optional<AssignmentId> assignment_id) {
    std::scoped_lock lock(alerts_mutex_);
    GuardAlert& guard_alert = map_alerts_.at(alert_id);
    guard_alert.status = status;
    if (assignment_id.has_value()) {
        guard_alert.assignment_id = assignment_id;
    }
    return guard_alert;
}

GuardAlert AlertLifecycleManager::expire_alert_locked(AlertId alert_id, std::string_view reason) {
    const GuardAlert guard_alert = update_alert(alert_id, AlertStatus::Expired);
    audit_sink_.record(AuditEvent{
        AuditEventKind::AlertExpired,
        guard_alert.incident_id,
        guard_alert.guard_id,
        alert_id,
        fmt::format(R"({{"rank":{},"reason":{}}})", guard_alert.priority_rank, json_quote(reason))
    });
    logger_->info(
        R"({{"action":"expire","alert":{},"incident":{},"guard":"{}","reason":"{}"}})",
        alert_id,
        guard_alert.incident_id,
        guard_alert.guard_id,
        reason
    );
    return guard_alert;
}

std::size_t AlertLifecycleManager::expire_pending_locked(IncidentId incident_id, std::string_view reason) {
    std::size_t expired_count = 0;
    for (const GuardAlert& guard_alert : alerts_for(incident_id)) {
        if (guard_alert.status == AlertStatus::Sent) {
            expire_alert_locked(guard_alert.identifier, reason);
            ++expired_count;
        }
    }
    return expired_count;
}

std::set<GuardId> AlertLifecycleManager::alerted_guards(IncidentId incident_id) const {
    std::set<GuardId> set_guards;
    for (const GuardAlert& guard_alert : alerts_for(incident_id)) {
        set_guards.insert(guard_alert.guard_id);
    }
    return set_guards;
}

std::uint32_t AlertLifecycleManager::max_rank(IncidentId incident_id) const {
    std::uint32_t highest_rank = 0;
    for (const GuardAlert& guard_alert : alerts_for(incident_id)) {
        highest_rank = std::max(highest_rank, guard_alert.priority_rank);
    }
    return highest_rank;
}

std::size_t AlertLifecycleManager::pending_count(IncidentId incident_id) const {
    const std::vector<GuardAlert> list_alerts = alerts_for(incident_id);
    return static_cast<std::size_t>(std::count_if(list_alerts.begin(), list_alerts.end(), [](const GuardAlert& guard_alert) {
        return guard_alert.status == AlertStatus::Sent;
    }));
}

std::string AlertLifecycleManager::location_name(const BeaconId& beacon_id) const {
    const GraphSnapshotPtr graph = beacon_graph_.snapshot();
    const Beacon* beacon = graph->find_beacon(beacon_id);
    if (beacon == nullptr || beacon->location_name.empty()) {
        return beacon_id;
    }
    return beacon->location_name;
}

void AlertLifecycleManager::notify_assignment(const Incident& incident, const GuardAssignment& assignment, Outbox& outbox) const {
    Notification notification{};
    notification.guard_id = assignment.guard_id;
    notification.kind = NotificationKind::AssignmentConfirmed;
    notification.incident_id = incident.identifier;
    notification.title = std::string{k_assignment_title};
    notification.body = fmt::format("You are assigned to incident {} at {}", incident.identifier, location_name(incident.beacon_id));
    outbox.push_back(std::move(notification));
}

void AlertLifecycleManager::deliver(const Outbox& outbox) {
    for (const Notification& notification : outbox) {
        std::string failure;
        try {
            notifier_.notify(notification);
            continue;
        } catch (const NotificationDeliveryFailure& exc) {
            failure = exc.what();
        } catch (const std::exception& exc) {
            failure = std::string{"unexpected: "} + exc.what();
        }
        logger_->warn(
            R"({{"action":"notify","guard":"{}","type":"{}","incident":{},"error":{}}})",
            notification.guard_id,
            to_string(notification.kind),
            notification.incident_id,
            json_quote(failure)
        );
        audit_sink_.record(AuditEvent{
            AuditEventKind::AlertFailed,
            notification.incident_id,
            notification.guard_id,
            notification.alert_id,
            fmt::format(R"({{"type":"{}","error":{}}})", to_string(notification.kind), json_quote(failure))
        });
    }
}

}  // namespace campus_dispatch
