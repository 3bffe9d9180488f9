// === Incident Store ==========================================================
//
// Dedup follows the classic "select for update, then insert under a unique
// constraint" shape:
// - The beacon lock serializes every decision for one beacon, so a second
//   signal always observes the incident opened by the first.
// - map_open_by_beacon_ is the unique constraint. A create that finds the slot
//   taken raises IntegrityViolation, and resolve_or_create() retries once as a
//   merge instead of surfacing a duplicate.
// - Signals are immutable once stored; incidents are never erased, only moved
//   to Resolved, which releases the beacon slot.

#include "campus_dispatch/incident_store.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

#include "campus_dispatch/errors.hpp"

namespace campus_dispatch {

bool is_valid_transition(IncidentStatus from, IncidentStatus to) noexcept {
    switch (from) {
        case IncidentStatus::Created:
            return to == IncidentStatus::Assigned || to == IncidentStatus::Resolved;
        case IncidentStatus::Assigned:
            return to == IncidentStatus::Assigned || to == IncidentStatus::InProgress || to == IncidentStatus::Resolved
                || to == IncidentStatus::Created;
        case IncidentStatus::InProgress:
            return to == IncidentStatus::Assigned || to == IncidentStatus::Resolved || to == IncidentStatus::Created;
        case IncidentStatus::Resolved:
            return false;
    }
    return false;
}

IncidentStore::IncidentStore(const BeaconGraph& beacon_graph, AuditSink& audit_sink)
    : beacon_graph_(beacon_graph),
      audit_sink_(audit_sink),
      logger_(get_logger("dedup")) {}

ResolveOutcome IncidentStore::resolve_or_create(const SignalRequest& request) {
    auto beacon_lock = lock_beacon(request.beacon_id);
    // Retire and deactivate take the same lock, so the beacon cannot vanish
    // between this check and the insert.
    if (!beacon_graph_.snapshot()->is_active_beacon(request.beacon_id)) {
        logger_->warn(R"({{"beacon":"{}","error":"unknown_or_inactive_beacon"}})", request.beacon_id);
        throw UnknownOrInactiveBeacon(request.beacon_id);
    }

    try {
        return merge_or_create(request);
    } catch (const IntegrityViolation& exc) {
        logger_->warn(
            R"({{"beacon":"{}","action":"retry_as_merge","error":{}}})",
            request.beacon_id,
            json_quote(exc.what())
        );
    }
    return merge_or_create(request);
}

std::unique_lock<std::mutex> IncidentStore::lock_beacon(const BeaconId& beacon_id) {
    return beacon_locks_.lock(beacon_id);
}

ResolveOutcome IncidentStore::merge_or_create(const SignalRequest& request) {
    const TimePoint now = SteadyClock::now();
    const IncidentPriority signal_priority = priority_for_signal(request.type);

    IncidentSignal signal{};
    signal.type = request.type;
    signal.source = request.actor;
    signal.details = request.details;
    signal.received_at = now;

    {
        std::scoped_lock lock(mutex_);
        const auto iterator_open = map_open_by_beacon_.find(request.beacon_id);
        if (iterator_open != map_open_by_beacon_.end()) {
            Incident& incident = require_incident_locked(iterator_open->second);
            signal.identifier = next_signal_id_++;
            signal.incident_id = incident.identifier;
            map_signals_.emplace(signal.identifier, signal);
            incident.signal_ids.push_back(signal.identifier);
            incident.last_signal_time = now;

            const IncidentPriority previous_priority = incident.priority;
            if (static_cast<int>(signal_priority) > static_cast<int>(previous_priority)) {
                incident.priority = signal_priority;
                audit_sink_.record(AuditEvent{
                    AuditEventKind::PriorityChanged,
                    incident.identifier,
                    std::nullopt,
                    std::nullopt,
                    fmt::format(R"({{"previous":"{}","new":"{}"}})", to_string(previous_priority), to_string(signal_priority))
                });
            }
            audit_sink_.record(AuditEvent{
                AuditEventKind::SignalMerged,
                incident.identifier,
                std::nullopt,
                std::nullopt,
                fmt::format(R"({{"signal":{},"type":"{}","signals":{}}})", signal.identifier, to_string(signal.type), incident.signal_ids.size())
            });
            logger_->info(
                R"({{"action":"merge","incident":{},"beacon":"{}","signal":"{}","signals":{}}})",
                incident.identifier,
                incident.beacon_id,
                to_string(signal.type),
                incident.signal_ids.size()
            );
            return ResolveOutcome{incident, false, signal};
        }
    }

    Incident incident{};
    incident.identifier = next_incident_id_++;
    incident.beacon_id = request.beacon_id;
    incident.status = IncidentStatus::Created;
    incident.priority = signal_priority;
    incident.description = request.description;
    incident.first_signal_time = now;
    incident.last_signal_time = now;

    if (before_insert_hook_) {
        before_insert_hook_();
    }

    {
        std::scoped_lock lock(mutex_);
        if (!map_open_by_beacon_.emplace(request.beacon_id, incident.identifier).second) {
            throw IntegrityViolation(
                IntegrityConstraint::OpenIncidentPerBeacon,
                "Beacon " + request.beacon_id + " already has an open incident"
            );
        }
        signal.identifier = next_signal_id_++;
        signal.incident_id = incident.identifier;
        incident.signal_ids.push_back(signal.identifier);
        map_signals_.emplace(signal.identifier, signal);
        map_incidents_.emplace(incident.identifier, incident);
    }

    audit_sink_.record(AuditEvent{
        AuditEventKind::IncidentCreated,
        incident.identifier,
        std::nullopt,
        std::nullopt,
        fmt::format(R"({{"beacon":{},"signal":"{}","priority":"{}"}})", json_quote(incident.beacon_id), to_string(signal.type), to_string(incident.priority))
    });
    logger_->info(
        R"({{"action":"create","incident":{},"beacon":"{}","signal":"{}","priority":"{}"}})",
        incident.identifier,
        incident.beacon_id,
        to_string(signal.type),
        to_string(incident.priority)
    );
    return ResolveOutcome{incident, true, signal};
}

Incident IncidentStore::incident(IncidentId incident_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_incident = map_incidents_.find(incident_id);
    if (iterator_incident == map_incidents_.end()) {
        throw UnknownIncident(incident_id);
    }
    return iterator_incident->second;
}

std::optional<Incident> IncidentStore::open_incident_at(const BeaconId& beacon_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_open = map_open_by_beacon_.find(beacon_id);
    if (iterator_open == map_open_by_beacon_.end()) {
        return std::nullopt;
    }
    return map_incidents_.at(iterator_open->second);
}

std::vector<Incident> IncidentStore::incidents_at(const BeaconId& beacon_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<Incident> list_incidents;
    for (const auto& [incident_id, incident] : map_incidents_) {
        if (incident.beacon_id == beacon_id) {
            list_incidents.push_back(incident);
        }
    }
    return list_incidents;
}

bool IncidentStore::has_incidents_at(const BeaconId& beacon_id) const {
    std::scoped_lock lock(mutex_);
    return std::any_of(map_incidents_.begin(), map_incidents_.end(), [&beacon_id](const auto& entry) {
        return entry.second.beacon_id == beacon_id;
    });
}

std::vector<IncidentSignal> IncidentStore::signals_for(IncidentId incident_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_incident = map_incidents_.find(incident_id);
    if (iterator_incident == map_incidents_.end()) {
        throw UnknownIncident(incident_id);
    }
    std::vector<IncidentSignal> list_signals;
    list_signals.reserve(iterator_incident->second.signal_ids.size());
    for (const SignalId signal_id : iterator_incident->second.signal_ids) {
        list_signals.push_back(map_signals_.at(signal_id));
    }
    return list_signals;
}

std::size_t IncidentStore::incident_count() const {
    std::scoped_lock lock(mutex_);
    return map_incidents_.size();
}

Incident IncidentStore::mark_assigned(IncidentId incident_id, const GuardId& guard_id) {
    std::scoped_lock lock(mutex_);
    Incident& incident = require_incident_locked(incident_id);
    transition_locked(incident, IncidentStatus::Assigned);
    incident.assigned_guard = guard_id;
    incident.assigned_at = SteadyClock::now();
    return incident;
}

Incident IncidentStore::mark_in_progress(IncidentId incident_id) {
    std::scoped_lock lock(mutex_);
    Incident& incident = require_incident_locked(incident_id);
    return transition_locked(incident, IncidentStatus::InProgress);
}

Incident IncidentStore::mark_unassigned(IncidentId incident_id) {
    std::scoped_lock lock(mutex_);
    Incident& incident = require_incident_locked(incident_id);
    transition_locked(incident, IncidentStatus::Created);
    incident.assigned_guard.reset();
    incident.assigned_at.reset();
    return incident;
}

Incident IncidentStore::mark_resolved(IncidentId incident_id, const std::string& resolved_by, const std::string& notes) {
    std::scoped_lock lock(mutex_);
    Incident& incident = require_incident_locked(incident_id);
    transition_locked(incident, IncidentStatus::Resolved);
    incident.resolved_by = resolved_by;
    incident.resolved_at = SteadyClock::now();
    incident.resolution_notes = notes;

    const auto iterator_open = map_open_by_beacon_.find(incident.beacon_id);
    if (iterator_open != map_open_by_beacon_.end() && iterator_open->second == incident_id) {
        map_open_by_beacon_.erase(iterator_open);
    }

    audit_sink_.record(AuditEvent{
        AuditEventKind::IncidentResolved,
        incident_id,
        std::nullopt,
        std::nullopt,
        fmt::format(R"({{"resolved_by":{},"notes":{}}})", json_quote(resolved_by), json_quote(notes.substr(0, 200)))
    });
    return incident;
}

void IncidentStore::record_alerts_sent(IncidentId incident_id, std::uint32_t alert_count) {
    std::scoped_lock lock(mutex_);
    require_incident_locked(incident_id).total_alerts_sent += alert_count;
}

void IncidentStore::record_alert_declined(IncidentId incident_id) {
    std::scoped_lock lock(mutex_);
    ++require_incident_locked(incident_id).total_alerts_declined;
}

Incident& IncidentStore::require_incident_locked(IncidentId incident_id) {
    const auto iterator_incident = map_incidents_.find(incident_id);
    if (iterator_incident == map_incidents_.end()) {
        throw UnknownIncident(incident_id);
    }
    return iterator_incident->second;
}

Incident IncidentStore::transition_locked(Incident& incident, IncidentStatus target) {
    const IncidentStatus previous = incident.status;
    if (!is_valid_transition(previous, target)) {
        throw InvalidStatusTransition(previous, target);
    }
    incident.status = target;
    if (previous != target) {
        audit_sink_.record(AuditEvent{
            AuditEventKind::StatusChanged,
            incident.identifier,
            std::nullopt,
            std::nullopt,
            fmt::format(R"({{"previous":"{}","new":"{}"}})", to_string(previous), to_string(target))
        });
        logger_->info(
            R"({{"action":"transition","incident":{},"previous":"{}","status":"{}"}})",
            incident.identifier,
            to_string(previous),
            to_string(target)
        );
    }
    return incident;
}

}  // namespace campus_dispatch
