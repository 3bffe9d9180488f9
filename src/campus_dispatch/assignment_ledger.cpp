#include "campus_dispatch/assignment_ledger.hpp"

#include <algorithm>
#include <string>

#include "campus_dispatch/errors.hpp"

namespace campus_dispatch {

GuardAssignment AssignmentLedger::activate(IncidentId incident_id, const GuardId& guard_id) {
    std::scoped_lock lock(mutex_);

    const auto iterator_incident = map_active_by_incident_.find(incident_id);
    if (iterator_incident != map_active_by_incident_.end()) {
        const GuardAssignment& current = map_assignments_.at(iterator_incident->second);
        if (current.guard_id == guard_id) {
            return current;
        }
        throw IntegrityViolation(
            IntegrityConstraint::ActiveAssignmentPerIncident,
            "Incident " + std::to_string(incident_id) + " already assigned to " + current.guard_id
        );
    }
    return activate_locked(incident_id, guard_id);
}

Reassignment AssignmentLedger::reassign(IncidentId incident_id, const GuardId& guard_id) {
    std::scoped_lock lock(mutex_);

    Reassignment reassignment{};
    const auto iterator_incident = map_active_by_incident_.find(incident_id);
    if (iterator_incident != map_active_by_incident_.end()) {
        const GuardAssignment& current = map_assignments_.at(iterator_incident->second);
        if (current.guard_id == guard_id) {
            reassignment.assignment = current;
            return reassignment;
        }
    }
    // Checked before releasing so a failed hand-over keeps the current guard.
    const auto iterator_guard = map_active_by_guard_.find(guard_id);
    if (iterator_guard != map_active_by_guard_.end()) {
        throw IntegrityViolation(
            IntegrityConstraint::ActiveAssignmentPerGuard,
            "Guard " + guard_id + " already assigned to incident "
                + std::to_string(map_assignments_.at(iterator_guard->second).incident_id)
        );
    }
    if (iterator_incident != map_active_by_incident_.end()) {
        reassignment.released = release_locked(iterator_incident->second);
    }
    reassignment.assignment = activate_locked(incident_id, guard_id);
    return reassignment;
}

std::optional<GuardAssignment> AssignmentLedger::release_for_incident(IncidentId incident_id) {
    std::scoped_lock lock(mutex_);
    const auto iterator_incident = map_active_by_incident_.find(incident_id);
    if (iterator_incident == map_active_by_incident_.end()) {
        return std::nullopt;
    }
    return release_locked(iterator_incident->second);
}

std::optional<GuardAssignment> AssignmentLedger::active_for_incident(IncidentId incident_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_incident = map_active_by_incident_.find(incident_id);
    if (iterator_incident == map_active_by_incident_.end()) {
        return std::nullopt;
    }
    return map_assignments_.at(iterator_incident->second);
}

std::optional<GuardAssignment> AssignmentLedger::active_for_guard(const GuardId& guard_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_guard = map_active_by_guard_.find(guard_id);
    if (iterator_guard == map_active_by_guard_.end()) {
        return std::nullopt;
    }
    return map_assignments_.at(iterator_guard->second);
}

std::set<GuardId> AssignmentLedger::committed_guards() const {
    std::scoped_lock lock(mutex_);
    std::set<GuardId> set_guards;
    for (const auto& [guard_id, assignment_id] : map_active_by_guard_) {
        set_guards.insert(guard_id);
    }
    return set_guards;
}

std::vector<GuardAssignment> AssignmentLedger::history_for(IncidentId incident_id) const {
    std::scoped_lock lock(mutex_);
    std::vector<GuardAssignment> list_history;
    for (const auto& [assignment_id, assignment] : map_assignments_) {
        if (assignment.incident_id == incident_id) {
            list_history.push_back(assignment);
        }
    }
    return list_history;
}

std::size_t AssignmentLedger::active_count() const {
    std::scoped_lock lock(mutex_);
    return map_active_by_incident_.size();
}

GuardAssignment AssignmentLedger::activate_locked(IncidentId incident_id, const GuardId& guard_id) {
    const auto iterator_guard = map_active_by_guard_.find(guard_id);
    if (iterator_guard != map_active_by_guard_.end()) {
        throw IntegrityViolation(
            IntegrityConstraint::ActiveAssignmentPerGuard,
            "Guard " + guard_id + " already assigned to incident "
                + std::to_string(map_assignments_.at(iterator_guard->second).incident_id)
        );
    }

    const auto iterator_reusable = std::find_if(map_assignments_.begin(), map_assignments_.end(), [&](const auto& entry) {
        return entry.second.incident_id == incident_id && entry.second.guard_id == guard_id;
    });
    GuardAssignment* assignment = nullptr;
    if (iterator_reusable != map_assignments_.end()) {
        assignment = &iterator_reusable->second;
    } else {
        const AssignmentId assignment_id = next_assignment_id_++;
        assignment = &map_assignments_[assignment_id];
        assignment->identifier = assignment_id;
        assignment->incident_id = incident_id;
        assignment->guard_id = guard_id;
    }
    assignment->is_active = true;
    assignment->assigned_at = SteadyClock::now();
    assignment->released_at.reset();

    map_active_by_incident_[incident_id] = assignment->identifier;
    map_active_by_guard_[guard_id] = assignment->identifier;
    return *assignment;
}

GuardAssignment AssignmentLedger::release_locked(AssignmentId assignment_id) {
    GuardAssignment& assignment = map_assignments_.at(assignment_id);
    assignment.is_active = false;
    assignment.released_at = SteadyClock::now();
    map_active_by_guard_.erase(assignment.guard_id);
    map_active_by_incident_.erase(assignment.incident_id);
    return assignment;
}

}  // namespace campus_dispatch
