// === Assignment Ledger =======================================================
//
// Guard-to-incident bindings. Both uniqueness rules (one active assignment per
// incident, one per guard) are checked and written under a single lock, so two
// racing accepts can never both commit. Records are deactivated, never erased.

#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Binding of one guard to one incident. */
struct GuardAssignment final {
    AssignmentId identifier{};
    IncidentId incident_id{};
    GuardId guard_id{};
    bool is_active{};
    TimePoint assigned_at{};
    std::optional<TimePoint> released_at{};
};

/** @brief Result of an atomic hand-over from one guard to another. */
struct Reassignment final {
    GuardAssignment assignment{};
    std::optional<GuardAssignment> released{};  /**< Binding that was deactivated, if any. */
};

class AssignmentLedger final {
  public:
    /**
     * @brief Activate a binding for (@p incident_id, @p guard_id).
     *
     * Reuses an inactive record for the same pair when one exists. An already
     * active binding of the same pair is returned unchanged.
     *
     * @throws IntegrityViolation when the incident is bound to another guard or
     *         the guard is bound to another incident.
     */
    GuardAssignment activate(IncidentId incident_id, const GuardId& guard_id);
    /**
     * @brief Replace the incident's active binding with one for @p guard_id.
     *
     * @throws IntegrityViolation when @p guard_id is bound to another incident;
     *         the current binding is left untouched in that case.
     */
    Reassignment reassign(IncidentId incident_id, const GuardId& guard_id);
    /** @brief Deactivate the incident's active binding, if any, and return it. */
    std::optional<GuardAssignment> release_for_incident(IncidentId incident_id);

    [[nodiscard]] std::optional<GuardAssignment> active_for_incident(IncidentId incident_id) const;
    [[nodiscard]] std::optional<GuardAssignment> active_for_guard(const GuardId& guard_id) const;
    /** @brief Guards currently holding an active binding. */
    [[nodiscard]] std::set<GuardId> committed_guards() const;
    /** @brief Every binding ever made for @p incident_id, oldest first. */
    [[nodiscard]] std::vector<GuardAssignment> history_for(IncidentId incident_id) const;
    [[nodiscard]] std::size_t active_count() const;

  private:
    GuardAssignment activate_locked(IncidentId incident_id, const GuardId& guard_id);
    GuardAssignment release_locked(AssignmentId assignment_id);

    std::atomic<AssignmentId> next_assignment_id_{1};

    mutable std::mutex mutex_;
    std::map<AssignmentId, GuardAssignment> map_assignments_;
    std::map<IncidentId, AssignmentId> map_active_by_incident_;
    std::map<GuardId, AssignmentId> map_active_by_guard_;
};

}  // namespace campus_dispatch
