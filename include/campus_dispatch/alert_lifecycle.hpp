// === Alert Lifecycle =========================================================
//
// Per (incident, guard) alert state machine: SENT -> ACCEPTED | DECLINED |
// EXPIRED. Every transition for one incident runs under that incident's lock;
// notifications produced by a transition are queued and only pushed once the
// lock is released, and a failed push never rolls the transition back.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "campus_dispatch/assignment_ledger.hpp"
#include "campus_dispatch/audit_log.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/dispatch_search.hpp"
#include "campus_dispatch/guard_registry.hpp"
#include "campus_dispatch/incident_store.hpp"
#include "campus_dispatch/keyed_mutex.hpp"
#include "campus_dispatch/logging.hpp"
#include "campus_dispatch/notifier.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Request sent to one guard to respond to one incident. */
struct GuardAlert final {
    AlertId identifier{};
    IncidentId incident_id{};
    GuardId guard_id{};
    AlertStatus status{AlertStatus::Sent};
    std::uint32_t priority_rank{};                /**< 1 = first choice; grows with every alert on the incident. */
    TimePoint sent_at{};
    std::optional<TimePoint> response_deadline{};
    std::optional<AssignmentId> assignment_id{};  /**< Set once the alert is accepted. */
    BeaconId via_beacon{};                        /**< Beacon the guard was found at. */
    int hop_priority{};                           /**< Edge priority into via_beacon; 0 at the incident beacon. */
};

/** @brief Dispatch knobs passed in by the owner, never read from globals. */
struct AlertPolicy final {
    std::size_t max_guards{3};          /**< Size of the initial alert batch. */
    Duration response_deadline{45.0};   /**< Time a guard has to answer before the alert expires. */
};

enum class AlertOutcome {
    Accepted,
    Declined,
    Expired,
    AlreadyAssigned,  /**< Lost the accept race; the alert is now EXPIRED. */
    StaleOrTerminal   /**< The alert was no longer SENT; nothing changed. */
};

[[nodiscard]] std::string_view to_string(AlertOutcome outcome) noexcept;

/** @brief Outcome of accept/decline/expire on one alert. */
struct AlertResult final {
    AlertOutcome outcome{AlertOutcome::StaleOrTerminal};
    GuardAlert alert{};                          /**< Alert state after the call. */
    std::optional<GuardAssignment> assignment{}; /**< Set when the accept won. */
    std::optional<GuardAlert> escalated_alert{}; /**< Replacement alert created by escalation. */
    bool no_candidate_guards{};                  /**< Escalation ran and found nobody left to alert. */
};

/** @brief Alerts produced by one dispatch round. */
struct DispatchBatch final {
    std::vector<GuardAlert> alerts{};
    bool no_candidate_guards{};
    bool skipped{};  /**< Incident was already assigned or resolved; nothing was sent. */
};

/** @brief Counters from one pass over overdue alerts. */
struct EscalationSummary final {
    std::size_t expired{};
    std::size_t escalated{};
    std::size_t failed{};
};

class AlertLifecycleManager final {
  public:
    /** @throws std::invalid_argument when @p policy is unusable. */
    AlertLifecycleManager(
        AlertPolicy policy,
        const BeaconGraph& beacon_graph,
        IncidentStore& incident_store,
        const GuardRegistry& guard_registry,
        AssignmentLedger& assignment_ledger,
        const DispatchSearch& dispatch_search,
        Notifier& notifier,
        AuditSink& audit_sink
    );

    /**
     * @brief Alert the nearest not-yet-alerted guards for an unassigned incident.
     *
     * Uses the policy batch size when @p max_guards is not given. Ranks
     * continue after the highest rank already issued for the incident.
     */
    DispatchBatch dispatch_initial_alerts(IncidentId incident_id, std::optional<std::size_t> max_guards = std::nullopt);

    /**
     * @brief First-acceptor-wins accept.
     *
     * @throws GuardMismatch when @p guard_id is not the alert's addressee.
     */
    AlertResult accept(AlertId alert_id, const GuardId& guard_id);
    /** @brief Decline and escalate to exactly one further guard. */
    AlertResult decline(AlertId alert_id, const GuardId& guard_id);
    /** @brief Expire a SENT alert and escalate. A no-op on terminal alerts. */
    AlertResult expire(AlertId alert_id);
    /** @brief Expire and escalate every SENT alert whose deadline is before @p now. */
    EscalationSummary expire_due_alerts(TimePoint now);

    /**
     * @brief Operator assignment that bypasses the alert flow.
     *
     * @throws GuardUnavailable when the guard is off duty, disabled or busy.
     * @throws InvalidStatusTransition when the incident is resolved.
     */
    GuardAssignment assign_manually(IncidentId incident_id, const GuardId& guard_id);
    /**
     * @brief Release the incident's guard and re-dispatch to fresh guards.
     *
     * @throws InvalidStatusTransition when no guard is assigned.
     */
    DispatchBatch unassign(IncidentId incident_id);
    /**
     * @brief Close the incident, release its guard and stand down pending alerts.
     *
     * @throws MissingResolutionNotes when @p notes is empty.
     */
    Incident resolve_incident(IncidentId incident_id, const std::string& resolved_by, const std::string& notes);
    /** @throws GuardMismatch when @p guard_id does not hold the assignment. */
    Incident start_response(IncidentId incident_id, const GuardId& guard_id);

    /** @throws UnknownAlert */
    [[nodiscard]] GuardAlert alert(AlertId alert_id) const;
    /** @brief Alerts of one incident in rank order. */
    [[nodiscard]] std::vector<GuardAlert> alerts_for(IncidentId incident_id) const;
    [[nodiscard]] const AlertPolicy& policy() const noexcept;

  private:
    using Outbox = std::vector<Notification>;

    DispatchBatch dispatch_locked(const Incident& incident, std::size_t max_guards, Outbox& outbox);
    void escalate_locked(IncidentId incident_id, Outbox& outbox, AlertResult& result);
    GuardAlert create_alert_locked(const Incident& incident, const GuardCandidate& candidate, std::uint32_t priority_rank, Outbox& outbox);
    GuardAlert update_alert(AlertId alert_id, AlertStatus status, std::optional<AssignmentId> assignment_id = std::nullopt);
    GuardAlert expire_alert_locked(AlertId alert_id, std::string_view reason);
    std::size_t expire_pending_locked(IncidentId incident_id, std::string_view reason);
    [[nodiscard]] std::set<GuardId> alerted_guards(IncidentId incident_id) const;
    [[nodiscard]] std::uint32_t max_rank(IncidentId incident_id) const;
    [[nodiscard]] std::size_t pending_count(IncidentId incident_id) const;
    [[nodiscard]] std::string location_name(const BeaconId& beacon_id) const;
    void notify_assignment(const Incident& incident, const GuardAssignment& assignment, Outbox& outbox) const;
    /** @brief Push queued notifications; failures are logged and audited. */
    void deliver(const Outbox& outbox);

    AlertPolicy policy_;
    const BeaconGraph& beacon_graph_;
    IncidentStore& incident_store_;
    const GuardRegistry& guard_registry_;
    AssignmentLedger& assignment_ledger_;
    const DispatchSearch& dispatch_search_;
    Notifier& notifier_;
    AuditSink& audit_sink_;
    KeyedMutex<IncidentId> incident_locks_;
    std::atomic<AlertId> next_alert_id_{1};

    mutable std::mutex alerts_mutex_;
    std::map<AlertId, GuardAlert> map_alerts_;
    std::map<IncidentId, std::vector<AlertId>> map_alerts_by_incident_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace campus_dispatch
