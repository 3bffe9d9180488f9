// === Dispatch Orchestrator ===================================================
//
// Entry point for inbound signal producers and guard/admin collaborators.
// Validates who may raise which signal, runs the dedup decision and, for newly
// created incidents only, sends the first batch of guard alerts. Also fronts
// graph admin edits so they serialize with dispatch reads of the same beacon.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "campus_dispatch/alert_lifecycle.hpp"
#include "campus_dispatch/assignment_ledger.hpp"
#include "campus_dispatch/audit_log.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/dispatch_search.hpp"
#include "campus_dispatch/guard_registry.hpp"
#include "campus_dispatch/incident_store.hpp"
#include "campus_dispatch/logging.hpp"
#include "campus_dispatch/notifier.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Engine configuration threaded in by the owner. */
struct DispatchConfig final {
    AlertPolicy alert_policy{};          /**< Batch size and response deadline. */
    Duration sweep_interval{10.0};       /**< Cadence of the overdue-alert sweep. */
    double ai_vision_threshold{0.75};    /**< Minimum confidence for AI_VISION signals. */
    double ai_audio_threshold{0.80};     /**< Minimum confidence for AI_AUDIO signals. */
};

/** @brief What handle_signal() did with one inbound signal. */
struct DispatchResult final {
    Incident incident{};
    bool was_created{};
    IncidentSignal signal{};
    DispatchBatch dispatch{};  /**< Empty unless the signal created the incident. */
};

class DispatchOrchestrator final {
  public:
    /** @throws std::invalid_argument when a confidence threshold is outside [0, 1]. */
    DispatchOrchestrator(
        DispatchConfig config,
        BeaconGraph& beacon_graph,
        GuardRegistry& guard_registry,
        Notifier& notifier,
        AuditSink& audit_sink
    );

    /**
     * @brief Dedup the signal into an incident and dispatch if it is new.
     *
     * Safe to call concurrently for the same beacon from any channel.
     *
     * @throws InvalidSignalSource when the actor may not raise this signal type.
     * @throws LowConfidenceDetection for AI signals under the threshold.
     * @throws UnknownOrInactiveBeacon when the beacon is missing or disabled.
     */
    DispatchResult handle_signal(const SignalRequest& request);
    DispatchResult handle_signal(const BeaconId& beacon_id, SignalType type, const Actor& actor);

    AlertResult accept_alert(AlertId alert_id, const GuardId& guard_id);
    AlertResult decline_alert(AlertId alert_id, const GuardId& guard_id);
    AlertResult expire_alert(AlertId alert_id);
    EscalationSummary expire_due_alerts(TimePoint now);

    Incident start_response(IncidentId incident_id, const GuardId& guard_id);
    Incident resolve_incident(IncidentId incident_id, const std::string& resolved_by, const std::string& notes);
    GuardAssignment assign_guard(IncidentId incident_id, const GuardId& guard_id);
    DispatchBatch unassign_guard(IncidentId incident_id);

    /** @brief Indication for panic-button hardware at @p beacon_id. */
    [[nodiscard]] BuzzerStatus buzzer_status(const BeaconId& beacon_id) const;

    void insert_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, std::optional<int> priority = std::nullopt);
    void move_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, int new_priority);
    void remove_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon);
    /** @brief Enable or disable a beacon; serialized with signals at that beacon. */
    void set_beacon_active(const BeaconId& beacon_id, bool is_active);
    /**
     * @brief Protected beacon delete.
     *
     * @throws BeaconInUse when any incident, open or resolved, references it.
     */
    void retire_beacon(const BeaconId& beacon_id);

    [[nodiscard]] const DispatchConfig& config() const noexcept;
    [[nodiscard]] const IncidentStore& incidents() const noexcept;
    [[nodiscard]] const AssignmentLedger& assignments() const noexcept;
    [[nodiscard]] const AlertLifecycleManager& alerts() const noexcept;

  private:
    /** @brief Exhaustive actor/signal compatibility and the AI confidence gate. */
    void validate_signal(const SignalRequest& request) const;

    DispatchConfig config_;
    BeaconGraph& beacon_graph_;
    GuardRegistry& guard_registry_;
    IncidentStore incident_store_;
    AssignmentLedger assignment_ledger_;
    DispatchSearch dispatch_search_;
    AlertLifecycleManager alert_manager_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace campus_dispatch
