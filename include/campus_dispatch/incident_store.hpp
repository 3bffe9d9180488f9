// === Incident Store ==========================================================
//
// Authoritative incident state and the dedup contract: at most one open
// (non-resolved) incident exists per beacon. resolve_or_create() decides merge
// versus create under a beacon-scoped lock; status transitions are validated
// against a fixed table and audited.

#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "campus_dispatch/audit_log.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/keyed_mutex.hpp"
#include "campus_dispatch/logging.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Signal-specific payload supplied by the inbound channel. */
struct SignalDetails final {
    std::optional<double> confidence{};               /**< AI detection score in [0, 1]. */
    std::map<std::string, std::string> attributes{};  /**< Free-form channel data. */
};

/** @brief Inbound observation as handed to the engine. */
struct SignalRequest final {
    BeaconId beacon_id{};
    SignalType type{SignalType::StudentSos};
    Actor actor{};
    std::string description{};  /**< Used as the incident description when the signal creates one. */
    SignalDetails details{};
};

/** @brief Immutable observation attached to exactly one incident. */
struct IncidentSignal final {
    SignalId identifier{};
    IncidentId incident_id{};
    SignalType type{SignalType::StudentSos};
    Actor source{};
    SignalDetails details{};
    TimePoint received_at{};
};

/** @brief The unit of dispatch. */
struct Incident final {
    IncidentId identifier{};
    BeaconId beacon_id{};
    IncidentStatus status{IncidentStatus::Created};
    IncidentPriority priority{IncidentPriority::Medium};
    std::string description{};
    TimePoint first_signal_time{};
    TimePoint last_signal_time{};
    std::vector<SignalId> signal_ids{};
    std::optional<GuardId> assigned_guard{};
    std::optional<TimePoint> assigned_at{};
    std::uint32_t total_alerts_sent{};
    std::uint32_t total_alerts_declined{};
    std::optional<std::string> resolved_by{};
    std::optional<TimePoint> resolved_at{};
    std::string resolution_notes{};
};

/** @brief Outcome of the dedup decision. */
struct ResolveOutcome final {
    Incident incident{};
    bool was_created{};
    IncidentSignal signal{};
};

/** @brief True when @p from may move to @p to. */
[[nodiscard]] bool is_valid_transition(IncidentStatus from, IncidentStatus to) noexcept;

/** @brief Owner of incidents and signals. */
class IncidentStore final {
  public:
    IncidentStore(const BeaconGraph& beacon_graph, AuditSink& audit_sink);

    /**
     * @brief Attach the signal to the beacon's open incident or open a new one.
     *
     * @throws UnknownOrInactiveBeacon when the beacon is missing or disabled.
     */
    ResolveOutcome resolve_or_create(const SignalRequest& request);

    /** @brief Exclusive lock serializing dedup decisions and graph edits for a beacon. */
    [[nodiscard]] std::unique_lock<std::mutex> lock_beacon(const BeaconId& beacon_id);

    /** @throws UnknownIncident */
    [[nodiscard]] Incident incident(IncidentId incident_id) const;
    [[nodiscard]] std::optional<Incident> open_incident_at(const BeaconId& beacon_id) const;
    [[nodiscard]] std::vector<Incident> incidents_at(const BeaconId& beacon_id) const;
    [[nodiscard]] bool has_incidents_at(const BeaconId& beacon_id) const;
    [[nodiscard]] std::vector<IncidentSignal> signals_for(IncidentId incident_id) const;
    [[nodiscard]] std::size_t incident_count() const;

    /** @brief Bind @p guard_id; Created/Assigned/InProgress -> Assigned. */
    Incident mark_assigned(IncidentId incident_id, const GuardId& guard_id);
    /** @brief Assigned -> InProgress. */
    Incident mark_in_progress(IncidentId incident_id);
    /** @brief Assigned/InProgress -> Created, clearing the bound guard. */
    Incident mark_unassigned(IncidentId incident_id);
    /** @brief Any open status -> Resolved. Frees the beacon for a new incident. */
    Incident mark_resolved(IncidentId incident_id, const std::string& resolved_by, const std::string& notes);

    void record_alerts_sent(IncidentId incident_id, std::uint32_t alert_count);
    void record_alert_declined(IncidentId incident_id);

  private:
    friend struct IncidentStoreTestAccess;

    /** @brief One dedup attempt; throws IntegrityViolation when a rival opened an incident first. */
    ResolveOutcome merge_or_create(const SignalRequest& request);
    Incident& require_incident_locked(IncidentId incident_id);
    Incident transition_locked(Incident& incident, IncidentStatus target);

    const BeaconGraph& beacon_graph_;
    AuditSink& audit_sink_;
    KeyedMutex<BeaconId> beacon_locks_;
    std::atomic<IncidentId> next_incident_id_{1};
    std::atomic<SignalId> next_signal_id_{1};

    mutable std::mutex mutex_;
    std::map<IncidentId, Incident> map_incidents_;
    std::unordered_map<SignalId, IncidentSignal> map_signals_;
    std::unordered_map<BeaconId, IncidentId> map_open_by_beacon_;
    std::shared_ptr<spdlog::logger> logger_;
    std::function<void()> before_insert_hook_{};  /**< Runs between the open-slot check and the insert. */
};

}  // namespace campus_dispatch
