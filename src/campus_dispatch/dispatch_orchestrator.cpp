#include "campus_dispatch/dispatch_orchestrator.hpp"

#include <cmath>
#include <stdexcept>

#include "campus_dispatch/errors.hpp"

namespace campus_dispatch {

namespace {

bool actor_may_raise(ActorKind actor_kind, SignalType type) noexcept {
    switch (type) {
        case SignalType::StudentSos:
        case SignalType::StudentReport:
            switch (actor_kind) {
                case ActorKind::Student:
                case ActorKind::Guard:
                case ActorKind::Anonymous:
                    return true;
                case ActorKind::Device:
                case ActorKind::AiDetector:
                    return false;
            }
            return false;
        case SignalType::PanicButton:
            switch (actor_kind) {
                case ActorKind::Device:
                case ActorKind::Anonymous:
                    return true;
                case ActorKind::Student:
                case ActorKind::Guard:
                case ActorKind::AiDetector:
                    return false;
            }
            return false;
        case SignalType::AiVision:
        case SignalType::AiAudio:
            return actor_kind == ActorKind::AiDetector;
    }
    return false;
}

void require_threshold(double threshold, const char* name) {
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
        throw std::invalid_argument(std::string{name} + " must lie in [0, 1]");
    }
}

}  // namespace

DispatchOrchestrator::DispatchOrchestrator(
    DispatchConfig config,
    BeaconGraph& beacon_graph,
    GuardRegistry& guard_registry,
    Notifier& notifier,
    AuditSink& audit_sink
)
    : config_(config),
      beacon_graph_(beacon_graph),
      guard_registry_(guard_registry),
      incident_store_(beacon_graph_, audit_sink),
      assignment_ledger_(),
      dispatch_search_(beacon_graph_, guard_registry_, assignment_ledger_),
      alert_manager_(
          config_.alert_policy,
          beacon_graph_,
          incident_store_,
          guard_registry_,
          assignment_ledger_,
          dispatch_search_,
          notifier,
          audit_sink
      ),
      logger_(get_logger("orchestrator")) {
    require_threshold(config_.ai_vision_threshold, "ai_vision_threshold");
    require_threshold(config_.ai_audio_threshold, "ai_audio_threshold");
}

DispatchResult DispatchOrchestrator::handle_signal(const SignalRequest& request) {
    validate_signal(request);

    ResolveOutcome outcome = incident_store_.resolve_or_create(request);
    DispatchResult result{};
    result.was_created = outcome.was_created;
    result.signal = std::move(outcome.signal);
    if (outcome.was_created) {
        result.dispatch = alert_manager_.dispatch_initial_alerts(outcome.incident.identifier);
        // Re-read so the caller sees the counters written by the dispatch.
        result.incident = incident_store_.incident(outcome.incident.identifier);
    } else {
        result.incident = std::move(outcome.incident);
    }
    return result;
}

DispatchResult DispatchOrchestrator::handle_signal(const BeaconId& beacon_id, SignalType type, const Actor& actor) {
    SignalRequest request{};
    request.beacon_id = beacon_id;
    request.type = type;
    request.actor = actor;
    return handle_signal(request);
}

AlertResult DispatchOrchestrator::accept_alert(AlertId alert_id, const GuardId& guard_id) {
    return alert_manager_.accept(alert_id, guard_id);
}

AlertResult DispatchOrchestrator::decline_alert(AlertId alert_id, const GuardId& guard_id) {
    return alert_manager_.decline(alert_id, guard_id);
}

AlertResult DispatchOrchestrator::expire_alert(AlertId alert_id) {
    return alert_manager_.expire(alert_id);
}

EscalationSummary DispatchOrchestrator::expire_due_alerts(TimePoint now) {
    return alert_manager_.expire_due_alerts(now);
}

Incident DispatchOrchestrator::start_response(IncidentId incident_id, const GuardId& guard_id) {
    return alert_manager_.start_response(incident_id, guard_id);
}

Incident DispatchOrchestrator::resolve_incident(IncidentId incident_id, const std::string& resolved_by, const std::string& notes) {
    return alert_manager_.resolve_incident(incident_id, resolved_by, notes);
}

GuardAssignment DispatchOrchestrator::assign_guard(IncidentId incident_id, const GuardId& guard_id) {
    return alert_manager_.assign_manually(incident_id, guard_id);
}

DispatchBatch DispatchOrchestrator::unassign_guard(IncidentId incident_id) {
    return alert_manager_.unassign(incident_id);
}

BuzzerStatus DispatchOrchestrator::buzzer_status(const BeaconId& beacon_id) const {
    const std::optional<Incident> open_incident = incident_store_.open_incident_at(beacon_id);
    if (!open_incident.has_value()) {
        return BuzzerStatus::Inactive;
    }
    switch (open_incident->status) {
        case IncidentStatus::Created:
            return BuzzerStatus::Pending;
        case IncidentStatus::Assigned:
            return BuzzerStatus::Active;
        case IncidentStatus::InProgress:
            return BuzzerStatus::Acknowledged;
        case IncidentStatus::Resolved:
            return BuzzerStatus::Inactive;
    }
    return BuzzerStatus::Inactive;
}

void DispatchOrchestrator::insert_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, std::optional<int> priority) {
    auto beacon_lock = incident_store_.lock_beacon(from_beacon);
    beacon_graph_.insert_proximity(from_beacon, to_beacon, priority);
}

void DispatchOrchestrator::move_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, int new_priority) {
    auto beacon_lock = incident_store_.lock_beacon(from_beacon);
    beacon_graph_.move_proximity(from_beacon, to_beacon, new_priority);
}

void DispatchOrchestrator::remove_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon) {
    auto beacon_lock = incident_store_.lock_beacon(from_beacon);
    beacon_graph_.remove_proximity(from_beacon, to_beacon);
}

void DispatchOrchestrator::set_beacon_active(const BeaconId& beacon_id, bool is_active) {
    auto beacon_lock = incident_store_.lock_beacon(beacon_id);
    beacon_graph_.set_beacon_active(beacon_id, is_active);
}

void DispatchOrchestrator::retire_beacon(const BeaconId& beacon_id) {
    auto beacon_lock = incident_store_.lock_beacon(beacon_id);
    if (incident_store_.has_incidents_at(beacon_id)) {
        throw BeaconInUse(beacon_id);
    }
    beacon_graph_.remove_beacon(beacon_id);
    const std::size_t cleared = guard_registry_.clear_locations_at(beacon_id);
    logger_->info(R"({{"action":"retire_beacon","beacon":"{}","guards_cleared":{}}})", beacon_id, cleared);
}

const DispatchConfig& DispatchOrchestrator::config() const noexcept {
    return config_;
}

const IncidentStore& DispatchOrchestrator::incidents() const noexcept {
    return incident_store_;
}

const AssignmentLedger& DispatchOrchestrator::assignments() const noexcept {
    return assignment_ledger_;
}

const AlertLifecycleManager& DispatchOrchestrator::alerts() const noexcept {
    return alert_manager_;
}

void DispatchOrchestrator::validate_signal(const SignalRequest& request) const {
    if (!actor_may_raise(request.actor.kind, request.type)) {
        logger_->warn(
            R"({{"beacon":"{}","signal":"{}","actor":"{}","error":"invalid_signal_source"}})",
            request.beacon_id,
            to_string(request.type),
            to_string(request.actor.kind)
        );
        throw InvalidSignalSource(
            std::string{to_string(request.actor.kind)} + " may not raise " + std::string{to_string(request.type)}
        );
    }

    double threshold = 0.0;
    switch (request.type) {
        case SignalType::AiVision:
            threshold = config_.ai_vision_threshold;
            break;
        case SignalType::AiAudio:
            threshold = config_.ai_audio_threshold;
            break;
        case SignalType::StudentSos:
        case SignalType::StudentReport:
        case SignalType::PanicButton:
            return;
    }
    const std::optional<double>& confidence = request.details.confidence;
    const bool is_usable_score =
        confidence.has_value() && std::isfinite(confidence.value()) && confidence.value() >= 0.0 && confidence.value() <= 1.0;
    if (!is_usable_score || confidence.value() < threshold) {
        logger_->info(
            R"({{"beacon":"{}","signal":"{}","confidence":{},"threshold":{},"action":"rejected"}})",
            request.beacon_id,
            to_string(request.type),
            is_usable_score ? confidence.value() : -1.0,
            threshold
        );
        if (!is_usable_score) {
            throw LowConfidenceDetection(std::string{to_string(request.type)} + " confidence missing or outside [0, 1]");
        }
        throw LowConfidenceDetection(
            std::string{to_string(request.type)} + " confidence below threshold " + std::to_string(threshold)
        );
    }
}

}  // namespace campus_dispatch
