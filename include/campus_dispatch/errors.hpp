// === Dispatch Errors =========================================================
//
// Exception taxonomy for the dispatch engine. Everything a caller may see
// derives from DispatchError; IntegrityViolation is raised at write time when a
// uniqueness invariant would break and is recovered inside the engine.

#pragma once

#include <stdexcept>
#include <string>

#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Root of every engine-raised error. */
class DispatchError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Signal or location ping referenced a missing or disabled beacon. */
class UnknownOrInactiveBeacon final : public DispatchError {
  public:
    explicit UnknownOrInactiveBeacon(const BeaconId& beacon_id)
        : DispatchError("Invalid or inactive beacon: " + beacon_id) {}
};

class UnknownGuard final : public DispatchError {
  public:
    explicit UnknownGuard(const GuardId& guard_id)
        : DispatchError("Unknown guard: " + guard_id) {}
};

class UnknownIncident final : public DispatchError {
  public:
    explicit UnknownIncident(IncidentId incident_id)
        : DispatchError("Unknown incident: " + std::to_string(incident_id)) {}
};

class UnknownAlert final : public DispatchError {
  public:
    explicit UnknownAlert(AlertId alert_id)
        : DispatchError("Unknown alert: " + std::to_string(alert_id)) {}
};

/** @brief A guard tried to act on an alert or assignment addressed to someone else. */
class GuardMismatch final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief Signal type is not allowed for the submitting actor kind. */
class InvalidSignalSource final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief AI detection confidence is missing or under the configured threshold. */
class LowConfidenceDetection final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

class InvalidStatusTransition final : public DispatchError {
  public:
    InvalidStatusTransition(IncidentStatus from, IncidentStatus to)
        : DispatchError("Cannot move incident from " + std::string{to_string(from)} + " to " + std::string{to_string(to)}) {}
    using DispatchError::DispatchError;
};

/** @brief Resolve was called without a description of the outcome. */
class MissingResolutionNotes final : public DispatchError {
  public:
    explicit MissingResolutionNotes(IncidentId incident_id)
        : DispatchError("Resolution notes are required for incident " + std::to_string(incident_id)) {}
};

/** @brief Protected delete: incidents still reference the beacon. */
class BeaconInUse final : public DispatchError {
  public:
    explicit BeaconInUse(const BeaconId& beacon_id)
        : DispatchError("Beacon " + beacon_id + " is referenced by incidents") {}
};

/** @brief Proximity edit would break the graph invariants. */
class ProximityError final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief Manual assignment target is off duty, disabled, or committed elsewhere. */
class GuardUnavailable final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief Raised by Notifier implementations when a push could not be handed off. */
class NotificationDeliveryFailure final : public DispatchError {
  public:
    using DispatchError::DispatchError;
};

/** @brief Uniqueness constraints enforced at write time. */
enum class IntegrityConstraint {
    OpenIncidentPerBeacon,
    ActiveAssignmentPerIncident,
    ActiveAssignmentPerGuard
};

class IntegrityViolation final : public std::runtime_error {
  public:
    IntegrityViolation(IntegrityConstraint constraint, const std::string& message)
        : std::runtime_error(message), constraint_(constraint) {}

    [[nodiscard]] IntegrityConstraint constraint() const noexcept {
        return constraint_;
    }

  private:
    IntegrityConstraint constraint_;
};

}  // namespace campus_dispatch
