// === Core Types ==============================================================
//
// Collects shared identifiers, time primitives, and the closed enumerations
// (signal types, incident/alert status, actor kinds) used throughout the
// dispatch engine.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace campus_dispatch {

/**
 * @brief Alias for the steady clock used for every engine timestamp.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

using BeaconId = std::string;
using GuardId = std::string;
using IncidentId = std::uint64_t;
using SignalId = std::uint64_t;
using AlertId = std::uint64_t;
using AssignmentId = std::uint64_t;

/**
 * @brief Kinds of observation that can raise or feed an incident.
 */
enum class SignalType {
    StudentSos,     /**< Student-triggered SOS from the mobile app. */
    StudentReport,  /**< General (non-SOS) student report. */
    AiVision,       /**< Violence detected by a vision model. */
    AiAudio,        /**< Scream detected by an audio model. */
    PanicButton     /**< Hardware panic button press. */
};

/**
 * @brief Lifecycle of an incident. Resolved is terminal.
 */
enum class IncidentStatus {
    Created,     /**< Raised, no guard bound yet. */
    Assigned,    /**< A guard accepted (or was assigned by an operator). */
    InProgress,  /**< The assigned guard is responding on site. */
    Resolved     /**< Closed; never reopened. */
};

/**
 * @brief Incident severity. Numeric order is severity order.
 */
enum class IncidentPriority : int {
    Low = 1,
    Medium = 2,
    High = 3,
    Critical = 4
};

/**
 * @brief Per (incident, guard) alert state. Everything except Sent is terminal.
 */
enum class AlertStatus {
    Sent,
    Accepted,
    Declined,
    Expired
};

/**
 * @brief Closed set of principals that may submit a signal.
 */
enum class ActorKind {
    Anonymous,
    Student,
    Guard,
    Device,
    AiDetector
};

/**
 * @brief Buzzer indication exposed to panic-button hardware at a beacon.
 */
enum class BuzzerStatus {
    Inactive,     /**< No open incident at the beacon. */
    Pending,      /**< Incident raised, no guard yet. */
    Active,       /**< A guard is assigned. */
    Acknowledged  /**< The assigned guard is on the way / on site. */
};

/**
 * @brief Originator of a signal; the identifier is empty for anonymous sources.
 */
struct Actor final {
    ActorKind kind{ActorKind::Anonymous};
    std::string identifier{};
};

[[nodiscard]] std::string_view to_string(SignalType type) noexcept;
[[nodiscard]] std::string_view to_string(IncidentStatus status) noexcept;
[[nodiscard]] std::string_view to_string(IncidentPriority priority) noexcept;
[[nodiscard]] std::string_view to_string(AlertStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ActorKind kind) noexcept;
[[nodiscard]] std::string_view to_string(BuzzerStatus status) noexcept;

/** @brief True for Created, Assigned and InProgress. */
[[nodiscard]] bool is_open(IncidentStatus status) noexcept;

/** @brief True for every alert status except Sent. */
[[nodiscard]] bool is_terminal(AlertStatus status) noexcept;

/** @brief Severity implied by a single signal of @p type. */
[[nodiscard]] IncidentPriority priority_for_signal(SignalType type) noexcept;

}  // namespace campus_dispatch
