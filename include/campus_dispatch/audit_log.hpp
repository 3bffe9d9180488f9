// === Audit Log ===============================================================
//
// Append-only incident event trail. AuditSink is the collaborator interface the
// engine writes to; AuditLog is the in-process thread-safe implementation,
// keyed by incident id for lifecycle queries.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief Every lifecycle event the engine records. */
enum class AuditEventKind {
    IncidentCreated,
    SignalMerged,
    PriorityChanged,
    StatusChanged,
    AlertSent,
    AlertFailed,
    AlertAccepted,
    AlertDeclined,
    AlertExpired,
    GuardAssigned,
    GuardUnassigned,
    IncidentResolved,
    AllGuardsExhausted
};

[[nodiscard]] std::string_view to_string(AuditEventKind kind) noexcept;

/** @brief Single immutable audit record. */
struct AuditEvent final {
    AuditEventKind kind{AuditEventKind::IncidentCreated};
    IncidentId incident_id{};
    std::optional<GuardId> guard_id{};  /**< Target guard for alert/assignment events. */
    std::optional<AlertId> alert_id{};
    std::string detail{};               /**< Free-form JSON object with event specifics. */
    TimePoint recorded_at{SteadyClock::now()};
};

/** @brief Append-only sink consumed by the engine. */
class AuditSink {
  public:
    virtual ~AuditSink() = default;

    virtual void record(const AuditEvent& event) = 0;
};

/** @brief In-memory, thread-safe audit trail. */
class AuditLog final : public AuditSink {
  public:
    void record(const AuditEvent& event) override;

    /** @brief Events for @p incident_id in recording order. */
    [[nodiscard]] std::vector<AuditEvent> events_for(IncidentId incident_id) const;
    [[nodiscard]] std::vector<AuditEvent> events() const;
    [[nodiscard]] std::size_t count(AuditEventKind kind) const;
    [[nodiscard]] std::size_t count(IncidentId incident_id, AuditEventKind kind) const;

  private:
    mutable std::mutex mutex_;
    std::vector<AuditEvent> list_events_;
};

}  // namespace campus_dispatch
