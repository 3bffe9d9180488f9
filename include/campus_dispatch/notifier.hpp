// === Notifier ================================================================
//
// Fire-and-forget push-notification capability. The engine only ever calls a
// Notifier after the state change it announces has been committed; delivery
// retries and device-token bookkeeping belong to the implementation.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "campus_dispatch/logging.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

enum class NotificationKind {
    GuardAlert,          /**< "Incoming Alert": accept or decline an incident. */
    AssignmentConfirmed  /**< "Assignment Confirmed": the guard now owns the incident. */
};

[[nodiscard]] std::string_view to_string(NotificationKind kind) noexcept;

/** @brief One push message addressed to one guard. */
struct Notification final {
    GuardId guard_id{};
    NotificationKind kind{NotificationKind::GuardAlert};
    IncidentId incident_id{};
    std::optional<AlertId> alert_id{};
    std::string title{};
    std::string body{};
};

/** @brief Push transport collaborator. May throw NotificationDeliveryFailure. */
class Notifier {
  public:
    virtual ~Notifier() = default;

    virtual void notify(const Notification& notification) = 0;
};

/** @brief Notifier that writes every message to the shared logger. */
class LoggingNotifier final : public Notifier {
  public:
    LoggingNotifier();

    void notify(const Notification& notification) override;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace campus_dispatch
