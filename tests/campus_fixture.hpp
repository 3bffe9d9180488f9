#pragma once

#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

#include "campus_dispatch/audit_log.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/dispatch_orchestrator.hpp"
#include "campus_dispatch/errors.hpp"
#include "campus_dispatch/guard_registry.hpp"
#include "campus_dispatch/notifier.hpp"

#include "logging_test_fixture.hpp"

namespace campus_dispatch::test {

/** @brief Notifier that remembers every push and can be told to fail. */
class RecordingNotifier final : public Notifier {
  public:
    void notify(const Notification& notification) override {
        std::scoped_lock lock(mutex_);
        if (flag_failing_) {
            throw NotificationDeliveryFailure("push gateway unavailable");
        }
        list_notifications_.push_back(notification);
    }

    void set_failing(bool is_failing) {
        std::scoped_lock lock(mutex_);
        flag_failing_ = is_failing;
    }

    [[nodiscard]] std::vector<Notification> notifications() const {
        std::scoped_lock lock(mutex_);
        return list_notifications_;
    }

    [[nodiscard]] std::size_t count(NotificationKind kind) const {
        std::scoped_lock lock(mutex_);
        return static_cast<std::size_t>(std::count_if(list_notifications_.begin(), list_notifications_.end(), [kind](const Notification& notification) {
            return notification.kind == kind;
        }));
    }

  private:
    mutable std::mutex mutex_;
    bool flag_failing_{false};
    std::vector<Notification> list_notifications_;
};

/** @brief Graph, guards, audit trail and an orchestrator wired together. */
struct CampusFixture {
    explicit CampusFixture(DispatchConfig config = {})
        : orchestrator(config, graph, guards, notifier, audit_log) {}

    void add_beacon(const BeaconId& beacon_id) {
        graph.add_beacon(Beacon{beacon_id, beacon_id, "Campus", 1, true});
    }

    void link(const BeaconId& from_beacon, const BeaconId& to_beacon) {
        graph.insert_proximity(from_beacon, to_beacon);
    }

    void add_guard(const GuardId& guard_id, const BeaconId& beacon_id) {
        guards.register_guard(GuardProfile{guard_id, guard_id, true, true, true, beacon_id, std::nullopt});
    }

    DispatchResult sos(const BeaconId& beacon_id) {
        return orchestrator.handle_signal(beacon_id, SignalType::StudentSos, Actor{ActorKind::Student, "student-1"});
    }

    BeaconGraph graph;
    GuardRegistry guards{graph};
    AuditLog audit_log;
    RecordingNotifier notifier;
    DispatchOrchestrator orchestrator;
};

/**
 * @brief "hall" with three wings reached at priorities 1..3 and one guard per beacon.
 *
 * With the default batch of three, g1..g3 are alerted at ranks 1..3 and g4
 * is the only guard left for escalation.
 */
inline void seed_hall_campus(CampusFixture& campus) {
    campus.add_beacon("hall");
    campus.add_beacon("wing-a");
    campus.add_beacon("wing-b");
    campus.add_beacon("wing-c");
    campus.link("hall", "wing-a");
    campus.link("hall", "wing-b");
    campus.link("hall", "wing-c");
    campus.add_guard("g1", "hall");
    campus.add_guard("g2", "wing-a");
    campus.add_guard("g3", "wing-b");
    campus.add_guard("g4", "wing-c");
}

}  // namespace campus_dispatch::test
