// === Guard Registry ==========================================================
//
// Dispatch-relevant state of every guard: duty/availability flags and the last
// beacon reported by the guard's location pings. Written by location pings and
// availability toggles; read by the dispatch search through snapshots.

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/**
 * @brief A guard's dispatch-relevant profile.
 */
struct GuardProfile final {
    GuardId identifier{};                          /**< Stable guard identifier. */
    std::string full_name{};                       /**< Display name for logs and notifications. */
    bool is_on_duty{true};                         /**< Guard is on shift. */
    bool is_available{true};                       /**< Guard accepts new incidents. */
    bool account_active{true};                     /**< Underlying user account is enabled. */
    std::optional<BeaconId> current_beacon{};      /**< Last beacon reported by a location ping. */
    std::optional<TimePoint> last_beacon_update{}; /**< When current_beacon was last refreshed. */

    /** @brief On duty, available, enabled and located. Assignment state is checked separately. */
    [[nodiscard]] bool is_dispatchable() const noexcept;
};

/** @brief Thread-safe store of guard profiles keyed (and ordered) by id. */
class GuardRegistry final {
  public:
    explicit GuardRegistry(const BeaconGraph& beacon_graph);

    /** @brief Add a guard. Throws std::invalid_argument on empty or duplicate ids. */
    void register_guard(GuardProfile profile);
    /**
     * @brief Record a location ping.
     *
     * @throws UnknownGuard when the guard is not registered.
     * @throws UnknownOrInactiveBeacon when the beacon is missing or disabled.
     */
    void update_location(const GuardId& guard_id, const BeaconId& beacon_id);
    void set_available(const GuardId& guard_id, bool is_available);
    void set_on_duty(const GuardId& guard_id, bool is_on_duty);
    void set_account_active(const GuardId& guard_id, bool account_active);
    /** @brief Forget the location of every guard standing at a retired beacon. */
    std::size_t clear_locations_at(const BeaconId& beacon_id);

    [[nodiscard]] bool contains(const GuardId& guard_id) const;
    /** @throws UnknownGuard */
    [[nodiscard]] GuardProfile guard(const GuardId& guard_id) const;
    /** @brief Copy of every profile in ascending id order. */
    [[nodiscard]] std::vector<GuardProfile> snapshot() const;

  private:
    GuardProfile& require_guard_locked(const GuardId& guard_id);

    const BeaconGraph& beacon_graph_;
    mutable std::mutex mutex_;
    std::map<GuardId, GuardProfile> map_guards_;
};

}  // namespace campus_dispatch
