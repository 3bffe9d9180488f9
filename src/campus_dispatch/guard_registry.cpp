#include "campus_dispatch/guard_registry.hpp"

#include <stdexcept>

#include "campus_dispatch/errors.hpp"
#include "campus_dispatch/logging.hpp"

namespace campus_dispatch {

bool GuardProfile::is_dispatchable() const noexcept {
    return is_on_duty && is_available && account_active && current_beacon.has_value();
}

GuardRegistry::GuardRegistry(const BeaconGraph& beacon_graph)
    : beacon_graph_(beacon_graph) {}

void GuardRegistry::register_guard(GuardProfile profile) {
    if (profile.identifier.empty()) {
        throw std::invalid_argument("Guard identifier cannot be empty");
    }
    if (profile.current_beacon.has_value() && beacon_graph_.snapshot()->find_beacon(profile.current_beacon.value()) == nullptr) {
        throw UnknownOrInactiveBeacon(profile.current_beacon.value());
    }
    std::scoped_lock lock(mutex_);
    const GuardId guard_id = profile.identifier;
    if (!map_guards_.emplace(guard_id, std::move(profile)).second) {
        throw std::invalid_argument("Guard " + guard_id + " already registered");
    }
}

void GuardRegistry::update_location(const GuardId& guard_id, const BeaconId& beacon_id) {
    if (!beacon_graph_.snapshot()->is_active_beacon(beacon_id)) {
        throw UnknownOrInactiveBeacon(beacon_id);
    }
    std::scoped_lock lock(mutex_);
    GuardProfile& profile = require_guard_locked(guard_id);
    profile.current_beacon = beacon_id;
    profile.last_beacon_update = SteadyClock::now();
    get_logger("guards")->debug(R"({{"guard":"{}","action":"location","beacon":"{}"}})", guard_id, beacon_id);
}

void GuardRegistry::set_available(const GuardId& guard_id, bool is_available) {
    std::scoped_lock lock(mutex_);
    require_guard_locked(guard_id).is_available = is_available;
    get_logger("guards")->info(R"({{"guard":"{}","available":{}}})", guard_id, is_available);
}

void GuardRegistry::set_on_duty(const GuardId& guard_id, bool is_on_duty) {
    std::scoped_lock lock(mutex_);
    require_guard_locked(guard_id).is_on_duty = is_on_duty;
    get_logger("guards")->info(R"({{"guard":"{}","on_duty":{}}})", guard_id, is_on_duty);
}

void GuardRegistry::set_account_active(const GuardId& guard_id, bool account_active) {
    std::scoped_lock lock(mutex_);
    require_guard_locked(guard_id).account_active = account_active;
}

std::size_t GuardRegistry::clear_locations_at(const BeaconId& beacon_id) {
    std::scoped_lock lock(mutex_);
    std::size_t cleared_count = 0;
    for (auto& [guard_id, profile] : map_guards_) {
        if (profile.current_beacon == beacon_id) {
            profile.current_beacon.reset();
            ++cleared_count;
        }
    }
    return cleared_count;
}

bool GuardRegistry::contains(const GuardId& guard_id) const {
    std::scoped_lock lock(mutex_);
    return map_guards_.find(guard_id) != map_guards_.end();
}

GuardProfile GuardRegistry::guard(const GuardId& guard_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_guard = map_guards_.find(guard_id);
    if (iterator_guard == map_guards_.end()) {
        throw UnknownGuard(guard_id);
    }
    return iterator_guard->second;
}

std::vector<GuardProfile> GuardRegistry::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<GuardProfile> list_guards;
    list_guards.reserve(map_guards_.size());
    for (const auto& [guard_id, profile] : map_guards_) {
        list_guards.push_back(profile);
    }
    return list_guards;
}

GuardProfile& GuardRegistry::require_guard_locked(const GuardId& guard_id) {
    const auto iterator_guard = map_guards_.find(guard_id);
    if (iterator_guard == map_guards_.end()) {
        throw UnknownGuard(guard_id);
    }
    return iterator_guard->second;
}

}  // namespace campus_dispatch
