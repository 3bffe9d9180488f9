#include "campus_dispatch/beacon_graph.hpp"

#include <algorithm>
#include <stdexcept>

#include "campus_dispatch/errors.hpp"
#include "campus_dispatch/logging.hpp"

namespace campus_dispatch {

namespace {
const std::vector<BeaconProximity> k_no_proximities{};

void renumber(std::vector<BeaconProximity>& siblings) {
    int priority = 1;
    for (BeaconProximity& proximity : siblings) {
        proximity.priority = priority++;
    }
}

std::vector<BeaconProximity>::iterator find_edge(std::vector<BeaconProximity>& siblings, const BeaconId& to_beacon) {
    return std::find_if(siblings.begin(), siblings.end(), [&to_beacon](const BeaconProximity& proximity) {
        return proximity.to_beacon == to_beacon;
    });
}

std::size_t clamp_position(int priority, std::size_t sibling_count) {
    if (priority < 1) {
        throw ProximityError("Proximity priority must be >= 1, got " + std::to_string(priority));
    }
    return std::min(static_cast<std::size_t>(priority - 1), sibling_count);
}
}  // namespace

const Beacon* GraphSnapshot::find_beacon(const BeaconId& beacon_id) const {
    const auto iterator_beacon = map_beacons_.find(beacon_id);
    if (iterator_beacon == map_beacons_.end()) {
        return nullptr;
    }
    return &iterator_beacon->second;
}

bool GraphSnapshot::is_active_beacon(const BeaconId& beacon_id) const {
    const Beacon* beacon = find_beacon(beacon_id);
    return beacon != nullptr && beacon->is_active;
}

const std::vector<BeaconProximity>& GraphSnapshot::proximities_from(const BeaconId& beacon_id) const {
    const auto iterator_edges = map_proximities_.find(beacon_id);
    if (iterator_edges == map_proximities_.end()) {
        return k_no_proximities;
    }
    return iterator_edges->second;
}

std::vector<Beacon> GraphSnapshot::beacons() const {
    std::vector<Beacon> list_beacons;
    list_beacons.reserve(map_beacons_.size());
    for (const auto& [beacon_id, beacon] : map_beacons_) {
        list_beacons.push_back(beacon);
    }
    return list_beacons;
}

std::size_t GraphSnapshot::beacon_count() const noexcept {
    return map_beacons_.size();
}

bool GraphSnapshot::priorities_dense() const {
    for (const auto& [from_beacon, siblings] : map_proximities_) {
        int expected = 1;
        for (const BeaconProximity& proximity : siblings) {
            if (proximity.priority != expected++) {
                return false;
            }
        }
    }
    return true;
}

BeaconGraph::BeaconGraph()
    : snapshot_(std::make_shared<const GraphSnapshot>()) {}

GraphSnapshotPtr BeaconGraph::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshot_;
}

void BeaconGraph::add_beacon(Beacon beacon) {
    if (beacon.identifier.empty()) {
        throw std::invalid_argument("Beacon identifier cannot be empty");
    }
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    const BeaconId beacon_id = beacon.identifier;
    if (!edited->map_beacons_.emplace(beacon_id, std::move(beacon)).second) {
        throw std::invalid_argument("Beacon " + beacon_id + " already registered");
    }
    publish_locked(std::move(edited));
    get_logger("beacon_graph")->info(R"({{"action":"add_beacon","beacon":"{}"}})", beacon_id);
}

void BeaconGraph::set_beacon_active(const BeaconId& beacon_id, bool is_active) {
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    const auto iterator_beacon = edited->map_beacons_.find(beacon_id);
    if (iterator_beacon == edited->map_beacons_.end()) {
        throw UnknownOrInactiveBeacon(beacon_id);
    }
    iterator_beacon->second.is_active = is_active;
    publish_locked(std::move(edited));
}

void BeaconGraph::remove_beacon(const BeaconId& beacon_id) {
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    if (edited->map_beacons_.erase(beacon_id) == 0) {
        throw UnknownOrInactiveBeacon(beacon_id);
    }
    edited->map_proximities_.erase(beacon_id);
    for (auto& [from_beacon, siblings] : edited->map_proximities_) {
        const auto iterator_edge = find_edge(siblings, beacon_id);
        if (iterator_edge != siblings.end()) {
            siblings.erase(iterator_edge);
            renumber(siblings);
        }
    }
    publish_locked(std::move(edited));
    get_logger("beacon_graph")->info(R"({{"action":"remove_beacon","beacon":"{}"}})", beacon_id);
}

void BeaconGraph::insert_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, std::optional<int> priority) {
    if (from_beacon == to_beacon) {
        throw ProximityError("Beacon " + from_beacon + " cannot be near itself");
    }
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    if (edited->find_beacon(from_beacon) == nullptr) {
        throw UnknownOrInactiveBeacon(from_beacon);
    }
    if (edited->find_beacon(to_beacon) == nullptr) {
        throw UnknownOrInactiveBeacon(to_beacon);
    }
    auto& siblings = edited->map_proximities_[from_beacon];
    if (find_edge(siblings, to_beacon) != siblings.end()) {
        throw ProximityError("Proximity " + from_beacon + " -> " + to_beacon + " already exists");
    }
    const std::size_t position = priority.has_value() ? clamp_position(priority.value(), siblings.size()) : siblings.size();
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(position), BeaconProximity{from_beacon, to_beacon, 0});
    renumber(siblings);
    publish_locked(std::move(edited));
    get_logger("beacon_graph")->info(
        R"({{"action":"insert_proximity","from":"{}","to":"{}","priority":{}}})",
        from_beacon,
        to_beacon,
        position + 1
    );
}

void BeaconGraph::move_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, int new_priority) {
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    auto& siblings = edited->map_proximities_[from_beacon];
    const auto iterator_edge = find_edge(siblings, to_beacon);
    if (iterator_edge == siblings.end()) {
        throw ProximityError("No proximity " + from_beacon + " -> " + to_beacon);
    }
    const int old_priority = iterator_edge->priority;
    if (old_priority == new_priority) {
        return;
    }
    BeaconProximity moved = *iterator_edge;
    siblings.erase(iterator_edge);
    const std::size_t position = clamp_position(new_priority, siblings.size());
    siblings.insert(siblings.begin() + static_cast<std::ptrdiff_t>(position), std::move(moved));
    renumber(siblings);
    publish_locked(std::move(edited));
    get_logger("beacon_graph")->info(
        R"({{"action":"move_proximity","from":"{}","to":"{}","old":{},"new":{}}})",
        from_beacon,
        to_beacon,
        old_priority,
        position + 1
    );
}

void BeaconGraph::remove_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon) {
    std::scoped_lock lock(mutex_);
    auto edited = clone_locked();
    auto& siblings = edited->map_proximities_[from_beacon];
    const auto iterator_edge = find_edge(siblings, to_beacon);
    if (iterator_edge == siblings.end()) {
        throw ProximityError("No proximity " + from_beacon + " -> " + to_beacon);
    }
    siblings.erase(iterator_edge);
    renumber(siblings);
    if (siblings.empty()) {
        edited->map_proximities_.erase(from_beacon);
    }
    publish_locked(std::move(edited));
    get_logger("beacon_graph")->info(
        R"({{"action":"remove_proximity","from":"{}","to":"{}"}})",
        from_beacon,
        to_beacon
    );
}

std::shared_ptr<GraphSnapshot> BeaconGraph::clone_locked() const {
    return std::make_shared<GraphSnapshot>(*snapshot_);
}

void BeaconGraph::publish_locked(std::shared_ptr<GraphSnapshot> edited) {
    snapshot_ = std::move(edited);
}

}  // namespace campus_dispatch
