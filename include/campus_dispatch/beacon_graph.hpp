// === Beacon Graph ============================================================
//
// Directed, priority-weighted adjacency between indoor location beacons. The
// graph is published as immutable snapshots: readers grab a shared pointer and
// never observe a half-applied edit, writers copy, edit, renumber and swap.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/**
 * @brief Fixed indoor location marker.
 */
struct Beacon final {
    BeaconId identifier{};      /**< Hardware identifier, e.g. "safe:uuid:403:403". */
    std::string location_name{}; /**< Human-readable place, e.g. "Library 3F". */
    std::string building{};      /**< Building grouping. */
    int floor{};                 /**< Floor grouping. */
    bool is_active{true};        /**< Operational flag; inactive beacons reject signals. */
};

/**
 * @brief Directed edge used for expanding-radius guard search.
 *
 * Lower priority means nearer (1 = same floor, 2 = adjacent, ...). Siblings
 * sharing a from_beacon always carry the dense sequence 1..n.
 */
struct BeaconProximity final {
    BeaconId from_beacon{};
    BeaconId to_beacon{};
    int priority{};
};

/** @brief Immutable view of the beacon graph at one instant. */
class GraphSnapshot final {
  public:
    /** @brief Beacon lookup; nullptr when unknown. */
    [[nodiscard]] const Beacon* find_beacon(const BeaconId& beacon_id) const;
    /** @brief True when the beacon exists and is active. */
    [[nodiscard]] bool is_active_beacon(const BeaconId& beacon_id) const;
    /** @brief Outgoing edges of @p beacon_id in ascending priority. */
    [[nodiscard]] const std::vector<BeaconProximity>& proximities_from(const BeaconId& beacon_id) const;
    [[nodiscard]] std::vector<Beacon> beacons() const;
    [[nodiscard]] std::size_t beacon_count() const noexcept;
    /** @brief Verify the dense 1..n ordering for every from_beacon. */
    [[nodiscard]] bool priorities_dense() const;

  private:
    friend class BeaconGraph;

    std::map<BeaconId, Beacon> map_beacons_;
    std::map<BeaconId, std::vector<BeaconProximity>> map_proximities_;
};

using GraphSnapshotPtr = std::shared_ptr<const GraphSnapshot>;

/** @brief Owner of the published beacon graph and its admin edits. */
class BeaconGraph final {
  public:
    BeaconGraph();

    /** @brief Current immutable snapshot; cheap to take. */
    [[nodiscard]] GraphSnapshotPtr snapshot() const;

    /** @brief Register a new beacon. Identifiers must be unique and non-empty. */
    void add_beacon(Beacon beacon);
    /** @brief Enable or disable a beacon without touching its edges. */
    void set_beacon_active(const BeaconId& beacon_id, bool is_active);
    /**
     * @brief Remove a beacon together with every edge touching it.
     *
     * Callers are responsible for the protected-delete check against incidents.
     */
    void remove_beacon(const BeaconId& beacon_id);

    /**
     * @brief Insert an edge at @p priority, shifting siblings at or after it.
     *
     * A missing priority appends the edge at the end of the sibling list.
     * Priorities past the end are clamped to n+1.
     */
    void insert_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, std::optional<int> priority = std::nullopt);
    /** @brief Move an existing edge to @p new_priority, shifting the range in between. */
    void move_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon, int new_priority);
    /** @brief Delete an edge and close the gap it leaves. */
    void remove_proximity(const BeaconId& from_beacon, const BeaconId& to_beacon);

  private:
    /** @brief Copy the current snapshot for editing. */
    [[nodiscard]] std::shared_ptr<GraphSnapshot> clone_locked() const;
    /** @brief Publish an edited snapshot. */
    void publish_locked(std::shared_ptr<GraphSnapshot> edited);

    mutable std::mutex mutex_;
    GraphSnapshotPtr snapshot_;
};

}  // namespace campus_dispatch
