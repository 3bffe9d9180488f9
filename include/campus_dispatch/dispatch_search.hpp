// === Dispatch Search =========================================================
//
// Expanding-radius guard search. Starting at the incident's beacon, beacons
// are visited breadth-first with outgoing edges taken in ascending priority,
// collecting dispatchable guards until enough candidates are found.

#pragma once

#include <cstddef>
#include <set>
#include <vector>

#include "campus_dispatch/assignment_ledger.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/guard_registry.hpp"
#include "campus_dispatch/types.hpp"

namespace campus_dispatch {

/** @brief One step of the path from the incident beacon to a guard. */
struct RouteHop final {
    BeaconId beacon_id{};
    int edge_priority{};  /**< Priority of the edge entering this beacon; 0 at the origin. */
};

/** @brief A guard selected for alerting together with how it was reached. */
struct GuardCandidate final {
    GuardId guard_id{};
    BeaconId via_beacon{};    /**< Beacon the guard was standing at. */
    int hop_priority{};       /**< Priority of the edge into via_beacon; 0 at the origin. */
    std::vector<RouteHop> route{};
};

class DispatchSearch final {
  public:
    DispatchSearch(const BeaconGraph& beacon_graph, const GuardRegistry& guard_registry, const AssignmentLedger& assignment_ledger);

    /**
     * @brief Collect up to @p max_guards eligible guards nearest to @p origin.
     *
     * Guards in @p exclude, guards holding an active assignment, and guards
     * that are off duty, unavailable, disabled or unlocated are skipped. Guards
     * at one beacon are taken in ascending id order. The search works on a
     * single graph snapshot, so concurrent proximity edits never tear it.
     *
     * @throws UnknownOrInactiveBeacon when @p origin is not in the graph.
     */
    [[nodiscard]] std::vector<GuardCandidate> find_candidate_guards(
        const BeaconId& origin,
        std::size_t max_guards,
        const std::set<GuardId>& exclude = {}
    ) const;

  private:
    const BeaconGraph& beacon_graph_;
    const GuardRegistry& guard_registry_;
    const AssignmentLedger& assignment_ledger_;
};

}  // namespace campus_dispatch
