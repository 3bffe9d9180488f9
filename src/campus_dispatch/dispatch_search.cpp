#include "campus_dispatch/dispatch_search.hpp"

#include <deque>
#include <map>
#include <unordered_set>

#include "campus_dispatch/errors.hpp"
#include "campus_dispatch/logging.hpp"

namespace campus_dispatch {

namespace {

/** @brief Frontier entry: beacon to visit and the path that reached it. */
struct PendingVisit final {
    BeaconId beacon_id{};
    std::vector<RouteHop> route{};
};

}  // namespace

DispatchSearch::DispatchSearch(const BeaconGraph& beacon_graph, const GuardRegistry& guard_registry, const AssignmentLedger& assignment_ledger)
    : beacon_graph_(beacon_graph),
      guard_registry_(guard_registry),
      assignment_ledger_(assignment_ledger) {}

std::vector<GuardCandidate> DispatchSearch::find_candidate_guards(
    const BeaconId& origin,
    std::size_t max_guards,
    const std::set<GuardId>& exclude
) const {
    const GraphSnapshotPtr graph = beacon_graph_.snapshot();
    if (graph->find_beacon(origin) == nullptr) {
        throw UnknownOrInactiveBeacon(origin);
    }

    std::vector<GuardCandidate> list_candidates;
    if (max_guards == 0) {
        return list_candidates;
    }

    const std::set<GuardId> set_committed = assignment_ledger_.committed_guards();
    std::map<BeaconId, std::vector<GuardId>> map_guards_by_beacon;
    for (const GuardProfile& profile : guard_registry_.snapshot()) {
        if (!profile.is_dispatchable()) {
            continue;
        }
        if (exclude.count(profile.identifier) > 0 || set_committed.count(profile.identifier) > 0) {
            continue;
        }
        // snapshot() is id-ordered, so each bucket stays sorted.
        map_guards_by_beacon[profile.current_beacon.value()].push_back(profile.identifier);
    }

    std::unordered_set<BeaconId> set_visited;
    std::deque<PendingVisit> queue_frontier;
    queue_frontier.push_back(PendingVisit{origin, {RouteHop{origin, 0}}});

    while (!queue_frontier.empty() && list_candidates.size() < max_guards) {
        PendingVisit visit = std::move(queue_frontier.front());
        queue_frontier.pop_front();
        if (!set_visited.insert(visit.beacon_id).second) {
            continue;
        }

        const auto iterator_bucket = map_guards_by_beacon.find(visit.beacon_id);
        if (iterator_bucket != map_guards_by_beacon.end()) {
            for (const GuardId& guard_id : iterator_bucket->second) {
                if (list_candidates.size() >= max_guards) {
                    break;
                }
                list_candidates.push_back(GuardCandidate{
                    guard_id,
                    visit.beacon_id,
                    visit.route.back().edge_priority,
                    visit.route
                });
            }
        }

        if (list_candidates.size() >= max_guards) {
            break;
        }
        for (const BeaconProximity& proximity : graph->proximities_from(visit.beacon_id)) {
            if (set_visited.count(proximity.to_beacon) > 0) {
                continue;
            }
            std::vector<RouteHop> next_route = visit.route;
            next_route.push_back(RouteHop{proximity.to_beacon, proximity.priority});
            queue_frontier.push_back(PendingVisit{proximity.to_beacon, std::move(next_route)});
        }
    }

    get_logger("dispatch_search")->debug(
        R"({{"origin":"{}","requested":{},"found":{},"visited":{}}})",
        origin,
        max_guards,
        list_candidates.size(),
        set_visited.size()
    );
    return list_candidates;
}

}  // namespace campus_dispatch
