#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/errors.hpp"

using namespace campus_dispatch;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    campus_dispatch::test::ensure_logger_initialized();
    return true;
}();

std::vector<std::string> neighbours(const BeaconGraph& graph, const BeaconId& from_beacon) {
    std::vector<std::string> list_targets;
    for (const BeaconProximity& proximity : graph.snapshot()->proximities_from(from_beacon)) {
        list_targets.push_back(proximity.to_beacon + ":" + std::to_string(proximity.priority));
    }
    return list_targets;
}

void add_beacons(BeaconGraph& graph, const std::vector<std::string>& list_ids) {
    for (const std::string& beacon_id : list_ids) {
        graph.add_beacon(Beacon{beacon_id, beacon_id, "Library", 1, true});
    }
}
}  // namespace

TEST_CASE("BeaconGraph keeps sibling priorities dense through edits") {
    BeaconGraph graph{};
    add_beacons(graph, {"A", "B", "C", "D"});

    graph.insert_proximity("A", "B");
    graph.insert_proximity("A", "C");
    graph.insert_proximity("A", "D", 1);
    REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"D:1", "B:2", "C:3"});

    SECTION("move shifts the range in between") {
        graph.move_proximity("A", "C", 1);
        REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"C:1", "D:2", "B:3"});

        graph.move_proximity("A", "C", 10);
        REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"D:1", "B:2", "C:3"});
    }

    SECTION("remove closes the gap") {
        graph.remove_proximity("A", "D");
        REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"B:1", "C:2"});
    }

    SECTION("insert past the end is clamped") {
        graph.insert_proximity("B", "A", 7);
        REQUIRE(neighbours(graph, "B") == std::vector<std::string>{"A:1"});
    }

    REQUIRE(graph.snapshot()->priorities_dense());
}

TEST_CASE("BeaconGraph rejects invalid proximity edits") {
    BeaconGraph graph{};
    add_beacons(graph, {"A", "B"});
    graph.insert_proximity("A", "B");

    REQUIRE_THROWS_AS(graph.insert_proximity("A", "A"), ProximityError);
    REQUIRE_THROWS_AS(graph.insert_proximity("A", "B"), ProximityError);
    REQUIRE_THROWS_AS(graph.insert_proximity("A", "missing"), UnknownOrInactiveBeacon);
    REQUIRE_THROWS_AS(graph.insert_proximity("B", "A", 0), ProximityError);
    REQUIRE_THROWS_AS(graph.move_proximity("B", "A", 1), ProximityError);
    REQUIRE_THROWS_AS(graph.remove_proximity("B", "A"), ProximityError);
    REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"B:1"});
}

TEST_CASE("BeaconGraph beacon registration") {
    BeaconGraph graph{};
    add_beacons(graph, {"A"});

    REQUIRE_THROWS_AS(graph.add_beacon(Beacon{"A", "dup", "Library", 1, true}), std::invalid_argument);
    REQUIRE_THROWS_AS(graph.add_beacon(Beacon{"", "blank", "Library", 1, true}), std::invalid_argument);

    graph.set_beacon_active("A", false);
    REQUIRE(graph.snapshot()->find_beacon("A") != nullptr);
    REQUIRE_FALSE(graph.snapshot()->is_active_beacon("A"));
    REQUIRE_THROWS_AS(graph.set_beacon_active("missing", true), UnknownOrInactiveBeacon);
}

TEST_CASE("BeaconGraph removing a beacon drops edges pointing at it") {
    BeaconGraph graph{};
    add_beacons(graph, {"A", "B", "C"});
    graph.insert_proximity("A", "B");
    graph.insert_proximity("A", "C");
    graph.insert_proximity("B", "A");

    graph.remove_beacon("B");

    REQUIRE(graph.snapshot()->find_beacon("B") == nullptr);
    REQUIRE(neighbours(graph, "A") == std::vector<std::string>{"C:1"});
    REQUIRE(graph.snapshot()->proximities_from("B").empty());
    REQUIRE(graph.snapshot()->priorities_dense());
}

TEST_CASE("BeaconGraph snapshots are unaffected by later edits") {
    BeaconGraph graph{};
    add_beacons(graph, {"A", "B", "C"});
    graph.insert_proximity("A", "B");

    const GraphSnapshotPtr before = graph.snapshot();
    graph.insert_proximity("A", "C", 1);

    REQUIRE(before->proximities_from("A").size() == 1);
    REQUIRE(before->proximities_from("A").front().to_beacon == "B");
    REQUIRE(graph.snapshot()->proximities_from("A").size() == 2);
    REQUIRE(graph.snapshot()->proximities_from("A").front().to_beacon == "C");
}
