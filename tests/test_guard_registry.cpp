#include <optional>
#include <stdexcept>
#include <string>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/errors.hpp"
#include "campus_dispatch/guard_registry.hpp"

using namespace campus_dispatch;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    campus_dispatch::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("GuardRegistry tracks location pings on active beacons only") {
    BeaconGraph graph{};
    graph.add_beacon(Beacon{"lobby", "Lobby", "Admin", 0, true});
    graph.add_beacon(Beacon{"roof", "Roof", "Admin", 5, false});
    GuardRegistry registry{graph};

    registry.register_guard(GuardProfile{"g1", "Guard One", true, true, true, std::nullopt, std::nullopt});
    REQUIRE_FALSE(registry.guard("g1").is_dispatchable());

    registry.update_location("g1", "lobby");
    const GuardProfile located = registry.guard("g1");
    REQUIRE(located.current_beacon == std::optional<BeaconId>{"lobby"});
    REQUIRE(located.last_beacon_update.has_value());
    REQUIRE(located.is_dispatchable());

    REQUIRE_THROWS_AS(registry.update_location("g1", "roof"), UnknownOrInactiveBeacon);
    REQUIRE_THROWS_AS(registry.update_location("g1", "missing"), UnknownOrInactiveBeacon);
    REQUIRE_THROWS_AS(registry.update_location("nobody", "lobby"), UnknownGuard);
    REQUIRE(registry.guard("g1").current_beacon == std::optional<BeaconId>{"lobby"});
}

TEST_CASE("GuardRegistry registration and flags") {
    BeaconGraph graph{};
    graph.add_beacon(Beacon{"lobby", "Lobby", "Admin", 0, true});
    GuardRegistry registry{graph};

    registry.register_guard(GuardProfile{"g2", "Guard Two", true, true, true, std::string{"lobby"}, std::nullopt});
    registry.register_guard(GuardProfile{"g1", "Guard One", true, true, true, std::string{"lobby"}, std::nullopt});

    REQUIRE_THROWS_AS(registry.register_guard(GuardProfile{"g1", "Again", true, true, true, std::nullopt, std::nullopt}), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.register_guard(GuardProfile{"", "Blank", true, true, true, std::nullopt, std::nullopt}), std::invalid_argument);
    REQUIRE_THROWS_AS(registry.register_guard(GuardProfile{"g9", "Lost", true, true, true, std::string{"missing"}, std::nullopt}), UnknownOrInactiveBeacon);
    REQUIRE_THROWS_AS(registry.guard("g9"), UnknownGuard);

    const auto list_guards = registry.snapshot();
    REQUIRE(list_guards.size() == 2);
    REQUIRE(list_guards[0].identifier == "g1");
    REQUIRE(list_guards[1].identifier == "g2");

    registry.set_available("g1", false);
    REQUIRE_FALSE(registry.guard("g1").is_dispatchable());
    registry.set_available("g1", true);
    registry.set_on_duty("g1", false);
    REQUIRE_FALSE(registry.guard("g1").is_dispatchable());

    REQUIRE(registry.clear_locations_at("lobby") == 2);
    REQUIRE_FALSE(registry.guard("g2").current_beacon.has_value());
}
