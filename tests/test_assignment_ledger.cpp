#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "campus_dispatch/assignment_ledger.hpp"
#include "campus_dispatch/errors.hpp"

using namespace campus_dispatch;

TEST_CASE("AssignmentLedger enforces one active binding per incident and per guard") {
    AssignmentLedger ledger{};
    const GuardAssignment first = ledger.activate(1, "g1");
    REQUIRE(first.is_active);

    SECTION("second guard on the same incident") {
        try {
            (void)ledger.activate(1, "g2");
            FAIL("expected IntegrityViolation");
        } catch (const IntegrityViolation& exc) {
            REQUIRE(exc.constraint() == IntegrityConstraint::ActiveAssignmentPerIncident);
        }
    }

    SECTION("same guard on a second incident") {
        try {
            (void)ledger.activate(2, "g1");
            FAIL("expected IntegrityViolation");
        } catch (const IntegrityViolation& exc) {
            REQUIRE(exc.constraint() == IntegrityConstraint::ActiveAssignmentPerGuard);
        }
    }

    SECTION("re-activating the same pair is a no-op") {
        REQUIRE(ledger.activate(1, "g1").identifier == first.identifier);
    }

    REQUIRE(ledger.active_count() == 1);
    REQUIRE(ledger.committed_guards() == std::set<GuardId>{"g1"});
}

TEST_CASE("AssignmentLedger reuses the record of a released pair") {
    AssignmentLedger ledger{};
    const GuardAssignment first = ledger.activate(7, "g1");

    const auto released = ledger.release_for_incident(7);
    REQUIRE(released.has_value());
    REQUIRE_FALSE(released->is_active);
    REQUIRE(released->released_at.has_value());
    REQUIRE_FALSE(ledger.active_for_guard("g1").has_value());
    REQUIRE_FALSE(ledger.release_for_incident(7).has_value());

    const GuardAssignment again = ledger.activate(7, "g1");
    REQUIRE(again.identifier == first.identifier);
    REQUIRE(again.is_active);
    REQUIRE_FALSE(again.released_at.has_value());
    REQUIRE(ledger.history_for(7).size() == 1);
}

TEST_CASE("AssignmentLedger reassign hands over atomically") {
    AssignmentLedger ledger{};
    (void)ledger.activate(1, "g1");
    (void)ledger.activate(2, "g3");

    const Reassignment handed_over = ledger.reassign(1, "g2");
    REQUIRE(handed_over.released.has_value());
    REQUIRE(handed_over.released->guard_id == "g1");
    REQUIRE(handed_over.assignment.guard_id == "g2");
    REQUIRE_FALSE(ledger.active_for_guard("g1").has_value());

    REQUIRE_THROWS_AS(ledger.reassign(1, "g3"), IntegrityViolation);
    REQUIRE(ledger.active_for_incident(1)->guard_id == "g2");
    REQUIRE(ledger.history_for(1).size() == 2);
}

TEST_CASE("AssignmentLedger admits exactly one of many racing activations") {
    AssignmentLedger ledger{};
    constexpr int k_thread_count = 8;
    std::atomic<bool> flag_start{false};
    std::atomic<int> winners{0};
    std::atomic<int> violations{0};

    std::vector<std::thread> list_threads;
    for (int index = 0; index < k_thread_count; ++index) {
        list_threads.emplace_back([&, index]() {
            while (!flag_start.load()) {
                std::this_thread::yield();
            }
            try {
                (void)ledger.activate(42, "guard-" + std::to_string(index));
                ++winners;
            } catch (const IntegrityViolation&) {
                ++violations;
            }
        });
    }
    flag_start.store(true);
    for (std::thread& worker : list_threads) {
        worker.join();
    }

    REQUIRE(winners.load() == 1);
    REQUIRE(violations.load() == k_thread_count - 1);
    REQUIRE(ledger.active_count() == 1);
    REQUIRE(ledger.history_for(42).size() == 1);
}
