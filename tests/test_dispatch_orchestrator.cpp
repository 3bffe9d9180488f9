#include <atomic>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "campus_fixture.hpp"
#include "campus_dispatch/errors.hpp"

using namespace campus_dispatch;
using campus_dispatch::test::CampusFixture;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    campus_dispatch::test::ensure_logger_initialized();
    return true;
}();

SignalRequest ai_request(const BeaconId& beacon_id, SignalType type, std::optional<double> confidence) {
    SignalRequest request{};
    request.beacon_id = beacon_id;
    request.type = type;
    request.actor = Actor{ActorKind::AiDetector, "camera-7"};
    request.details.confidence = confidence;
    return request;
}

DispatchConfig single_guard_config() {
    DispatchConfig config{};
    config.alert_policy.max_guards = 1;
    return config;
}
}  // namespace

TEST_CASE("Library-3F: a panic press merges into the open SOS incident") {
    CampusFixture campus{};
    campus.add_beacon("Library-3F");
    campus.add_guard("g1", "Library-3F");

    const DispatchResult sos = campus.sos("Library-3F");
    REQUIRE(sos.was_created);
    REQUIRE(sos.incident.status == IncidentStatus::Created);
    REQUIRE(sos.incident.signal_ids.size() == 1);
    REQUIRE(sos.dispatch.alerts.size() == 1);

    const DispatchResult panic =
        campus.orchestrator.handle_signal("Library-3F", SignalType::PanicButton, Actor{ActorKind::Device, "panic-3f"});
    REQUIRE_FALSE(panic.was_created);
    REQUIRE(panic.incident.identifier == sos.incident.identifier);
    REQUIRE(panic.incident.signal_ids.size() == 2);
    REQUIRE(panic.incident.priority == IncidentPriority::Critical);
    REQUIRE(panic.dispatch.alerts.empty());
    REQUIRE(campus.orchestrator.alerts().alerts_for(sos.incident.identifier).size() == 1);
}

TEST_CASE("Concurrent signals on one beacon yield one incident and one dispatch") {
    CampusFixture campus{};
    campus_dispatch::test::seed_hall_campus(campus);
    constexpr int k_thread_count = 5;
    std::atomic<bool> flag_start{false};
    std::atomic<int> created_count{0};

    std::vector<std::thread> list_threads;
    for (int index = 0; index < k_thread_count; ++index) {
        list_threads.emplace_back([&, index]() {
            while (!flag_start.load()) {
                std::this_thread::yield();
            }
            const DispatchResult result = index % 2 == 0
                ? campus.sos("hall")
                : campus.orchestrator.handle_signal("hall", SignalType::PanicButton, Actor{ActorKind::Anonymous, ""});
            if (result.was_created) {
                ++created_count;
            }
        });
    }
    flag_start.store(true);
    for (std::thread& worker : list_threads) {
        worker.join();
    }

    REQUIRE(created_count.load() == 1);
    REQUIRE(campus.orchestrator.incidents().incident_count() == 1);
    const auto open_incident = campus.orchestrator.incidents().open_incident_at("hall");
    REQUIRE(open_incident.has_value());
    REQUIRE(open_incident->signal_ids.size() == 5);
    REQUIRE(campus.orchestrator.alerts().alerts_for(open_incident->identifier).size() == 3);
}

TEST_CASE("Signal sources are checked against the actor kind") {
    CampusFixture campus{};
    campus.add_beacon("lab");

    REQUIRE_THROWS_AS(
        campus.orchestrator.handle_signal("lab", SignalType::StudentSos, Actor{ActorKind::Device, "panic-1"}),
        InvalidSignalSource
    );
    REQUIRE_THROWS_AS(
        campus.orchestrator.handle_signal("lab", SignalType::PanicButton, Actor{ActorKind::Student, "s-1"}),
        InvalidSignalSource
    );
    REQUIRE_THROWS_AS(
        campus.orchestrator.handle_signal("lab", SignalType::AiAudio, Actor{ActorKind::Guard, "g-1"}),
        InvalidSignalSource
    );
    REQUIRE(campus.orchestrator.incidents().incident_count() == 0);

    const DispatchResult report =
        campus.orchestrator.handle_signal("lab", SignalType::StudentReport, Actor{ActorKind::Guard, "g-1"});
    REQUIRE(report.was_created);
    REQUIRE(report.dispatch.no_candidate_guards);
    REQUIRE(campus.audit_log.count(report.incident.identifier, AuditEventKind::AllGuardsExhausted) == 1);
}

TEST_CASE("AI detections must clear their confidence threshold") {
    CampusFixture campus{};
    campus.add_beacon("quad");

    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, 0.5)), LowConfidenceDetection);
    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, std::nullopt)), LowConfidenceDetection);
    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiAudio, 0.79)), LowConfidenceDetection);
    REQUIRE_THROWS_AS(
        campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, std::numeric_limits<double>::quiet_NaN())),
        LowConfidenceDetection
    );
    REQUIRE_THROWS_AS(
        campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, std::numeric_limits<double>::infinity())),
        LowConfidenceDetection
    );
    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, 7.5)), LowConfidenceDetection);
    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiAudio, -0.2)), LowConfidenceDetection);
    REQUIRE(campus.orchestrator.incidents().incident_count() == 0);

    const DispatchResult vision = campus.orchestrator.handle_signal(ai_request("quad", SignalType::AiVision, 0.91));
    REQUIRE(vision.was_created);
    REQUIRE(vision.incident.priority == IncidentPriority::Critical);
    REQUIRE(vision.signal.details.confidence == std::optional<double>{0.91});

    REQUIRE_THROWS_AS(campus.orchestrator.handle_signal(ai_request("unknown", SignalType::AiVision, 0.99)), UnknownOrInactiveBeacon);
}

TEST_CASE("Orchestrator rejects confidence thresholds outside [0, 1]") {
    BeaconGraph graph{};
    GuardRegistry guards{graph};
    AuditLog audit_log{};
    campus_dispatch::test::RecordingNotifier notifier{};
    DispatchConfig config{};
    config.ai_audio_threshold = 1.5;

    REQUIRE_THROWS_AS(DispatchOrchestrator(config, graph, guards, notifier, audit_log), std::invalid_argument);
}

TEST_CASE("Buzzer status follows the incident lifecycle") {
    CampusFixture campus{single_guard_config()};
    campus_dispatch::test::seed_hall_campus(campus);
    REQUIRE(campus.orchestrator.buzzer_status("hall") == BuzzerStatus::Inactive);

    const DispatchResult result = campus.sos("hall");
    REQUIRE(campus.orchestrator.buzzer_status("hall") == BuzzerStatus::Pending);

    const GuardAlert& first = result.dispatch.alerts.front();
    REQUIRE(campus.orchestrator.accept_alert(first.identifier, first.guard_id).outcome == AlertOutcome::Accepted);
    REQUIRE(campus.orchestrator.buzzer_status("hall") == BuzzerStatus::Active);

    REQUIRE_THROWS_AS(campus.orchestrator.start_response(result.incident.identifier, "g3"), GuardMismatch);
    const Incident responding = campus.orchestrator.start_response(result.incident.identifier, first.guard_id);
    REQUIRE(responding.status == IncidentStatus::InProgress);
    REQUIRE(campus.orchestrator.buzzer_status("hall") == BuzzerStatus::Acknowledged);

    const Incident resolved = campus.orchestrator.resolve_incident(result.incident.identifier, first.guard_id, "Student escorted home");
    REQUIRE(resolved.status == IncidentStatus::Resolved);
    REQUIRE(campus.orchestrator.buzzer_status("hall") == BuzzerStatus::Inactive);
}

TEST_CASE("Resolving an incident releases its guard and frees the beacon") {
    CampusFixture campus{};
    campus_dispatch::test::seed_hall_campus(campus);
    const DispatchResult result = campus.sos("hall");
    const GuardAlert& first = result.dispatch.alerts.front();
    (void)campus.orchestrator.accept_alert(first.identifier, first.guard_id);

    REQUIRE_THROWS_AS(campus.orchestrator.resolve_incident(result.incident.identifier, "admin", ""), MissingResolutionNotes);

    (void)campus.orchestrator.resolve_incident(result.incident.identifier, "admin", "Handled");
    REQUIRE_FALSE(campus.orchestrator.assignments().active_for_guard(first.guard_id).has_value());
    REQUIRE(campus.audit_log.count(result.incident.identifier, AuditEventKind::IncidentResolved) == 1);
    REQUIRE(campus.audit_log.count(result.incident.identifier, AuditEventKind::GuardUnassigned) == 1);
    REQUIRE_THROWS_AS(
        campus.orchestrator.resolve_incident(result.incident.identifier, "admin", "Again"),
        InvalidStatusTransition
    );

    const DispatchResult next = campus.sos("hall");
    REQUIRE(next.was_created);
    REQUIRE(next.incident.identifier != result.incident.identifier);
    REQUIRE(next.dispatch.alerts.front().guard_id == first.guard_id);
}

TEST_CASE("Resolving stands down alerts that are still pending") {
    CampusFixture campus{};
    campus_dispatch::test::seed_hall_campus(campus);
    const DispatchResult result = campus.sos("hall");

    (void)campus.orchestrator.resolve_incident(result.incident.identifier, "admin", "Duplicate report");
    for (const GuardAlert& guard_alert : campus.orchestrator.alerts().alerts_for(result.incident.identifier)) {
        REQUIRE(guard_alert.status == AlertStatus::Expired);
    }
    const AlertResult late = campus.orchestrator.accept_alert(result.dispatch.alerts.front().identifier, "g1");
    REQUIRE(late.outcome == AlertOutcome::StaleOrTerminal);
}

TEST_CASE("Manual assignment overrides the alert flow") {
    CampusFixture campus{};
    campus_dispatch::test::seed_hall_campus(campus);
    const DispatchResult result = campus.sos("hall");
    const IncidentId incident_id = result.incident.identifier;

    const GuardAssignment manual = campus.orchestrator.assign_guard(incident_id, "g4");
    REQUIRE(manual.guard_id == "g4");
    REQUIRE(campus.orchestrator.incidents().incident(incident_id).assigned_guard == std::optional<GuardId>{"g4"});
    for (const GuardAlert& guard_alert : campus.orchestrator.alerts().alerts_for(incident_id)) {
        REQUIRE(guard_alert.status == AlertStatus::Expired);
    }

    SECTION("assigning the same guard again keeps the binding") {
        REQUIRE(campus.orchestrator.assign_guard(incident_id, "g4").identifier == manual.identifier);
    }

    SECTION("reassigning releases the previous guard") {
        const GuardAssignment replacement = campus.orchestrator.assign_guard(incident_id, "g1");
        REQUIRE(replacement.guard_id == "g1");
        REQUIRE_FALSE(campus.orchestrator.assignments().active_for_guard("g4").has_value());
        REQUIRE(campus.audit_log.count(incident_id, AuditEventKind::GuardUnassigned) == 1);
    }

    SECTION("unavailable guards are refused") {
        campus.guards.set_on_duty("g2", false);
        REQUIRE_THROWS_AS(campus.orchestrator.assign_guard(incident_id, "g2"), GuardUnavailable);
        REQUIRE_THROWS_AS(campus.orchestrator.assign_guard(incident_id, "nobody"), UnknownGuard);

        campus.add_beacon("annex");
        const DispatchResult other = campus.sos("annex");
        REQUIRE_THROWS_AS(campus.orchestrator.assign_guard(other.incident.identifier, "g4"), GuardUnavailable);
        REQUIRE(campus.orchestrator.assignments().active_for_guard("g4")->incident_id == incident_id);
    }
}

TEST_CASE("Unassigning re-dispatches to guards not yet alerted") {
    CampusFixture campus{single_guard_config()};
    campus_dispatch::test::seed_hall_campus(campus);
    const DispatchResult result = campus.sos("hall");
    const GuardAlert& first = result.dispatch.alerts.front();
    REQUIRE(first.guard_id == "g1");
    (void)campus.orchestrator.accept_alert(first.identifier, "g1");

    const DispatchBatch batch = campus.orchestrator.unassign_guard(result.incident.identifier);
    REQUIRE_FALSE(batch.skipped);
    REQUIRE(batch.alerts.size() == 1);
    REQUIRE(batch.alerts.front().guard_id == "g2");
    REQUIRE(batch.alerts.front().priority_rank == 2);

    const Incident incident = campus.orchestrator.incidents().incident(result.incident.identifier);
    REQUIRE(incident.status == IncidentStatus::Created);
    REQUIRE_FALSE(incident.assigned_guard.has_value());
    REQUIRE_THROWS_AS(campus.orchestrator.unassign_guard(result.incident.identifier), InvalidStatusTransition);
}

TEST_CASE("Beacon admin edits go through the orchestrator") {
    CampusFixture campus{};
    campus.add_beacon("hub");
    campus.add_beacon("east");
    campus.add_beacon("west");
    campus.add_guard("g-west", "west");

    campus.orchestrator.insert_proximity("hub", "east");
    campus.orchestrator.insert_proximity("hub", "west", 1);
    REQUIRE(campus.graph.snapshot()->proximities_from("hub").front().to_beacon == "west");
    campus.orchestrator.move_proximity("hub", "west", 2);
    REQUIRE(campus.graph.snapshot()->proximities_from("hub").front().to_beacon == "east");
    campus.orchestrator.remove_proximity("hub", "east");
    REQUIRE(campus.graph.snapshot()->proximities_from("hub").size() == 1);

    const DispatchResult result = campus.sos("hub");
    REQUIRE(result.dispatch.alerts.front().guard_id == "g-west");
    REQUIRE_THROWS_AS(campus.orchestrator.retire_beacon("hub"), BeaconInUse);

    campus.orchestrator.retire_beacon("west");
    REQUIRE(campus.graph.snapshot()->find_beacon("west") == nullptr);
    REQUIRE(campus.graph.snapshot()->proximities_from("hub").empty());
    REQUIRE_FALSE(campus.guards.guard("g-west").current_beacon.has_value());
}

TEST_CASE("Orchestrator rejects non-finite thresholds and deadlines") {
    BeaconGraph graph{};
    GuardRegistry guards{graph};
    AuditLog audit_log{};
    campus_dispatch::test::RecordingNotifier notifier{};
    DispatchConfig config{};
    config.ai_vision_threshold = std::numeric_limits<double>::quiet_NaN();

    REQUIRE_THROWS_AS(DispatchOrchestrator(config, graph, guards, notifier, audit_log), std::invalid_argument);

    DispatchConfig endless{};
    endless.alert_policy.response_deadline = Duration{std::numeric_limits<double>::infinity()};
    REQUIRE_THROWS_AS(DispatchOrchestrator(endless, graph, guards, notifier, audit_log), std::invalid_argument);
}

TEST_CASE("Disabling a beacon through the orchestrator stops new incidents there") {
    CampusFixture campus{};
    campus.add_beacon("annex");

    campus.orchestrator.set_beacon_active("annex", false);
    REQUIRE_THROWS_AS(campus.sos("annex"), UnknownOrInactiveBeacon);
    REQUIRE(campus.orchestrator.incidents().incident_count() == 0);

    campus.orchestrator.set_beacon_active("annex", true);
    REQUIRE(campus.sos("annex").was_created);
}

TEST_CASE("Retiring a beacon never leaves an incident on a missing beacon") {
    CampusFixture campus{};
    constexpr int k_rounds = 50;

    for (int round = 0; round < k_rounds; ++round) {
        const BeaconId beacon_id = "kiosk-" + std::to_string(round);
        campus.add_beacon(beacon_id);
        std::atomic<bool> flag_start{false};
        std::atomic<bool> flag_signal_rejected{false};
        std::atomic<bool> flag_retire_rejected{false};

        std::thread signal_thread([&]() {
            while (!flag_start.load()) {
                std::this_thread::yield();
            }
            try {
                (void)campus.sos(beacon_id);
            } catch (const UnknownOrInactiveBeacon&) {
                flag_signal_rejected.store(true);
            }
        });
        std::thread retire_thread([&]() {
            while (!flag_start.load()) {
                std::this_thread::yield();
            }
            try {
                campus.orchestrator.retire_beacon(beacon_id);
            } catch (const BeaconInUse&) {
                flag_retire_rejected.store(true);
            }
        });
        flag_start.store(true);
        signal_thread.join();
        retire_thread.join();

        const bool beacon_exists = campus.graph.snapshot()->find_beacon(beacon_id) != nullptr;
        const bool has_incident = campus.orchestrator.incidents().has_incidents_at(beacon_id);
        REQUIRE(flag_signal_rejected.load() != flag_retire_rejected.load());
        REQUIRE(beacon_exists == has_incident);
        REQUIRE(beacon_exists == flag_retire_rejected.load());
    }
}
