#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

#include "campus_dispatch/configuration.hpp"
#include "campus_dispatch/dispatch_runtime.hpp"
#include "campus_dispatch/logging.hpp"
#include "campus_dispatch/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}

/**
 * @brief Seed a small demo campus: two buildings, four beacons, four guards.
 */
void seed_demo_campus(campus_dispatch::DispatchRuntime& runtime) {
    using namespace campus_dispatch;

    BeaconGraph& graph = runtime.beacon_graph();
    graph.add_beacon(Beacon{"library-1f", "Library 1F", "Library", 1, true});
    graph.add_beacon(Beacon{"library-3f", "Library 3F", "Library", 3, true});
    graph.add_beacon(Beacon{"science-2f", "Science Hall 2F", "Science Hall", 2, true});
    graph.add_beacon(Beacon{"gate-main", "Main Gate", "Grounds", 0, true});

    DispatchOrchestrator& orchestrator = runtime.orchestrator();
    orchestrator.insert_proximity("library-3f", "library-1f");
    orchestrator.insert_proximity("library-3f", "science-2f");
    orchestrator.insert_proximity("library-1f", "gate-main");
    orchestrator.insert_proximity("library-1f", "library-3f");
    orchestrator.insert_proximity("science-2f", "gate-main");
    orchestrator.insert_proximity("gate-main", "library-1f");

    GuardRegistry& guards = runtime.guard_registry();
    guards.register_guard(GuardProfile{"guard-ana", "Ana Reyes", true, true, true, std::string{"library-1f"}, std::nullopt});
    guards.register_guard(GuardProfile{"guard-ben", "Ben Okafor", true, true, true, std::string{"science-2f"}, std::nullopt});
    guards.register_guard(GuardProfile{"guard-chi", "Chi Nguyen", true, true, true, std::string{"gate-main"}, std::nullopt});
    guards.register_guard(GuardProfile{"guard-dev", "Dev Patel", false, true, true, std::string{"library-3f"}, std::nullopt});
}
}  // namespace

int main() {
    using namespace campus_dispatch;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("CAMPUS_DISPATCH_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        get_logger()->info("campus_dispatchd {} starting", k_version);

        DispatchRuntime runtime{std::move(configuration)};
        seed_demo_campus(runtime);
        runtime.run();

        const DispatchResult demo = runtime.orchestrator().handle_signal(
            "library-3f",
            SignalType::StudentSos,
            Actor{ActorKind::Student, "student-demo"}
        );
        get_logger()->info("Demo incident {} raised with {} alerts", demo.incident.identifier, demo.dispatch.alerts.size());

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
