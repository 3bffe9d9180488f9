// === Dispatch Runtime ========================================================
//
// Owns the long-lived engine state (beacon graph, guard registry, audit log,
// notifier, orchestrator) and the background sweep that expires overdue guard
// alerts so incidents keep escalating without any guard action.

#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "campus_dispatch/audit_log.hpp"
#include "campus_dispatch/beacon_graph.hpp"
#include "campus_dispatch/configuration.hpp"
#include "campus_dispatch/dispatch_orchestrator.hpp"
#include "campus_dispatch/guard_registry.hpp"
#include "campus_dispatch/notifier.hpp"

namespace campus_dispatch {

/** @brief Process-level owner of the dispatch engine and its sweeper thread. */
class DispatchRuntime final {
  public:
    /** @brief Build the engine; a null @p notifier selects LoggingNotifier. */
    explicit DispatchRuntime(Configuration configuration, std::unique_ptr<Notifier> notifier = nullptr);
    ~DispatchRuntime();

    DispatchRuntime(const DispatchRuntime&) = delete;
    DispatchRuntime& operator=(const DispatchRuntime&) = delete;

    /** @brief Start the overdue-alert sweeper. */
    void run();
    /** @brief Stop and join the sweeper. Safe to call more than once. */
    void shutdown();

    [[nodiscard]] BeaconGraph& beacon_graph() noexcept;
    [[nodiscard]] GuardRegistry& guard_registry() noexcept;
    [[nodiscard]] DispatchOrchestrator& orchestrator() noexcept;
    [[nodiscard]] const AuditLog& audit_log() const noexcept;
    [[nodiscard]] bool is_running() const noexcept;

  private:
    /** @brief Sleeps for one sweep interval between passes; wakes early on shutdown. */
    void sweep_loop();

    Configuration configuration_;
    BeaconGraph beacon_graph_;
    GuardRegistry guard_registry_;
    AuditLog audit_log_;
    std::unique_ptr<Notifier> notifier_;
    DispatchOrchestrator orchestrator_;
    std::atomic<bool> flag_running_{false};
    std::mutex sweep_mutex_;
    std::condition_variable sweep_wakeup_;
    std::thread sweep_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace campus_dispatch
