#include "campus_dispatch/dispatch_runtime.hpp"

#include <chrono>
#include <stdexcept>

#include "campus_dispatch/logging.hpp"

namespace campus_dispatch {

namespace {

std::unique_ptr<Notifier> make_notifier(std::unique_ptr<Notifier> notifier) {
    if (notifier == nullptr) {
        return std::make_unique<LoggingNotifier>();
    }
    return notifier;
}

}  // namespace

DispatchRuntime::DispatchRuntime(Configuration configuration, std::unique_ptr<Notifier> notifier)
    : configuration_(std::move(configuration)),
      beacon_graph_(),
      guard_registry_(beacon_graph_),
      audit_log_(),
      notifier_(make_notifier(std::move(notifier))),
      orchestrator_(configuration_.dispatch, beacon_graph_, guard_registry_, *notifier_, audit_log_),
      logger_(get_logger("runtime")) {}

DispatchRuntime::~DispatchRuntime() {
    shutdown();
}

/**
 * @brief Start the background sweep thread.
 */
void DispatchRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting dispatch runtime (sweep every {}s)", configuration_.dispatch.sweep_interval.count());
    sweep_thread_ = std::thread(&DispatchRuntime::sweep_loop, this);
}

/**
 * @brief Signal the sweeper to stop and wait for it.
 */
void DispatchRuntime::shutdown() {
    {
        std::scoped_lock lock(sweep_mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    logger_->info("Shutting down dispatch runtime");
    sweep_wakeup_.notify_all();
    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

BeaconGraph& DispatchRuntime::beacon_graph() noexcept {
    return beacon_graph_;
}

GuardRegistry& DispatchRuntime::guard_registry() noexcept {
    return guard_registry_;
}

DispatchOrchestrator& DispatchRuntime::orchestrator() noexcept {
    return orchestrator_;
}

const AuditLog& DispatchRuntime::audit_log() const noexcept {
    return audit_log_;
}

bool DispatchRuntime::is_running() const noexcept {
    return flag_running_.load();
}

void DispatchRuntime::sweep_loop() {
    const auto sweep_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration_.dispatch.sweep_interval);
    while (flag_running_.load()) {
        {
            std::unique_lock lock(sweep_mutex_);
            sweep_wakeup_.wait_for(lock, sweep_interval, [this]() {
                return !flag_running_.load();
            });
        }
        if (!flag_running_.load()) {
            break;
        }
        try {
            const EscalationSummary summary = orchestrator_.expire_due_alerts(SteadyClock::now());
            if (summary.failed > 0) {
                logger_->warn("Sweep finished with {} failed expirations", summary.failed);
            }
        } catch (const std::exception& exc) {
            logger_->error("Sweep loop error: {}", exc.what());
        }
    }
}

}  // namespace campus_dispatch
