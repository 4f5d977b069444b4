#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "server_config.hpp"
#include "session_registry.hpp"

namespace arbundle {

/**
 * Owns the deletion side of a sandbox's life.
 *
 * Deletions are scheduled tasks keyed by session id: scheduling again
 * moves the deadline (a repeated download extends the lifetime) and
 * cancelDeletion() withdraws it. A single worker thread carries them out.
 * Deletion is recursive and best-effort; a missing sandbox is not an error.
 *
 * Sandboxes whose archive is never downloaded are only removed by the
 * optional expiry sweep (cleanup.sweep in the configuration, off by default).
 */
class SessionLifecycle {
public:
    using Clock = std::chrono::steady_clock;

    SessionLifecycle(const ServerConfig& config, const SessionRegistry& registry);
    ~SessionLifecycle();

    SessionLifecycle(const SessionLifecycle&) = delete;
    SessionLifecycle& operator=(const SessionLifecycle&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running; }

    // Delete the sandbox after the configured cleanup delay
    void scheduleDeletion(const std::string& session_id);
    void scheduleDeletion(const std::string& session_id, Clock::duration delay);

    // Cancellation hook. Returns false if nothing was scheduled
    bool cancelDeletion(const std::string& session_id);

    bool isDeletionScheduled(const std::string& session_id) const;
    std::size_t pendingCount() const;

    /**
     * Delete now, dropping any scheduled deletion. Used on failure paths.
     * @return true if the sandbox is gone afterwards
     */
    bool discardNow(const std::string& session_id);

    /**
     * Delete sandboxes older than the sweep max-age that have no deletion
     * scheduled. Runs periodically when the sweep is enabled.
     * @return number of sandboxes removed
     */
    std::size_t sweepExpired();

private:
    const ServerConfig& config;
    const SessionRegistry& registry;

    std::map<std::string, Clock::time_point> deadlines;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::thread worker_thread;
    std::atomic<bool> running;
    Clock::time_point next_sweep;

    void workerLoop();
    void runDueDeletions();
    bool deleteSandbox(const std::string& session_id);
};

} // namespace arbundle
