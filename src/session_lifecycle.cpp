#include "session_lifecycle.hpp"

#include <crow/logging.h>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

namespace arbundle {

SessionLifecycle::SessionLifecycle(const ServerConfig& config, const SessionRegistry& registry)
    : config(config), registry(registry), running(false), next_sweep(Clock::now()) {}

SessionLifecycle::~SessionLifecycle() {
    stop();
}

void SessionLifecycle::start() {
    if (!running.exchange(true)) {
        worker_thread = std::thread(&SessionLifecycle::workerLoop, this);
    }
}

void SessionLifecycle::stop() {
    if (running.exchange(false)) {
        cv.notify_one(); // Wake up the worker thread
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }
}

void SessionLifecycle::scheduleDeletion(const std::string& session_id) {
    scheduleDeletion(session_id, config.cleanup_delay);
}

void SessionLifecycle::scheduleDeletion(const std::string& session_id, Clock::duration delay) {
    if (!SessionRegistry::isValidSessionId(session_id)) {
        CROW_LOG_WARNING << "Refusing to schedule deletion for malformed session id";
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        deadlines[session_id] = Clock::now() + delay;
    }
    cv.notify_one();

    CROW_LOG_DEBUG << "Sandbox " << session_id << " scheduled for deletion in "
                   << std::chrono::duration_cast<std::chrono::milliseconds>(delay).count() << "ms";
}

bool SessionLifecycle::cancelDeletion(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex);
    return deadlines.erase(session_id) > 0;
}

bool SessionLifecycle::isDeletionScheduled(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex);
    return deadlines.find(session_id) != deadlines.end();
}

std::size_t SessionLifecycle::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return deadlines.size();
}

bool SessionLifecycle::discardNow(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        deadlines.erase(session_id);
    }
    return deleteSandbox(session_id);
}

void SessionLifecycle::workerLoop() {
    while (running) {
        runDueDeletions();

        if (config.sweep.enabled && Clock::now() >= next_sweep) {
            sweepExpired();
            next_sweep = Clock::now() + config.sweep.interval;
        }

        std::unique_lock<std::mutex> lock(mutex);
        if (!running) {
            break;
        }

        auto wake = Clock::time_point::max();
        for (const auto& entry : deadlines) {
            wake = std::min(wake, entry.second);
        }
        if (config.sweep.enabled) {
            wake = std::min(wake, next_sweep);
        }

        // Woken early by scheduleDeletion() and stop()
        if (wake == Clock::time_point::max()) {
            cv.wait(lock);
        } else {
            cv.wait_until(lock, wake);
        }
    }
}

void SessionLifecycle::runDueDeletions() {
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto now = Clock::now();
        for (auto it = deadlines.begin(); it != deadlines.end();) {
            if (it->second <= now) {
                due.push_back(it->first);
                it = deadlines.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& session_id : due) {
        deleteSandbox(session_id);
    }
}

std::size_t SessionLifecycle::sweepExpired() {
    const auto& root = registry.getTempRoot();
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return 0;
    }

    std::vector<std::string> expired;
    auto now = std::filesystem::file_time_type::clock::now();

    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        std::string name = entry.path().filename().string();
        if (!SessionRegistry::isValidSessionId(name) || !entry.is_directory(ec)) {
            continue;
        }
        auto modified = entry.last_write_time(ec);
        if (ec) {
            continue;
        }
        if (now - modified > config.sweep.max_age && !isDeletionScheduled(name)) {
            expired.push_back(name);
        }
    }

    std::size_t removed = 0;
    for (const auto& session_id : expired) {
        if (deleteSandbox(session_id)) {
            ++removed;
        }
    }

    if (removed > 0) {
        CROW_LOG_INFO << "Expiry sweep removed " << removed << " abandoned sandbox(es)";
    }
    return removed;
}

bool SessionLifecycle::deleteSandbox(const std::string& session_id) {
    auto sandbox = registry.sandboxPathFor(session_id);
    if (!sandbox) {
        return false;
    }

    std::error_code ec;
    std::filesystem::remove_all(*sandbox, ec);
    if (ec) {
        CROW_LOG_ERROR << "Failed to delete sandbox " << session_id << ": " << ec.message();
        return false;
    }

    CROW_LOG_INFO << "Sandbox " << session_id << " deleted";
    return true;
}

} // namespace arbundle
