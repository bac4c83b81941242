/**
 * @file RetentionScheduler.hpp
 * @brief Periodic background retention sweep.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include "application/versioning/RetentionService.hpp"

namespace clausetrail::application::versioning {

/**
 * @class RetentionScheduler
 * @brief Runs RetentionService::cleanupOldVersions every interval on its own thread.
 *
 * The thread only touches the repository inside a sweep; between ticks it
 * holds no locks, so version creation never waits on it.
 */
class RetentionScheduler {
public:
    RetentionScheduler(std::shared_ptr<RetentionService> retention,
                       int retentionDays,
                       std::chrono::milliseconds interval);
    ~RetentionScheduler();

    RetentionScheduler(const RetentionScheduler&) = delete;
    RetentionScheduler& operator=(const RetentionScheduler&) = delete;

    void start();

    /** @brief Wakes the worker and joins it. Safe to call twice. */
    void stop();

    bool isRunning() const { return m_running.load(); }
    size_t completedSweeps() const { return m_completedSweeps.load(); }
    size_t failedSweeps() const { return m_failedSweeps.load(); }

private:
    void workerLoop();
    void runSweep();

    std::shared_ptr<RetentionService> m_retention;
    int m_retentionDays;
    std::chrono::milliseconds m_interval;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};
    std::atomic<size_t> m_completedSweeps{0};
    std::atomic<size_t> m_failedSweeps{0};
};

} // namespace clausetrail::application::versioning
