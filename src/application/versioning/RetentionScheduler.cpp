/**
 * @file RetentionScheduler.cpp
 * @brief Implementation of RetentionScheduler.
 */

#include "application/versioning/RetentionScheduler.hpp"
#include <iostream>

namespace clausetrail::application::versioning {

RetentionScheduler::RetentionScheduler(std::shared_ptr<RetentionService> retention,
                                       int retentionDays,
                                       std::chrono::milliseconds interval)
    : m_retention(std::move(retention)), m_retentionDays(retentionDays), m_interval(interval) {}

RetentionScheduler::~RetentionScheduler() {
    stop();
}

void RetentionScheduler::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) return;
    m_running = true;
    m_worker = std::thread(&RetentionScheduler::workerLoop, this);
}

void RetentionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void RetentionScheduler::workerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            bool stopping = m_cv.wait_for(lock, m_interval, [this] { return !m_running; });
            if (stopping) {
                return; // Exit point
            }
        }

        // Sweep outside our lock
        runSweep();
    }
}

void RetentionScheduler::runSweep() {
    try {
        CleanupResult result = m_retention->cleanupOldVersions(m_retentionDays);
        ++m_completedSweeps;
        if (result.deletedVersions > 0 || result.deletedComparisons > 0) {
            std::cout << "[RetentionScheduler] Removed " << result.deletedVersions << " versions and "
                      << result.deletedComparisons << " comparisons older than "
                      << m_retentionDays << " days" << std::endl;
        }
    } catch (const std::exception& e) {
        ++m_failedSweeps;
        std::cerr << "[RetentionScheduler] Sweep failed, retrying next tick: " << e.what() << std::endl;
    }
}

} // namespace clausetrail::application::versioning
