/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace clausetrail::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
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

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    enqueue(FileTask{FileTask::Kind::Write, filename, content});
}

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    if (!perform(FileTask{FileTask::Kind::Write, filename, content})) {
        throw std::runtime_error("Failed to write " + filename);
    }
}

void PersistenceService::removeAsync(const std::string& filename) {
    enqueue(FileTask{FileTask::Kind::Remove, filename, {}});
}

void PersistenceService::enqueue(FileTask task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            // Worker is gone; run inline so nothing is silently dropped.
            perform(task);
            return;
        }
        m_queue.push(std::move(task));
    }
    m_cv.notify_one();
}

size_t PersistenceService::pendingCount() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] { return m_queue.empty() && !m_busy; });
}

void PersistenceService::workerLoop() {
    while (true) {
        FileTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return; // Exit point
            }

            if (m_queue.empty()) {
                continue; // Spurious wake up
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        perform(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

bool PersistenceService::perform(const FileTask& task) {
    bool ok = task.kind == FileTask::Kind::Write ? performAtomicWrite(task) : performRemove(task);
    if (!ok) ++m_failures;
    return ok;
}

bool PersistenceService::performAtomicWrite(const FileTask& task) {
    fs::path finalPath = task.filename;

    // Unique temp path: filename.<timestamp>.<seq>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(++m_tempCounter) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << task.content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Rename failed: " << e.what() << std::endl;
        std::error_code ec;
        fs::remove(tempPath, ec);
        return false;
    }
    return true;
}

bool PersistenceService::performRemove(const FileTask& task) {
    std::error_code ec;
    fs::remove(task.filename, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Remove failed for " << task.filename << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

} // namespace clausetrail::infrastructure
