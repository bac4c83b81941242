/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cstdint>

namespace clausetrail::infrastructure {

/**
 * @struct FileTask
 * @brief Represents a single queued file operation.
 */
struct FileTask {
    enum class Kind { Write, Remove };

    Kind kind = Kind::Write;
    std::string filename;
    std::string content; ///< Ignored for Remove.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes and removals sequentially.
 *
 * Queued operations run in FIFO order, so a removal queued after a write for
 * the same path always lands after it. saveText bypasses the queue and writes
 * on the caller's thread; callers must not mix it with queued writes to the
 * same path.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Writes atomically on the calling thread, never waiting on the queue.
     * @throws std::runtime_error if the write could not be completed.
     */
    void saveText(const std::string& filename, const std::string& content);

    /** @brief Asynchronously queues the removal of a file. Missing files are ignored. */
    void removeAsync(const std::string& filename);

    /** @brief Blocks until every task queued so far has been processed. */
    void flush();

    /** @brief Number of operations that failed since startup. */
    size_t failureCount() const { return m_failures.load(); }

    /** @brief Tasks queued but not yet picked up by the worker. */
    size_t pendingCount();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    void enqueue(FileTask task);
    bool perform(const FileTask& task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const FileTask& task);
    bool performRemove(const FileTask& task);

    // Thread Safety
    std::queue<FileTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_failures{0};
    std::atomic<std::uint64_t> m_tempCounter{0}; ///< Keeps concurrent temp names apart.
};

} // namespace clausetrail::infrastructure
