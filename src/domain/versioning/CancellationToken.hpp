/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag with an optional deadline.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include "VersioningErrors.hpp"

namespace clausetrail::domain::versioning {

/**
 * @class CancellationToken
 * @brief Shared handle polled by CPU-bound work.
 *
 * Copies share the same flag, so the caller keeps one copy and hands another
 * to the worker. A default-constructed token is never cancelled unless
 * cancel() is called on it or a copy.
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    /** @brief Token that expires once the given duration has elapsed. */
    static CancellationToken WithTimeout(std::chrono::milliseconds timeout) {
        CancellationToken token;
        token.m_deadline = std::chrono::steady_clock::now() + timeout;
        return token;
    }

    void cancel() { m_flag->store(true); }

    bool isCancelled() const {
        if (m_flag->load()) return true;
        return m_deadline && std::chrono::steady_clock::now() >= *m_deadline;
    }

    /** @brief Throws OperationCancelled if the token has fired. */
    void throwIfCancelled() const {
        if (m_flag->load()) {
            throw OperationCancelled();
        }
        if (m_deadline && std::chrono::steady_clock::now() >= *m_deadline) {
            throw OperationCancelled("Operation timed out");
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
};

} // namespace clausetrail::domain::versioning
