/**
 * @file RetentionService.hpp
 * @brief Deletes versions and comparisons older than a retention window.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include "domain/versioning/repositories/IVersionRepository.hpp"

namespace clausetrail::application::versioning {

using namespace clausetrail::domain::versioning;

struct CleanupResult {
    size_t deletedVersions = 0;
    size_t deletedComparisons = 0;
    std::chrono::system_clock::time_point cutoffDate;
};

class RetentionService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int kMinRetentionDays = 1;
    static constexpr int kMaxRetentionDays = 365;

    RetentionService(std::shared_ptr<IVersionRepository> repository, Clock clock);

    /**
     * @brief Removes rows stamped before now - retentionDays. Running it twice is harmless.
     * @throws ValidationError if retentionDays is outside 1..365.
     */
    CleanupResult cleanupOldVersions(int retentionDays);

private:
    std::shared_ptr<IVersionRepository> m_repository;
    Clock m_clock;
};

} // namespace clausetrail::application::versioning
