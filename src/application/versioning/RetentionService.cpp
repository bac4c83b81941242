/**
 * @file RetentionService.cpp
 * @brief Implementation of RetentionService.
 */

#include "application/versioning/RetentionService.hpp"
#include "domain/versioning/VersioningErrors.hpp"
#include <string>

namespace clausetrail::application::versioning {

RetentionService::RetentionService(std::shared_ptr<IVersionRepository> repository, Clock clock)
    : m_repository(std::move(repository)), m_clock(std::move(clock)) {}

CleanupResult RetentionService::cleanupOldVersions(int retentionDays) {
    if (retentionDays < kMinRetentionDays || retentionDays > kMaxRetentionDays) {
        throw ValidationError("retentionDays must be between 1 and 365, got " + std::to_string(retentionDays));
    }

    CleanupResult result;
    result.cutoffDate = m_clock() - std::chrono::hours(24) * retentionDays;
    result.deletedVersions = m_repository->deleteVersionsOlderThan(result.cutoffDate);
    result.deletedComparisons = m_repository->deleteComparisonsOlderThan(result.cutoffDate);
    return result;
}

} // namespace clausetrail::application::versioning
