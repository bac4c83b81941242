/**
 * @file DocumentVersioningService.hpp
 * @brief Application Service exposing version lineage, comparison and statistics operations.
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/versioning/repositories/IVersionRepository.hpp"
#include "domain/versioning/CancellationToken.hpp"
#include "application/versioning/ComparisonCache.hpp"
#include "application/versioning/VersionStatisticsService.hpp"
#include "application/versioning/RetentionService.hpp"

namespace clausetrail::application::versioning {

/**
 * @class DocumentVersioningService
 * @brief Entry point for the surrounding service layer.
 *
 * Errors: NotFoundError for missing versions/comparisons, ValidationError for
 * requests that break lineage rules, OperationCancelled for diffs that ran
 * out of time. Storage errors propagate as thrown by the repository.
 */
class DocumentVersioningService {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DocumentVersioningService(std::shared_ptr<IVersionRepository> repository,
                              std::shared_ptr<ComparisonCache> cache,
                              std::shared_ptr<VersionStatisticsService> statistics,
                              std::shared_ptr<RetentionService> retention,
                              Clock clock,
                              std::chrono::milliseconds comparisonTimeout = std::chrono::milliseconds(0),
                              size_t defaultHistoryLimit = 10);

    /**
     * @brief Appends a version to the document's lineage.
     * @param parentVersionId Must name an existing version of the same document.
     * @throws ValidationError on an empty documentId or a parent from another document.
     * @throws NotFoundError if the parent does not exist.
     */
    DocumentVersion createVersion(const std::string& documentId,
                                  const std::string& filename,
                                  const DocumentMetadata& metadata,
                                  const std::optional<DocumentAnalysis>& analysis = std::nullopt,
                                  const std::optional<std::string>& parentVersionId = std::nullopt);

    /** @brief First page with the configured default page size, analysis stripped. */
    VersionHistory getVersionHistory(const std::string& documentId);
    VersionHistory getVersionHistory(const std::string& documentId, const HistoryOptions& options);

    std::optional<DocumentVersion> getVersion(const std::string& versionId);
    std::optional<DocumentVersion> getLatestVersion(const std::string& documentId);

    /**
     * @brief Cached comparison of an ordered pair.
     * @param token Caller's cancellation; when omitted the configured timeout applies.
     */
    DocumentComparison compareVersions(const std::string& originalVersionId,
                                       const std::string& comparedVersionId,
                                       const std::optional<CancellationToken>& token = std::nullopt);

    /** @throws NotFoundError if no comparison has that id. */
    DocumentComparison getComparison(const std::string& comparisonId);

    std::vector<VersionDifference> getVersionDifferences(const std::string& documentId);
    VersionStatistics getVersionStatistics(const std::string& documentId);

    /**
     * @brief Creates a new version whose content is copied from an older one.
     * @throws NotFoundError if the target is missing.
     * @throws ValidationError if the target belongs to another document.
     */
    DocumentVersion rollbackToVersion(const std::string& documentId,
                                      const std::string& targetVersionId,
                                      const std::string& filename);

    CleanupResult cleanupOldVersions(int retentionDays = 30);

private:
    CancellationToken effectiveToken(const std::optional<CancellationToken>& token) const;

    std::shared_ptr<IVersionRepository> m_repository;
    std::shared_ptr<ComparisonCache> m_cache;
    std::shared_ptr<VersionStatisticsService> m_statistics;
    std::shared_ptr<RetentionService> m_retention;
    Clock m_clock;
    std::chrono::milliseconds m_comparisonTimeout;
    size_t m_defaultHistoryLimit;
};

} // namespace clausetrail::application::versioning
