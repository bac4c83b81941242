/**
 * @file DocumentVersioningService.cpp
 * @brief Implementation of DocumentVersioningService.
 */

#include "application/versioning/DocumentVersioningService.hpp"
#include "domain/versioning/VersioningErrors.hpp"

namespace clausetrail::application::versioning {

DocumentVersioningService::DocumentVersioningService(std::shared_ptr<IVersionRepository> repository,
                                                     std::shared_ptr<ComparisonCache> cache,
                                                     std::shared_ptr<VersionStatisticsService> statistics,
                                                     std::shared_ptr<RetentionService> retention,
                                                     Clock clock,
                                                     std::chrono::milliseconds comparisonTimeout,
                                                     size_t defaultHistoryLimit)
    : m_repository(std::move(repository)),
      m_cache(std::move(cache)),
      m_statistics(std::move(statistics)),
      m_retention(std::move(retention)),
      m_clock(std::move(clock)),
      m_comparisonTimeout(comparisonTimeout),
      m_defaultHistoryLimit(defaultHistoryLimit) {}

DocumentVersion DocumentVersioningService::createVersion(const std::string& documentId,
                                                         const std::string& filename,
                                                         const DocumentMetadata& metadata,
                                                         const std::optional<DocumentAnalysis>& analysis,
                                                         const std::optional<std::string>& parentVersionId) {
    if (documentId.empty()) {
        throw ValidationError("documentId must not be empty");
    }

    if (parentVersionId) {
        auto parent = m_repository->getVersionById(*parentVersionId);
        if (!parent) {
            throw NotFoundError("Parent version not found: " + *parentVersionId);
        }
        if (parent->documentId != documentId) {
            throw ValidationError("Parent version " + *parentVersionId + " belongs to another document");
        }
    }

    NewVersion request;
    request.documentId = documentId;
    request.filename = filename;
    request.metadata = metadata;
    request.analysis = analysis;
    request.parentVersionId = parentVersionId;
    return m_repository->createVersion(request, m_clock());
}

VersionHistory DocumentVersioningService::getVersionHistory(const std::string& documentId) {
    HistoryOptions options;
    options.limit = m_defaultHistoryLimit;
    return getVersionHistory(documentId, options);
}

VersionHistory DocumentVersioningService::getVersionHistory(const std::string& documentId, const HistoryOptions& options) {
    return m_statistics->getVersionHistory(documentId, options);
}

std::optional<DocumentVersion> DocumentVersioningService::getVersion(const std::string& versionId) {
    return m_repository->getVersionById(versionId);
}

std::optional<DocumentVersion> DocumentVersioningService::getLatestVersion(const std::string& documentId) {
    return m_repository->getLatestVersion(documentId);
}

CancellationToken DocumentVersioningService::effectiveToken(const std::optional<CancellationToken>& token) const {
    if (token) return *token;
    if (m_comparisonTimeout.count() > 0) return CancellationToken::WithTimeout(m_comparisonTimeout);
    return CancellationToken();
}

DocumentComparison DocumentVersioningService::compareVersions(const std::string& originalVersionId,
                                                              const std::string& comparedVersionId,
                                                              const std::optional<CancellationToken>& token) {
    return m_cache->compare(originalVersionId, comparedVersionId, effectiveToken(token));
}

DocumentComparison DocumentVersioningService::getComparison(const std::string& comparisonId) {
    auto comparison = m_repository->getComparisonById(comparisonId);
    if (!comparison) {
        throw NotFoundError("Comparison not found: " + comparisonId);
    }
    return *comparison;
}

std::vector<VersionDifference> DocumentVersioningService::getVersionDifferences(const std::string& documentId) {
    return m_statistics->getVersionDifferences(documentId, effectiveToken(std::nullopt));
}

VersionStatistics DocumentVersioningService::getVersionStatistics(const std::string& documentId) {
    return m_statistics->getVersionStatistics(documentId, effectiveToken(std::nullopt));
}

DocumentVersion DocumentVersioningService::rollbackToVersion(const std::string& documentId,
                                                             const std::string& targetVersionId,
                                                             const std::string& filename) {
    auto target = m_repository->getVersionById(targetVersionId);
    if (!target) {
        throw NotFoundError("Target version not found: " + targetVersionId);
    }
    if (target->documentId != documentId) {
        throw ValidationError("Version " + targetVersionId + " does not belong to document " + documentId);
    }

    return createVersion(documentId, filename, target->metadata, target->analysis, targetVersionId);
}

CleanupResult DocumentVersioningService::cleanupOldVersions(int retentionDays) {
    return m_retention->cleanupOldVersions(retentionDays);
}

} // namespace clausetrail::application::versioning
