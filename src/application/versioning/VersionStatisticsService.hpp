/**
 * @file VersionStatisticsService.hpp
 * @brief Trend, activity and history views over a document's version chain.
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/versioning/repositories/IVersionRepository.hpp"
#include "domain/versioning/CancellationToken.hpp"
#include "application/versioning/ComparisonCache.hpp"

namespace clausetrail::application::versioning {

/**
 * @struct VersionDifference
 * @brief Summary of the comparison between two consecutive versions.
 */
struct VersionDifference {
    int fromVersion = 0;
    int toVersion = 0;
    std::string fromVersionId;
    std::string toVersionId;
    size_t changesCount = 0;
    size_t significantChangesCount = 0;
    Impact overallImpact = Impact::Neutral;
    int riskScoreChange = 0;
    std::chrono::system_clock::time_point comparedAt;
};

enum class RiskTrend {
    Increasing,
    Decreasing,
    Stable
};

inline std::string RiskTrendToString(RiskTrend trend) {
    switch (trend) {
        case RiskTrend::Increasing: return "increasing";
        case RiskTrend::Decreasing: return "decreasing";
        case RiskTrend::Stable: return "stable";
        default: return "stable";
    }
}

struct VersionStatistics {
    std::string documentId;
    size_t totalVersions = 0;
    size_t totalChanges = 0;
    size_t totalSignificantChanges = 0;
    RiskTrend riskTrend = RiskTrend::Stable;
    std::optional<int> mostActiveVersion;   ///< Absent when there are no consecutive pairs.
    std::optional<DocumentVersion> firstVersion;
    std::optional<DocumentVersion> latestVersion;
    double averageChangesPerVersion = 0.0;
};

/**
 * @struct HistoryOptions
 * @brief Paging for getVersionHistory. limit is clamped to 1..50.
 */
struct HistoryOptions {
    size_t limit = 10;
    size_t offset = 0;
    bool includeAnalysis = false;
};

enum class TimelineEventType {
    VersionCreated,
    ComparisonMade
};

inline std::string TimelineEventTypeToString(TimelineEventType type) {
    return type == TimelineEventType::VersionCreated ? "version_created" : "comparison_made";
}

struct TimelineEvent {
    TimelineEventType type = TimelineEventType::VersionCreated;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::string> versionId;
    std::optional<int> versionNumber;
    std::optional<std::string> comparisonId;
    std::string description;
    // comparison_made only
    std::optional<size_t> changesCount;
    std::optional<Impact> overallImpact;
};

struct VersionHistory {
    std::string documentId;
    std::vector<DocumentVersion> versions;        ///< Requested page, ascending by number.
    std::vector<DocumentComparison> comparisons;  ///< Newest first.
    std::vector<TimelineEvent> timeline;          ///< Whole document, oldest first.
    std::optional<DocumentVersion> currentVersion;
    std::optional<DocumentVersion> firstVersion;
    std::optional<DocumentVersion> latestVersion;
    size_t total = 0;
    size_t totalComparisons = 0;
    size_t limit = 0;
    size_t offset = 0;
    bool hasMore = false;
};

/**
 * @class VersionStatisticsService
 * @brief Walks the lineage in version-number order; comparisons come from the cache.
 */
class VersionStatisticsService {
public:
    static constexpr size_t kMaxPageLimit = 50;

    VersionStatisticsService(std::shared_ptr<IVersionRepository> repository,
                             std::shared_ptr<ComparisonCache> cache);

    /**
     * @brief One entry per consecutive pair (v[i-1], v[i]).
     * @note Computes and caches any missing pair comparison.
     */
    std::vector<VersionDifference> getVersionDifferences(const std::string& documentId,
                                                         const CancellationToken& token = CancellationToken());

    VersionStatistics getVersionStatistics(const std::string& documentId,
                                           const CancellationToken& token = CancellationToken());

    VersionHistory getVersionHistory(const std::string& documentId, const HistoryOptions& options);

    /** @brief Aggregates already-computed differences. No repository access. */
    static VersionStatistics summarize(const std::string& documentId,
                                       const std::vector<DocumentVersion>& versions,
                                       const std::vector<VersionDifference>& differences);

    /** @brief Direction of risk between the first and last versions that carry an analysis. */
    static RiskTrend calculateRiskTrend(const std::vector<DocumentVersion>& versions);

    /** @brief toVersion of the pair with the most changes; ties go to the earliest. */
    static std::optional<int> findMostActiveVersion(const std::vector<VersionDifference>& differences);

    static std::vector<TimelineEvent> buildTimeline(const std::vector<DocumentVersion>& versions,
                                                    const std::vector<DocumentComparison>& comparisons);

private:
    std::shared_ptr<IVersionRepository> m_repository;
    std::shared_ptr<ComparisonCache> m_cache;
};

} // namespace clausetrail::application::versioning
