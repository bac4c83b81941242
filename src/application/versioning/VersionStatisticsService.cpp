/**
 * @file VersionStatisticsService.cpp
 * @brief Implementation of VersionStatisticsService.
 */

#include "application/versioning/VersionStatisticsService.hpp"
#include <algorithm>
#include <unordered_map>

namespace clausetrail::application::versioning {

VersionStatisticsService::VersionStatisticsService(std::shared_ptr<IVersionRepository> repository,
                                                   std::shared_ptr<ComparisonCache> cache)
    : m_repository(std::move(repository)), m_cache(std::move(cache)) {}

std::vector<VersionDifference> VersionStatisticsService::getVersionDifferences(const std::string& documentId,
                                                                               const CancellationToken& token) {
    auto versions = m_repository->getVersionsByDocumentId(documentId);
    std::vector<VersionDifference> differences;

    for (size_t i = 1; i < versions.size(); ++i) {
        const auto& previous = versions[i - 1];
        const auto& current = versions[i];

        DocumentComparison comparison = m_cache->compare(previous.id, current.id, token);

        VersionDifference diff;
        diff.fromVersion = previous.versionNumber;
        diff.toVersion = current.versionNumber;
        diff.fromVersionId = previous.id;
        diff.toVersionId = current.id;
        diff.changesCount = comparison.changes.size();
        diff.significantChangesCount = comparison.impactAnalysis.significantChanges.size();
        diff.overallImpact = comparison.impactAnalysis.overallImpact;
        diff.riskScoreChange = comparison.impactAnalysis.riskScoreChange;
        diff.comparedAt = comparison.comparedAt;
        differences.push_back(std::move(diff));
    }

    return differences;
}

VersionStatistics VersionStatisticsService::getVersionStatistics(const std::string& documentId,
                                                                 const CancellationToken& token) {
    auto versions = m_repository->getVersionsByDocumentId(documentId);
    auto differences = getVersionDifferences(documentId, token);
    return summarize(documentId, versions, differences);
}

VersionStatistics VersionStatisticsService::summarize(const std::string& documentId,
                                                      const std::vector<DocumentVersion>& versions,
                                                      const std::vector<VersionDifference>& differences) {
    VersionStatistics stats;
    stats.documentId = documentId;
    stats.totalVersions = versions.size();

    for (const auto& diff : differences) {
        stats.totalChanges += diff.changesCount;
        stats.totalSignificantChanges += diff.significantChangesCount;
    }

    stats.riskTrend = calculateRiskTrend(versions);
    stats.mostActiveVersion = findMostActiveVersion(differences);
    if (!versions.empty()) {
        stats.firstVersion = versions.front();
        stats.latestVersion = versions.back();
    }

    size_t pairCount = std::max<size_t>(1, differences.size());
    stats.averageChangesPerVersion = static_cast<double>(stats.totalChanges) / static_cast<double>(pairCount);
    return stats;
}

RiskTrend VersionStatisticsService::calculateRiskTrend(const std::vector<DocumentVersion>& versions) {
    std::vector<int> scores;
    for (const auto& v : versions) {
        if (v.analysis) scores.push_back(RiskScoreToNumber(v.analysis->riskScore));
    }
    if (scores.size() < 2) {
        return RiskTrend::Stable;
    }

    // Consecutive deltas telescope to last - first.
    int cumulative = scores.back() - scores.front();
    if (cumulative > 0) return RiskTrend::Increasing;
    if (cumulative < 0) return RiskTrend::Decreasing;
    return RiskTrend::Stable;
}

std::optional<int> VersionStatisticsService::findMostActiveVersion(const std::vector<VersionDifference>& differences) {
    if (differences.empty()) {
        return std::nullopt;
    }

    const VersionDifference* mostActive = &differences.front();
    for (const auto& diff : differences) {
        if (diff.changesCount > mostActive->changesCount) {
            mostActive = &diff;
        }
    }
    return mostActive->toVersion;
}

std::vector<TimelineEvent> VersionStatisticsService::buildTimeline(const std::vector<DocumentVersion>& versions,
                                                                   const std::vector<DocumentComparison>& comparisons) {
    std::vector<TimelineEvent> events;
    std::unordered_map<std::string, int> numberById;

    for (const auto& version : versions) {
        numberById[version.id] = version.versionNumber;

        TimelineEvent evt;
        evt.type = TimelineEventType::VersionCreated;
        evt.timestamp = version.uploadedAt;
        evt.versionId = version.id;
        evt.versionNumber = version.versionNumber;
        evt.description = "Version " + std::to_string(version.versionNumber) + " created: " + version.filename;
        events.push_back(std::move(evt));
    }

    for (const auto& comparison : comparisons) {
        auto original = numberById.find(comparison.originalVersionId);
        auto compared = numberById.find(comparison.comparedVersionId);
        if (original == numberById.end() || compared == numberById.end()) continue;

        TimelineEvent evt;
        evt.type = TimelineEventType::ComparisonMade;
        evt.timestamp = comparison.comparedAt;
        evt.comparisonId = comparison.id;
        evt.description = "Compared version " + std::to_string(original->second) +
                          " with version " + std::to_string(compared->second);
        evt.changesCount = comparison.changes.size();
        evt.overallImpact = comparison.impactAnalysis.overallImpact;
        events.push_back(std::move(evt));
    }

    std::stable_sort(events.begin(), events.end(), [](const TimelineEvent& a, const TimelineEvent& b) {
        return a.timestamp < b.timestamp;
    });
    return events;
}

VersionHistory VersionStatisticsService::getVersionHistory(const std::string& documentId, const HistoryOptions& options) {
    auto versions = m_repository->getVersionsByDocumentId(documentId);
    auto comparisons = m_repository->getComparisonsByDocumentId(documentId);

    VersionHistory history;
    history.documentId = documentId;
    history.limit = std::clamp<size_t>(options.limit, 1, kMaxPageLimit);
    history.offset = options.offset;
    history.total = versions.size();
    history.totalComparisons = comparisons.size();
    history.hasMore = history.offset + history.limit < history.total;
    history.timeline = buildTimeline(versions, comparisons);

    auto strip = [&options](DocumentVersion v) {
        if (!options.includeAnalysis) v.analysis.reset();
        return v;
    };

    if (!versions.empty()) {
        history.firstVersion = strip(versions.front());
        history.latestVersion = strip(versions.back());
        history.currentVersion = history.latestVersion;
    }

    for (size_t i = history.offset; i < versions.size() && i < history.offset + history.limit; ++i) {
        history.versions.push_back(strip(versions[i]));
    }

    history.comparisons = std::move(comparisons);
    return history;
}

} // namespace clausetrail::application::versioning
