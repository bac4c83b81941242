/**
 * @file ImpactAnalyzer.hpp
 * @brief Domain service classifying the legal significance of a change set.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "../DocumentComparison.hpp"
#include "../DocumentVersion.hpp"

namespace clausetrail::domain::versioning {

/**
 * @class ImpactAnalyzer
 * @brief Deterministic, keyword-based impact classification. Stateless.
 */
class ImpactAnalyzer {
public:
    /**
     * @brief Signed risk delta current - prior on the 1..3 scale.
     * @return 0 when either analysis is missing.
     */
    static int riskScoreChange(const std::optional<DocumentAnalysis>& prior,
                               const std::optional<DocumentAnalysis>& current);

    /**
     * @brief Places a change into the first matching legal category.
     *
     * Categories are tried in order financial, rights, obligations, privacy,
     * legal against the new text (original text when there is none).
     * @return nullopt when no category keyword is present.
     */
    static std::optional<SignificantChange> categorizeChange(const DocumentChange& change);

    static Impact determineOverallImpact(const std::vector<SignificantChange>& significantChanges,
                                         int riskScoreChange);

    static std::string generateSummary(const std::vector<DocumentChange>& changes,
                                       const std::vector<SignificantChange>& significantChanges,
                                       int riskScoreChange);

    /** @brief Runs the whole classification for one comparison. */
    static ImpactAnalysis analyze(const std::vector<DocumentChange>& changes,
                                  const std::optional<DocumentAnalysis>& prior,
                                  const std::optional<DocumentAnalysis>& current);
};

} // namespace clausetrail::domain::versioning
