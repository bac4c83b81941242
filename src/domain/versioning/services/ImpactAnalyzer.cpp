/**
 * @file ImpactAnalyzer.cpp
 * @brief Implementation of ImpactAnalyzer.
 */

#include "domain/versioning/services/ImpactAnalyzer.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>

namespace clausetrail::domain::versioning {

namespace {

// Which way a change type pushes the reader's position within a category.
enum class Polarity {
    AdditionHurts,   ///< addition/modification unfavorable, deletion favorable
    AdditionHelps,   ///< addition/modification favorable, deletion unfavorable
    Neutral
};

struct CategoryRule {
    ChangeCategory category;
    std::vector<const char*> keywords;
    Polarity polarity;
    const char* recommendation;
};

// First match wins; order is part of the contract.
const std::array<CategoryRule, 5> kCategoryRules = {{
    {ChangeCategory::Financial, {"payment", "fee", "cost"}, Polarity::AdditionHurts,
     "Review financial implications carefully before agreeing."},
    {ChangeCategory::Rights, {"right", "privilege"}, Polarity::AdditionHelps,
     "Ensure you understand how this affects your rights."},
    {ChangeCategory::Obligations, {"obligation", "responsibility", "must"}, Polarity::AdditionHurts,
     "Consider whether you can fulfill these obligations."},
    {ChangeCategory::Privacy, {"confidential", "privacy", "data"}, Polarity::Neutral,
     "Review privacy implications and data handling requirements."},
    {ChangeCategory::Legal, {"liability", "damages", "indemnify"}, Polarity::AdditionHurts,
     "Consider consulting a legal professional about liability implications."},
}};

Impact impactFor(Polarity polarity, ChangeType type) {
    if (polarity == Polarity::Neutral) return Impact::Neutral;
    bool removed = (type == ChangeType::Deletion);
    if (polarity == Polarity::AdditionHurts) {
        return removed ? Impact::Favorable : Impact::Unfavorable;
    }
    return removed ? Impact::Unfavorable : Impact::Favorable;
}

} // namespace

int ImpactAnalyzer::riskScoreChange(const std::optional<DocumentAnalysis>& prior,
                                    const std::optional<DocumentAnalysis>& current) {
    if (!prior || !current) return 0;
    return RiskScoreToNumber(current->riskScore) - RiskScoreToNumber(prior->riskScore);
}

std::optional<SignificantChange> ImpactAnalyzer::categorizeChange(const DocumentChange& change) {
    std::string text;
    if (change.newText && !change.newText->empty()) {
        text = *change.newText;
    } else if (change.originalText) {
        text = *change.originalText;
    }
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : kCategoryRules) {
        bool matched = std::any_of(rule.keywords.begin(), rule.keywords.end(),
            [&text](const char* keyword) { return text.find(keyword) != std::string::npos; });
        if (!matched) continue;

        SignificantChange significant;
        significant.changeId = change.id;
        significant.category = rule.category;
        significant.impact = impactFor(rule.polarity, change.type);
        significant.description = change.description;
        significant.recommendation = std::string(rule.recommendation);
        return significant;
    }
    return std::nullopt;
}

Impact ImpactAnalyzer::determineOverallImpact(const std::vector<SignificantChange>& significantChanges,
                                              int riskScoreChange) {
    if (riskScoreChange > 0) return Impact::Unfavorable;
    if (riskScoreChange < 0) return Impact::Favorable;

    auto favorable = std::count_if(significantChanges.begin(), significantChanges.end(),
        [](const SignificantChange& c) { return c.impact == Impact::Favorable; });
    auto unfavorable = std::count_if(significantChanges.begin(), significantChanges.end(),
        [](const SignificantChange& c) { return c.impact == Impact::Unfavorable; });

    if (unfavorable > favorable) return Impact::Unfavorable;
    if (favorable > unfavorable) return Impact::Favorable;
    return Impact::Neutral;
}

std::string ImpactAnalyzer::generateSummary(const std::vector<DocumentChange>& changes,
                                            const std::vector<SignificantChange>& significantChanges,
                                            int riskScoreChange) {
    auto highSeverity = std::count_if(changes.begin(), changes.end(),
        [](const DocumentChange& c) { return c.severity == Severity::High; });

    std::ostringstream summary;
    summary << "Found " << changes.size() << " changes between document versions";

    if (highSeverity > 0) {
        summary << ", including " << highSeverity << " high-severity changes";
    }

    if (riskScoreChange != 0) {
        summary << ". Overall risk level has " << (riskScoreChange > 0 ? "increased" : "decreased");
    }

    if (!significantChanges.empty()) {
        std::vector<ChangeCategory> categories;
        for (const auto& c : significantChanges) {
            if (std::find(categories.begin(), categories.end(), c.category) == categories.end()) {
                categories.push_back(c.category);
            }
        }
        summary << ". Significant changes affect: ";
        for (size_t i = 0; i < categories.size(); ++i) {
            if (i > 0) summary << ", ";
            summary << CategoryToString(categories[i]);
        }
    }

    summary << ".";
    return summary.str();
}

ImpactAnalysis ImpactAnalyzer::analyze(const std::vector<DocumentChange>& changes,
                                       const std::optional<DocumentAnalysis>& prior,
                                       const std::optional<DocumentAnalysis>& current) {
    ImpactAnalysis analysis;
    analysis.riskScoreChange = riskScoreChange(prior, current);

    for (const auto& change : changes) {
        if (change.severity != Severity::High) continue;
        if (auto significant = categorizeChange(change)) {
            analysis.significantChanges.push_back(std::move(*significant));
        }
    }

    analysis.overallImpact = determineOverallImpact(analysis.significantChanges, analysis.riskScoreChange);
    analysis.summary = generateSummary(changes, analysis.significantChanges, analysis.riskScoreChange);
    return analysis;
}

} // namespace clausetrail::domain::versioning
