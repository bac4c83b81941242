/**
 * @file DocumentComparison.hpp
 * @brief Value objects describing the differences between two versions.
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace clausetrail::domain::versioning {

enum class ChangeType {
    Addition,
    Deletion,
    Modification
};

inline std::string ChangeTypeToString(ChangeType type) {
    switch (type) {
        case ChangeType::Addition: return "addition";
        case ChangeType::Deletion: return "deletion";
        case ChangeType::Modification: return "modification";
        default: return "unknown";
    }
}

inline ChangeType ChangeTypeFromString(const std::string& type) {
    if (type == "deletion") return ChangeType::Deletion;
    if (type == "modification") return ChangeType::Modification;
    return ChangeType::Addition;
}

enum class Severity {
    Low,
    Medium,
    High
};

inline std::string SeverityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        default: return "low";
    }
}

inline Severity SeverityFromString(const std::string& severity) {
    if (severity == "high") return Severity::High;
    if (severity == "medium") return Severity::Medium;
    return Severity::Low;
}

/**
 * @enum ChangeCategory
 * @brief Legal area a significant change falls into.
 */
enum class ChangeCategory {
    Financial,
    Rights,
    Obligations,
    Privacy,
    Legal
};

inline std::string CategoryToString(ChangeCategory category) {
    switch (category) {
        case ChangeCategory::Financial: return "financial";
        case ChangeCategory::Rights: return "rights";
        case ChangeCategory::Obligations: return "obligations";
        case ChangeCategory::Privacy: return "privacy";
        case ChangeCategory::Legal: return "legal";
        default: return "legal";
    }
}

inline ChangeCategory CategoryFromString(const std::string& category) {
    if (category == "financial") return ChangeCategory::Financial;
    if (category == "rights") return ChangeCategory::Rights;
    if (category == "obligations") return ChangeCategory::Obligations;
    if (category == "privacy") return ChangeCategory::Privacy;
    return ChangeCategory::Legal;
}

enum class Impact {
    Favorable,
    Unfavorable,
    Neutral
};

inline std::string ImpactToString(Impact impact) {
    switch (impact) {
        case Impact::Favorable: return "favorable";
        case Impact::Unfavorable: return "unfavorable";
        case Impact::Neutral: return "neutral";
        default: return "neutral";
    }
}

inline Impact ImpactFromString(const std::string& impact) {
    if (impact == "favorable") return Impact::Favorable;
    if (impact == "unfavorable") return Impact::Unfavorable;
    return Impact::Neutral;
}

/**
 * @struct TextLocation
 * @brief Approximate character range of a change in the relevant full text.
 */
struct TextLocation {
    size_t startIndex = 0;
    size_t endIndex = 0;
};

/**
 * @struct DocumentChange
 * @brief A single added, deleted or modified sentence.
 */
struct DocumentChange {
    std::string id;
    ChangeType type = ChangeType::Addition;
    std::optional<std::string> originalText; ///< Set for deletions and modifications.
    std::optional<std::string> newText;      ///< Set for additions and modifications.
    TextLocation location;
    Severity severity = Severity::Low;
    std::string description;
};

/**
 * @struct SignificantChange
 * @brief A high-severity change that could be placed in a legal category.
 */
struct SignificantChange {
    std::string changeId;
    ChangeCategory category = ChangeCategory::Legal;
    Impact impact = Impact::Neutral;
    std::string description;
    std::optional<std::string> recommendation;
};

struct ImpactAnalysis {
    Impact overallImpact = Impact::Neutral;
    int riskScoreChange = 0;
    std::vector<SignificantChange> significantChanges;
    std::string summary;
};

/**
 * @struct DocumentComparison
 * @brief Cached diff and impact result for one ordered pair of versions.
 *
 * A->B and B->A are distinct comparisons.
 */
struct DocumentComparison {
    std::string id;
    std::string originalVersionId;
    std::string comparedVersionId;
    std::chrono::system_clock::time_point comparedAt;
    std::vector<DocumentChange> changes;
    ImpactAnalysis impactAnalysis;
};

} // namespace clausetrail::domain::versioning
