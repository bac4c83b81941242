/**
 * @file DocumentVersion.hpp
 * @brief Entity representing an immutable snapshot of a document.
 */

#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace clausetrail::domain::versioning {

/**
 * @enum RiskLevel
 * @brief Coarse risk label attached to a version by the analysis service.
 */
enum class RiskLevel {
    Low,
    Medium,
    High,
    Unknown ///< Anything the analysis service sent that we do not recognize.
};

inline std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
        default: return "unknown";
    }
}

inline RiskLevel RiskLevelFromString(const std::string& level) {
    if (level == "low") return RiskLevel::Low;
    if (level == "medium") return RiskLevel::Medium;
    if (level == "high") return RiskLevel::High;
    return RiskLevel::Unknown;
}

/**
 * @brief Numeric ordering of risk labels. Unknown labels count as low.
 */
inline int RiskScoreToNumber(RiskLevel level) {
    switch (level) {
        case RiskLevel::Low: return 1;
        case RiskLevel::Medium: return 2;
        case RiskLevel::High: return 3;
        default: return 1;
    }
}

/** @brief Timestamps are kept at millisecond precision, the precision they are stored with. */
inline std::chrono::system_clock::time_point TruncateToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

/**
 * @struct DocumentMetadata
 * @brief Output of the text-extraction service for one uploaded file.
 */
struct DocumentMetadata {
    int pageCount = 0;
    int wordCount = 0;
    std::string language;
    std::string extractedText;
};

/**
 * @struct DocumentAnalysis
 * @brief Result of the analysis service. Only the risk label is interpreted here.
 */
struct DocumentAnalysis {
    RiskLevel riskScore = RiskLevel::Unknown;
    std::string rawRiskScore;  ///< Label exactly as received, kept for round-trips.
    std::string extrasJson;    ///< Remaining fields, opaque JSON object text.
};

/**
 * @class DocumentVersion
 * @brief One numbered snapshot in a document's lineage.
 *
 * Versions are created by the repository and never mutated afterwards.
 * parentVersionId is a weak reference: the parent may have been swept.
 */
struct DocumentVersion {
    std::string id;
    std::string documentId;
    int versionNumber = 0;
    std::string filename;
    std::chrono::system_clock::time_point uploadedAt;
    DocumentMetadata metadata;
    std::optional<DocumentAnalysis> analysis;
    std::optional<std::string> parentVersionId;
};

/**
 * @struct NewVersion
 * @brief Everything a caller supplies when creating a version.
 */
struct NewVersion {
    std::string documentId;
    std::string filename;
    DocumentMetadata metadata;
    std::optional<DocumentAnalysis> analysis;
    std::optional<std::string> parentVersionId;
};

} // namespace clausetrail::domain::versioning
