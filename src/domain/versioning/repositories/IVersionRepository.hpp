/**
 * @file IVersionRepository.hpp
 * @brief Interface for persisting versions and cached comparisons.
 */

#pragma once

#include <vector>
#include <optional>
#include <string>
#include <chrono>
#include "../DocumentVersion.hpp"
#include "../DocumentComparison.hpp"

namespace clausetrail::domain::versioning {

class IVersionRepository {
public:
    virtual ~IVersionRepository() = default;

    // Assigns the next version number for the document and stores the version.
    // Number assignment and insertion happen atomically per document.
    virtual DocumentVersion createVersion(const NewVersion& version,
                                          std::chrono::system_clock::time_point uploadedAt) = 0;

    // 1 + highest number ever issued for the document (deleted ones included)
    virtual int getNextVersionNumber(const std::string& documentId) = 0;

    virtual std::optional<DocumentVersion> getVersionById(const std::string& versionId) = 0;

    // Ascending by versionNumber
    virtual std::vector<DocumentVersion> getVersionsByDocumentId(const std::string& documentId) = 0;

    virtual std::optional<DocumentVersion> getLatestVersion(const std::string& documentId) = 0;

    // Returns number of versions removed; zero is not an error.
    virtual size_t deleteVersionsOlderThan(std::chrono::system_clock::time_point cutoff) = 0;

    // --- Comparisons ---
    virtual void saveComparison(const DocumentComparison& comparison) = 0;

    // Exact ordered pair lookup
    virtual std::optional<DocumentComparison> getComparison(const std::string& originalVersionId,
                                                            const std::string& comparedVersionId) = 0;

    virtual std::optional<DocumentComparison> getComparisonById(const std::string& comparisonId) = 0;

    // Comparisons where either side belongs to the document, newest first
    virtual std::vector<DocumentComparison> getComparisonsByDocumentId(const std::string& documentId) = 0;

    virtual size_t deleteComparisonsOlderThan(std::chrono::system_clock::time_point cutoff) = 0;
};

} // namespace clausetrail::domain::versioning
