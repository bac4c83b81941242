/**
 * @file VersionRepositoryFs.hpp
 * @brief File system implementation of the version repository.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include "domain/versioning/repositories/IVersionRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace clausetrail::infrastructure::versioning {

using namespace clausetrail::domain::versioning;

/**
 * @class VersionRepositoryFs
 * @brief Keeps every version and comparison in memory and mirrors them to JSON files.
 *
 * Layout under the storage root:
 *   documents/<encodedId>/counter.json
 *   documents/<encodedId>/v<versionId>.json
 *   comparisons/<comparisonId>.json
 *
 * Version numbers are assigned under a per-document mutex; documents never
 * contend with each other except for the brief index lock.
 */
class VersionRepositoryFs : public IVersionRepository {
public:
    VersionRepositoryFs(std::string storageRoot, std::shared_ptr<PersistenceService> persistence);

    /** @brief Rebuilds the in-memory index from disk. Malformed files are skipped. */
    void load();

    /** @brief Waits for queued file operations to land. */
    void flush();

    /** @brief Directory name for a document id; bytes outside [A-Za-z0-9_-] become %XX. */
    static std::string encodeDocumentId(const std::string& documentId);
    /** @brief Inverse of encodeDocumentId, nullopt for names it could not have produced. */
    static std::optional<std::string> decodeDocumentId(const std::string& dirName);

    DocumentVersion createVersion(const NewVersion& version,
                                  std::chrono::system_clock::time_point uploadedAt) override;
    int getNextVersionNumber(const std::string& documentId) override;
    std::optional<DocumentVersion> getVersionById(const std::string& versionId) override;
    std::vector<DocumentVersion> getVersionsByDocumentId(const std::string& documentId) override;
    std::optional<DocumentVersion> getLatestVersion(const std::string& documentId) override;
    size_t deleteVersionsOlderThan(std::chrono::system_clock::time_point cutoff) override;

    void saveComparison(const DocumentComparison& comparison) override;
    std::optional<DocumentComparison> getComparison(const std::string& originalVersionId,
                                                    const std::string& comparedVersionId) override;
    std::optional<DocumentComparison> getComparisonById(const std::string& comparisonId) override;
    std::vector<DocumentComparison> getComparisonsByDocumentId(const std::string& documentId) override;
    size_t deleteComparisonsOlderThan(std::chrono::system_clock::time_point cutoff) override;

private:
    struct DocumentState {
        std::mutex numberingMutex;  ///< Serializes version-number assignment.
        int lastVersionNumber = 0;  ///< Highest number ever issued, survives deletions.
    };

    std::shared_ptr<DocumentState> documentState(const std::string& documentId);

    std::string documentDir(const std::string& documentId) const;
    std::string versionPath(const DocumentVersion& version) const;
    std::string counterPath(const std::string& documentId) const;
    std::string comparisonPath(const std::string& comparisonId) const;

    void loadDocumentDir(const std::string& dir);
    void loadComparisons();
    void indexVersion(const DocumentVersion& version);
    void indexComparison(const DocumentComparison& comparison);

    std::string m_storageRoot;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_indexMutex;
    std::map<std::string, std::shared_ptr<DocumentState>> m_documents;
    std::unordered_map<std::string, DocumentVersion> m_versions;
    std::map<std::string, std::map<int, std::string>> m_versionsByDocument; // docId -> number -> versionId
    std::unordered_map<std::string, DocumentComparison> m_comparisons;
    std::map<std::pair<std::string, std::string>, std::string> m_comparisonByPair;
};

} // namespace clausetrail::infrastructure::versioning
