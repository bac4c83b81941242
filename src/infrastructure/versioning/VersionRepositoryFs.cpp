/**
 * @file VersionRepositoryFs.cpp
 * @brief Implementation of VersionRepositoryFs.
 */

#include "infrastructure/versioning/VersionRepositoryFs.hpp"
#include "infrastructure/versioning/VersionJson.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "domain/versioning/VersioningErrors.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace clausetrail::infrastructure::versioning {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json readJsonFile(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return json::parse(in);
}

bool isPlainByte(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

} // namespace

// Every byte outside [A-Za-z0-9_-] becomes %XX, so "a/b" and ".." stay one
// path component below documents/.
std::string VersionRepositoryFs::encodeDocumentId(const std::string& documentId) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(documentId.size());
    for (unsigned char c : documentId) {
        if (isPlainByte(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::optional<std::string> VersionRepositoryFs::decodeDocumentId(const std::string& dirName) {
    std::string out;
    out.reserve(dirName.size());
    for (size_t i = 0; i < dirName.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(dirName[i]);
        if (c == '%') {
            if (i + 2 >= dirName.size()) return std::nullopt;
            int hi = hexValue(dirName[i + 1]);
            int lo = hexValue(dirName[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (isPlainByte(c)) {
            out += static_cast<char>(c);
        } else {
            return std::nullopt;
        }
    }
    if (out.empty()) return std::nullopt;
    return out;
}

VersionRepositoryFs::VersionRepositoryFs(std::string storageRoot, std::shared_ptr<PersistenceService> persistence)
    : m_storageRoot(std::move(storageRoot)), m_persistence(std::move(persistence)) {}

std::string VersionRepositoryFs::documentDir(const std::string& documentId) const {
    return (fs::path(m_storageRoot) / "documents" / encodeDocumentId(documentId)).string();
}

std::string VersionRepositoryFs::versionPath(const DocumentVersion& version) const {
    return (fs::path(documentDir(version.documentId)) / ("v" + version.id + ".json")).string();
}

std::string VersionRepositoryFs::counterPath(const std::string& documentId) const {
    return (fs::path(documentDir(documentId)) / "counter.json").string();
}

std::string VersionRepositoryFs::comparisonPath(const std::string& comparisonId) const {
    return (fs::path(m_storageRoot) / "comparisons" / (comparisonId + ".json")).string();
}

void VersionRepositoryFs::load() {
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        m_documents.clear();
        m_versions.clear();
        m_versionsByDocument.clear();
        m_comparisons.clear();
        m_comparisonByPair.clear();
    }

    fs::path docsRoot = fs::path(m_storageRoot) / "documents";
    if (fs::exists(docsRoot)) {
        for (const auto& entry : fs::directory_iterator(docsRoot)) {
            if (entry.is_directory()) {
                loadDocumentDir(entry.path().string());
            }
        }
    }
    loadComparisons();

    std::lock_guard<std::mutex> lock(m_indexMutex);
    std::cout << "[VersionRepositoryFs] Loaded " << m_versions.size() << " versions and "
              << m_comparisons.size() << " comparisons from " << m_storageRoot << std::endl;
}

void VersionRepositoryFs::loadDocumentDir(const std::string& dir) {
    auto decoded = decodeDocumentId(fs::path(dir).filename().string());
    if (!decoded) {
        std::cerr << "[VersionRepositoryFs] Skipping unrecognized directory " << dir << std::endl;
        return;
    }
    const std::string& documentId = *decoded;
    int counter = 0;

    fs::path counterFile = fs::path(dir) / "counter.json";
    if (fs::exists(counterFile)) {
        try {
            counter = readJsonFile(counterFile).value("lastVersionNumber", 0);
        } catch (const std::exception& e) {
            std::cerr << "[VersionRepositoryFs] Ignoring unreadable counter for " << documentId
                      << ": " << e.what() << std::endl;
        }
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        const auto& path = entry.path();
        if (!entry.is_regular_file() || path.extension() != ".json") continue;
        if (path.filename().string().rfind("v", 0) != 0) continue;

        try {
            DocumentVersion version = VersionFromJson(readJsonFile(path));
            if (version.documentId != documentId) {
                std::cerr << "[VersionRepositoryFs] Skipping " << path << ": belongs to document "
                          << version.documentId << std::endl;
                continue;
            }
            counter = std::max(counter, version.versionNumber);
            std::lock_guard<std::mutex> lock(m_indexMutex);
            indexVersion(version);
        } catch (const std::exception& e) {
            // Ignore malformed files
            std::cerr << "[VersionRepositoryFs] Skipping " << path << ": " << e.what() << std::endl;
        }
    }

    auto state = documentState(documentId);
    std::lock_guard<std::mutex> lock(state->numberingMutex);
    state->lastVersionNumber = std::max(state->lastVersionNumber, counter);
}

void VersionRepositoryFs::loadComparisons() {
    fs::path dir = fs::path(m_storageRoot) / "comparisons";
    if (!fs::exists(dir)) return;

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        try {
            DocumentComparison comparison = ComparisonFromJson(readJsonFile(entry.path()));
            std::lock_guard<std::mutex> lock(m_indexMutex);
            indexComparison(comparison);
        } catch (const std::exception& e) {
            std::cerr << "[VersionRepositoryFs] Skipping " << entry.path() << ": " << e.what() << std::endl;
        }
    }
}

// Caller holds m_indexMutex.
void VersionRepositoryFs::indexVersion(const DocumentVersion& version) {
    m_versions[version.id] = version;
    m_versionsByDocument[version.documentId][version.versionNumber] = version.id;
}

// Caller holds m_indexMutex. Newest comparison wins the pair slot.
void VersionRepositoryFs::indexComparison(const DocumentComparison& comparison) {
    m_comparisons[comparison.id] = comparison;
    auto key = std::make_pair(comparison.originalVersionId, comparison.comparedVersionId);
    auto it = m_comparisonByPair.find(key);
    if (it == m_comparisonByPair.end() ||
        m_comparisons[it->second].comparedAt <= comparison.comparedAt) {
        m_comparisonByPair[key] = comparison.id;
    }
}

std::shared_ptr<VersionRepositoryFs::DocumentState> VersionRepositoryFs::documentState(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto& state = m_documents[documentId];
    if (!state) state = std::make_shared<DocumentState>();
    return state;
}

DocumentVersion VersionRepositoryFs::createVersion(const NewVersion& request,
                                                   std::chrono::system_clock::time_point uploadedAt) {
    if (request.documentId.empty()) {
        throw ValidationError("documentId must not be empty");
    }

    auto state = documentState(request.documentId);
    std::lock_guard<std::mutex> numbering(state->numberingMutex);

    DocumentVersion version;
    version.id = IdGenerator::uuid4();
    version.documentId = request.documentId;
    version.versionNumber = state->lastVersionNumber + 1;
    version.filename = request.filename;
    version.uploadedAt = TruncateToMillis(uploadedAt);
    version.metadata = request.metadata;
    version.analysis = request.analysis;
    version.parentVersionId = request.parentVersionId;

    // Serialize before touching disk; a failure here must not consume the number.
    std::string body = VersionToJson(version).dump(2);
    m_persistence->saveText(versionPath(version), body);

    // Load takes max(counter, highest version file), so a lagging counter is harmless.
    m_persistence->saveTextAsync(counterPath(version.documentId),
                                 json{{"lastVersionNumber", version.versionNumber}}.dump());

    state->lastVersionNumber = version.versionNumber;
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        indexVersion(version);
    }
    return version;
}

int VersionRepositoryFs::getNextVersionNumber(const std::string& documentId) {
    auto state = documentState(documentId);
    std::lock_guard<std::mutex> lock(state->numberingMutex);
    return state->lastVersionNumber + 1;
}

std::optional<DocumentVersion> VersionRepositoryFs::getVersionById(const std::string& versionId) {
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto it = m_versions.find(versionId);
    if (it == m_versions.end()) return std::nullopt;
    return it->second;
}

std::vector<DocumentVersion> VersionRepositoryFs::getVersionsByDocumentId(const std::string& documentId) {
    std::vector<DocumentVersion> result;
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto it = m_versionsByDocument.find(documentId);
    if (it == m_versionsByDocument.end()) return result;

    for (const auto& [number, id] : it->second) {
        result.push_back(m_versions.at(id));
    }
    return result;
}

std::optional<DocumentVersion> VersionRepositoryFs::getLatestVersion(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto it = m_versionsByDocument.find(documentId);
    if (it == m_versionsByDocument.end() || it->second.empty()) return std::nullopt;
    return m_versions.at(it->second.rbegin()->second);
}

size_t VersionRepositoryFs::deleteVersionsOlderThan(std::chrono::system_clock::time_point cutoff) {
    std::vector<DocumentVersion> doomed;
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        for (auto it = m_versions.begin(); it != m_versions.end();) {
            if (it->second.uploadedAt < cutoff) {
                auto& byNumber = m_versionsByDocument[it->second.documentId];
                byNumber.erase(it->second.versionNumber);
                if (byNumber.empty()) m_versionsByDocument.erase(it->second.documentId);
                doomed.push_back(std::move(it->second));
                it = m_versions.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& version : doomed) {
        m_persistence->removeAsync(versionPath(version));
    }
    return doomed.size();
}

void VersionRepositoryFs::saveComparison(const DocumentComparison& comparison) {
    DocumentComparison stored = comparison;
    stored.comparedAt = TruncateToMillis(comparison.comparedAt);
    m_persistence->saveText(comparisonPath(stored.id), ComparisonToJson(stored).dump(2));
    std::lock_guard<std::mutex> lock(m_indexMutex);
    indexComparison(stored);
}

std::optional<DocumentComparison> VersionRepositoryFs::getComparison(const std::string& originalVersionId,
                                                                     const std::string& comparedVersionId) {
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto it = m_comparisonByPair.find(std::make_pair(originalVersionId, comparedVersionId));
    if (it == m_comparisonByPair.end()) return std::nullopt;
    return m_comparisons.at(it->second);
}

std::optional<DocumentComparison> VersionRepositoryFs::getComparisonById(const std::string& comparisonId) {
    std::lock_guard<std::mutex> lock(m_indexMutex);
    auto it = m_comparisons.find(comparisonId);
    if (it == m_comparisons.end()) return std::nullopt;
    return it->second;
}

std::vector<DocumentComparison> VersionRepositoryFs::getComparisonsByDocumentId(const std::string& documentId) {
    std::vector<DocumentComparison> result;
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        auto belongs = [&](const std::string& versionId) {
            auto v = m_versions.find(versionId);
            return v != m_versions.end() && v->second.documentId == documentId;
        };
        for (const auto& [id, comparison] : m_comparisons) {
            if (belongs(comparison.originalVersionId) || belongs(comparison.comparedVersionId)) {
                result.push_back(comparison);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const DocumentComparison& a, const DocumentComparison& b) {
        return a.comparedAt > b.comparedAt;
    });
    return result;
}

size_t VersionRepositoryFs::deleteComparisonsOlderThan(std::chrono::system_clock::time_point cutoff) {
    std::vector<std::string> doomed;
    {
        std::lock_guard<std::mutex> lock(m_indexMutex);
        bool vacatedSlot = false;
        for (auto it = m_comparisons.begin(); it != m_comparisons.end();) {
            if (it->second.comparedAt < cutoff) {
                auto key = std::make_pair(it->second.originalVersionId, it->second.comparedVersionId);
                auto slot = m_comparisonByPair.find(key);
                if (slot != m_comparisonByPair.end() && slot->second == it->first) {
                    m_comparisonByPair.erase(slot);
                    vacatedSlot = true;
                }
                doomed.push_back(it->first);
                it = m_comparisons.erase(it);
            } else {
                ++it;
            }
        }
        // A surviving duplicate for the same pair takes over the slot.
        if (vacatedSlot) {
            for (const auto& [id, comparison] : m_comparisons) {
                auto key = std::make_pair(comparison.originalVersionId, comparison.comparedVersionId);
                if (!m_comparisonByPair.count(key)) {
                    indexComparison(comparison);
                }
            }
        }
    }

    for (const auto& id : doomed) {
        m_persistence->removeAsync(comparisonPath(id));
    }
    return doomed.size();
}

void VersionRepositoryFs::flush() {
    m_persistence->flush();
}

} // namespace clausetrail::infrastructure::versioning
