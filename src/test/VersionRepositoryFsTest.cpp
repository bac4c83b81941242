#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/versioning/VersionJson.hpp"
#include "infrastructure/versioning/VersionRepositoryFs.hpp"
#include "domain/versioning/VersioningErrors.hpp"

using namespace clausetrail::domain::versioning;
using namespace clausetrail::infrastructure;
using namespace clausetrail::infrastructure::versioning;

namespace {

using Clock = std::chrono::system_clock;

NewVersion request(const std::string& documentId, const std::string& filename, const std::string& text) {
    NewVersion v;
    v.documentId = documentId;
    v.filename = filename;
    v.metadata.pageCount = 1;
    v.metadata.wordCount = 3;
    v.metadata.language = "en";
    v.metadata.extractedText = text;
    return v;
}

DocumentComparison comparisonBetween(const std::string& id, const DocumentVersion& a, const DocumentVersion& b,
                                     Clock::time_point at) {
    DocumentComparison c;
    c.id = id;
    c.originalVersionId = a.id;
    c.comparedVersionId = b.id;
    c.comparedAt = at;
    DocumentChange change;
    change.id = id + "-change";
    change.type = ChangeType::Addition;
    change.newText = "New clause.";
    change.severity = Severity::Medium;
    change.description = "Added text: \"New clause.\"";
    c.changes.push_back(change);
    c.impactAnalysis.summary = "Found 1 changes between document versions.";
    return c;
}

void testNumberingAndReload(const std::string& root) {
    auto now = Clock::now();
    auto old = now - std::chrono::hours(24 * 40);

    DocumentVersion v1, v2, v3, v4;
    {
        auto persistence = std::make_shared<PersistenceService>();
        VersionRepositoryFs repo(root, persistence);
        repo.load();

        assert(repo.getNextVersionNumber("doc-a") == 1);
        assert(!repo.getLatestVersion("doc-a"));

        v1 = repo.createVersion(request("doc-a", "lease_v1.pdf", "One."), old);
        v2 = repo.createVersion(request("doc-a", "lease_v2.pdf", "One. Two."), old);
        v3 = repo.createVersion(request("doc-a", "lease_v3.pdf", "One. Two. Three."), now);
        assert(v1.versionNumber == 1 && v2.versionNumber == 2 && v3.versionNumber == 3);
        assert(v1.id != v2.id && v2.id != v3.id);
        assert(repo.getNextVersionNumber("doc-a") == 4);
        assert(repo.getLatestVersion("doc-a")->id == v3.id);

        // Numbering is per document.
        auto other = repo.createVersion(request("doc-b", "nda.pdf", "Other."), now);
        assert(other.versionNumber == 1);

        repo.saveComparison(comparisonBetween("cmp-1", v2, v3, now));

        // Removing v1 and v2 must not free their numbers.
        assert(repo.deleteVersionsOlderThan(now - std::chrono::hours(24 * 30)) == 2);
        assert(repo.deleteVersionsOlderThan(now - std::chrono::hours(24 * 30)) == 0);
        assert(!repo.getVersionById(v1.id));

        v4 = repo.createVersion(request("doc-a", "lease_v4.pdf", "Four."), now);
        assert(v4.versionNumber == 4);

        auto versions = repo.getVersionsByDocumentId("doc-a");
        assert(versions.size() == 2);
        assert(versions[0].versionNumber == 3 && versions[1].versionNumber == 4);
        repo.flush();
    }

    // A fresh instance sees the same state from disk.
    auto persistence = std::make_shared<PersistenceService>();
    VersionRepositoryFs reloaded(root, persistence);
    reloaded.load();

    assert(reloaded.getNextVersionNumber("doc-a") == 5);
    assert(reloaded.getNextVersionNumber("doc-b") == 2);
    auto restored = reloaded.getVersionById(v4.id);
    assert(restored);
    assert(restored->filename == "lease_v4.pdf");
    assert(restored->metadata.extractedText == "Four.");
    assert(restored->metadata.language == "en");
    assert(!restored->parentVersionId);
    // Stored at millisecond precision, so the in-memory value matches disk.
    assert(restored->uploadedAt == v4.uploadedAt);

    // The comparison survives even though v2 is gone.
    auto cached = reloaded.getComparison(v2.id, v3.id);
    assert(cached && cached->id == "cmp-1");
    assert(cached->changes.size() == 1);
    assert(cached->changes[0].severity == Severity::Medium);
    assert(cached->comparedAt == std::chrono::time_point_cast<std::chrono::milliseconds>(now));
    assert(!reloaded.getComparison(v3.id, v2.id));
    assert(reloaded.getComparisonById("cmp-1"));
    assert(reloaded.getComparisonsByDocumentId("doc-a").size() == 1);
    assert(reloaded.getComparisonsByDocumentId("doc-b").empty());

    std::cout << "[PASS] numbering survives deletion and reload" << std::endl;
}

void testComparisonRetention(const std::string& root) {
    auto persistence = std::make_shared<PersistenceService>();
    VersionRepositoryFs repo(root, persistence);
    repo.load();

    auto now = Clock::now();
    auto a = repo.createVersion(request("doc-c", "a.pdf", "A."), now);
    auto b = repo.createVersion(request("doc-c", "b.pdf", "B."), now);

    repo.saveComparison(comparisonBetween("cmp-old", a, b, now - std::chrono::hours(24 * 60)));
    repo.saveComparison(comparisonBetween("cmp-new", b, a, now));

    auto listed = repo.getComparisonsByDocumentId("doc-c");
    assert(listed.size() == 2);
    assert(listed[0].id == "cmp-new");

    assert(repo.deleteComparisonsOlderThan(now - std::chrono::hours(24 * 30)) == 1);
    assert(!repo.getComparison(a.id, b.id));
    assert(repo.getComparison(b.id, a.id));
    repo.flush();
    assert(!std::filesystem::exists(std::filesystem::path(root) / "comparisons" / "cmp-old.json"));
    std::cout << "[PASS] comparison retention" << std::endl;
}

void testDocumentIdsStayInsideTheirDirectory(const std::string& root) {
    namespace fs = std::filesystem;
    assert(VersionRepositoryFs::encodeDocumentId("tenant-7/lease") == "tenant-7%2Flease");
    assert(VersionRepositoryFs::encodeDocumentId("..") == "%2E%2E");
    assert(*VersionRepositoryFs::decodeDocumentId("tenant-7%2Flease") == "tenant-7/lease");
    assert(!VersionRepositoryFs::decodeDocumentId("bad%2"));
    assert(!VersionRepositoryFs::decodeDocumentId("has space"));

    std::string slashedId;
    {
        auto persistence = std::make_shared<PersistenceService>();
        VersionRepositoryFs repo(root, persistence);
        repo.load();

        auto first = repo.createVersion(request("tenant-7/lease", "lease.pdf", "One."), Clock::now());
        auto second = repo.createVersion(request("tenant-7/lease", "lease.pdf", "Two."), Clock::now());
        auto dots = repo.createVersion(request("..", "up.pdf", "Up."), Clock::now());
        assert(first.versionNumber == 1 && second.versionNumber == 2 && dots.versionNumber == 1);
        slashedId = second.id;

        bool threw = false;
        try {
            repo.createVersion(request("", "none.pdf", "None."), Clock::now());
        } catch (const ValidationError&) {
            threw = true;
        }
        assert(threw);
        repo.flush();
    }

    assert(fs::exists(fs::path(root) / "documents" / "tenant-7%2Flease"));
    assert(fs::exists(fs::path(root) / "documents" / "%2E%2E"));
    assert(!fs::exists(fs::path(root) / "counter.json"));
    assert(!fs::exists(fs::path(root) / "documents" / "tenant-7"));

    auto persistence = std::make_shared<PersistenceService>();
    VersionRepositoryFs reloaded(root, persistence);
    reloaded.load();
    assert(reloaded.getVersionsByDocumentId("tenant-7/lease").size() == 2);
    assert(reloaded.getVersionById(slashedId)->documentId == "tenant-7/lease");
    assert(reloaded.getNextVersionNumber("tenant-7/lease") == 3);
    assert(reloaded.getNextVersionNumber("..") == 2);
    std::cout << "[PASS] document ids with separators round-trip through disk" << std::endl;
}

void testFailedWriteKeepsNumber(const std::string& root) {
    {
        auto persistence = std::make_shared<PersistenceService>();
        VersionRepositoryFs repo(root, persistence);
        repo.load();

        auto bad = request("doc-bad", "bad.pdf", "Bad.");
        DocumentAnalysis analysis;
        analysis.riskScore = RiskLevel::Low;
        analysis.extrasJson = "not json";
        bad.analysis = analysis;

        bool threw = false;
        try {
            repo.createVersion(bad, Clock::now());
        } catch (const std::exception&) {
            threw = true;
        }
        assert(threw);
        assert(repo.getNextVersionNumber("doc-bad") == 1);
        repo.flush();
    }

    auto persistence = std::make_shared<PersistenceService>();
    VersionRepositoryFs reloaded(root, persistence);
    reloaded.load();
    assert(reloaded.getNextVersionNumber("doc-bad") == 1);
    assert(reloaded.getVersionsByDocumentId("doc-bad").empty());
    std::cout << "[PASS] failed write does not consume a version number" << std::endl;
}

void testParseAnalysis() {
    auto analysis = ParseAnalysis("{\"riskScore\":\"high\",\"clauses\":3}");
    assert(analysis.riskScore == RiskLevel::High);
    assert(analysis.rawRiskScore == "high");
    auto extras = nlohmann::json::parse(analysis.extrasJson);
    assert(extras["clauses"] == 3);
    assert(!extras.contains("riskScore"));

    auto unlabeled = ParseAnalysis("{\"clauses\":1}");
    assert(unlabeled.riskScore == RiskLevel::Unknown);

    bool threw = false;
    try {
        ParseAnalysis("{truncated");
    } catch (const nlohmann::json::exception&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] analysis output parsing" << std::endl;
}

void testConcurrentCreation(const std::string& root) {
    auto persistence = std::make_shared<PersistenceService>();
    VersionRepositoryFs repo(root, persistence);
    repo.load();

    const int kThreads = 8;
    const int kPerThread = 10;
    std::vector<std::thread> threads;
    std::vector<std::vector<int>> numbers(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&repo, &numbers, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto v = repo.createVersion(request("doc-busy", "upload.pdf", "Text."), Clock::now());
                numbers[t].push_back(v.versionNumber);
            }
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    std::set<int> seen;
    for (const auto& list : numbers) {
        // Each caller observes its own numbers increasing.
        assert(std::is_sorted(list.begin(), list.end()));
        seen.insert(list.begin(), list.end());
    }
    assert(seen.size() == static_cast<size_t>(kThreads * kPerThread));
    assert(*seen.begin() == 1);
    assert(*seen.rbegin() == kThreads * kPerThread);
    assert(repo.getVersionsByDocumentId("doc-busy").size() == static_cast<size_t>(kThreads * kPerThread));
    repo.flush();
    std::cout << "[PASS] concurrent creation yields 1..N without gaps" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting VersionRepositoryFs Test..." << std::endl;

    std::string testRoot = "test_project_root_versions";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    testNumberingAndReload(testRoot + "/reload");
    testComparisonRetention(testRoot + "/retention");
    testConcurrentCreation(testRoot + "/concurrent");
    testDocumentIdsStayInsideTheirDirectory(testRoot + "/encoded");
    testFailedWriteKeepsNumber(testRoot + "/failed");
    testParseAnalysis();

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] VersionRepositoryFs Test." << std::endl;
    return 0;
}
