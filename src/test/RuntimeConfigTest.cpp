#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "app/ClauseTrailRuntime.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace clausetrail;
using namespace clausetrail::infrastructure;

namespace {

void writeSettings(const std::filesystem::path& root, const std::string& content) {
    std::ofstream out(root / "settings.json");
    out << content;
}

void testDefaults(const std::filesystem::path& root) {
    VersioningConfig config = ConfigLoader::Load(root.string());
    assert(config.storageRoot == (root / "versions_store").string());
    assert(config.retentionDays == 30);
    assert(config.sweepIntervalMinutes == 60);
    assert(config.comparisonTimeoutMs == 0);
    assert(config.historyPageLimit == 10);
    std::cout << "[PASS] defaults without settings.json" << std::endl;
}

void testClampingAndRelativeRoot(const std::filesystem::path& root) {
    writeSettings(root, R"({
        "storage_root": "store",
        "retention_days": 9999,
        "sweep_interval_minutes": 0,
        "comparison_timeout_ms": 2500,
        "history_page_limit": 0
    })");
    VersioningConfig config = ConfigLoader::Load(root.string());
    assert(config.storageRoot == (root / "store").string());
    assert(config.retentionDays == 365);
    assert(config.sweepIntervalMinutes == 1);
    assert(config.comparisonTimeoutMs == 2500);
    assert(config.historyPageLimit == 1);
    std::cout << "[PASS] out-of-range values are clamped" << std::endl;
}

void testMalformed(const std::filesystem::path& root) {
    writeSettings(root, "{ not json");
    VersioningConfig config = ConfigLoader::Load(root.string());
    assert(config.retentionDays == 30);
    assert(config.storageRoot == (root / "versions_store").string());

    writeSettings(root, R"({"retention_days": "thirty"})");
    assert(ConfigLoader::Load(root.string()).retentionDays == 30);
    std::cout << "[PASS] malformed settings fall back to defaults" << std::endl;
}

void testSavePreservesUnrelatedKeys(const std::filesystem::path& root) {
    writeSettings(root, R"({"theme": "dark", "retention_days": 10})");
    VersioningConfig config = ConfigLoader::Load(root.string());
    assert(config.retentionDays == 10);

    config.retentionDays = 90;
    config.historyPageLimit = 25;
    ConfigLoader::Save(root.string(), config);

    std::ifstream in(root / "settings.json");
    nlohmann::json saved = nlohmann::json::parse(in);
    assert(saved["theme"] == "dark");
    assert(saved["retention_days"] == 90);

    VersioningConfig reloaded = ConfigLoader::Load(root.string());
    assert(reloaded.retentionDays == 90);
    assert(reloaded.historyPageLimit == 25);
    std::cout << "[PASS] Save keeps unrelated keys" << std::endl;
}

void testRuntimeLifecycle(const std::filesystem::path& root) {
    writeSettings(root, R"({"storage_root": "store", "history_page_limit": 2})");

    std::string versionId;
    {
        app::ClauseTrailRuntime runtime(root.string());
        bool threw = false;
        try {
            runtime.versioning();
        } catch (const std::logic_error&) {
            threw = true;
        }
        assert(threw);

        assert(runtime.Init());
        assert(runtime.config().historyPageLimit == 2);

        domain::versioning::DocumentMetadata meta;
        meta.extractedText = "The vendor shall deliver on time.";
        auto& versioning = runtime.versioning();
        versionId = versioning.createVersion("sow", "sow_v1.pdf", meta).id;
        versioning.createVersion("sow", "sow_v2.pdf", meta);
        versioning.createVersion("sow", "sow_v3.pdf", meta);

        auto history = versioning.getVersionHistory("sow");
        assert(history.limit == 2);
        assert(history.versions.size() == 2 && history.hasMore);

        runtime.Shutdown();
        runtime.Shutdown();
    }

    assert(std::filesystem::exists(root / "store" / "documents" / "sow"));

    app::ClauseTrailRuntime reopened(root.string());
    assert(reopened.Init(false));
    auto version = reopened.versioning().getVersion(versionId);
    assert(version && version->versionNumber == 1);
    assert(reopened.versioning().getLatestVersion("sow")->versionNumber == 3);
    reopened.Shutdown();
    std::cout << "[PASS] runtime persists across restarts" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Runtime/Config Test..." << std::endl;

    std::filesystem::path testRoot = std::filesystem::absolute("test_project_root_runtime");
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);

    testDefaults(testRoot);
    testClampingAndRelativeRoot(testRoot);
    testMalformed(testRoot);
    testSavePreservesUnrelatedKeys(testRoot);
    testRuntimeLifecycle(testRoot);

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] Runtime/Config Test." << std::endl;
    return 0;
}
