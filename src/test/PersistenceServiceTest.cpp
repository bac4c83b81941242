#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include "infrastructure/PersistenceService.hpp"

using namespace clausetrail::infrastructure;

namespace {

namespace fs = std::filesystem;

std::string readAll(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void testSaveTextSkipsTheQueue(const fs::path& root) {
    PersistenceService persistence;

    // A long backlog of removals must not hold up a synchronous write.
    const int kBacklog = 200000;
    for (int i = 0; i < kBacklog; ++i) {
        persistence.removeAsync((root / "missing" / ("v" + std::to_string(i) + ".json")).string());
    }

    fs::path target = root / "documents" / "doc-a" / "v1.json";
    persistence.saveText(target.string(), "{\"versionNumber\":1}");
    assert(fs::exists(target));
    assert(readAll(target) == "{\"versionNumber\":1}");
    assert(persistence.pendingCount() > 0);

    persistence.flush();
    assert(persistence.pendingCount() == 0);
    assert(persistence.failureCount() == 0);
    std::cout << "[PASS] saveText does not wait behind queued removals" << std::endl;
}

void testQueuedOpsKeepOrder(const fs::path& root) {
    PersistenceService persistence;
    fs::path target = root / "ordered.json";

    persistence.saveTextAsync(target.string(), "first");
    persistence.saveTextAsync(target.string(), "second");
    persistence.removeAsync(target.string());
    persistence.saveTextAsync(target.string(), "third");
    persistence.flush();

    assert(readAll(target) == "third");

    persistence.removeAsync(target.string());
    persistence.flush();
    assert(!fs::exists(target));
    std::cout << "[PASS] queued writes and removals land in order" << std::endl;
}

void testFailedWriteIsReported(const fs::path& root) {
    PersistenceService persistence;

    fs::path blocker = root / "blocker";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    bool threw = false;
    try {
        persistence.saveText((blocker / "v1.json").string(), "{}");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(persistence.failureCount() == 1);

    persistence.saveTextAsync((blocker / "counter.json").string(), "{}");
    persistence.flush();
    assert(persistence.failureCount() == 2);
    std::cout << "[PASS] failed writes are counted" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting PersistenceService Test..." << std::endl;

    fs::path testRoot = "test_project_root_persistence";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    testSaveTextSkipsTheQueue(testRoot / "backlog");
    testQueuedOpsKeepOrder(testRoot);
    testFailedWriteIsReported(testRoot);

    fs::remove_all(testRoot);
    std::cout << "[PASS] PersistenceService Test." << std::endl;
    return 0;
}
