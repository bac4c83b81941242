/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving the versioning configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place so services only ever see a
 * validated VersioningConfig.
 */

#pragma once

#include <string>

namespace clausetrail::infrastructure {

/**
 * @struct VersioningConfig
 * @brief Tunables for storage, retention and diff deadlines.
 */
struct VersioningConfig {
    std::string storageRoot;          ///< Defaults to <projectRoot>/versions_store.
    int retentionDays = 30;           ///< Clamped to 1..365.
    int sweepIntervalMinutes = 60;    ///< At least 1.
    long long comparisonTimeoutMs = 0; ///< 0 disables the deadline.
    int historyPageLimit = 10;        ///< Clamped to 1..50.
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the project root.
     * @param projectRoot Absolute path to the project root.
     * @return Defaults for every missing, malformed or out-of-range key.
     */
    static VersioningConfig Load(const std::string& projectRoot);

    /**
     * @brief Saves the config to settings.json, preserving unrelated keys.
     */
    static void Save(const std::string& projectRoot, const VersioningConfig& config);
};

} // namespace clausetrail::infrastructure
