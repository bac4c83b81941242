/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace clausetrail::infrastructure {

namespace {

VersioningConfig Defaults(const std::string& projectRoot) {
    VersioningConfig config;
    config.storageRoot = (std::filesystem::path(projectRoot) / "versions_store").string();
    return config;
}

} // namespace

VersioningConfig ConfigLoader::Load(const std::string& projectRoot) {
    VersioningConfig config = Defaults(projectRoot);
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return config;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("storage_root") && j["storage_root"].is_string()) {
            std::filesystem::path root = j["storage_root"].get<std::string>();
            if (root.is_relative()) root = std::filesystem::path(projectRoot) / root;
            config.storageRoot = root.string();
        }
        if (j.contains("retention_days")) {
            config.retentionDays = std::clamp(j["retention_days"].get<int>(), 1, 365);
        }
        if (j.contains("sweep_interval_minutes")) {
            config.sweepIntervalMinutes = std::max(1, j["sweep_interval_minutes"].get<int>());
        }
        if (j.contains("comparison_timeout_ms")) {
            config.comparisonTimeoutMs = std::max(0LL, j["comparison_timeout_ms"].get<long long>());
        }
        if (j.contains("history_page_limit")) {
            config.historyPageLimit = std::clamp(j["history_page_limit"].get<int>(), 1, 50);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json, using defaults: " << e.what() << std::endl;
        return Defaults(projectRoot);
    }

    return config;
}

void ConfigLoader::Save(const std::string& projectRoot, const VersioningConfig& config) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
    }

    j["storage_root"] = config.storageRoot;
    j["retention_days"] = config.retentionDays;
    j["sweep_interval_minutes"] = config.sweepIntervalMinutes;
    j["comparison_timeout_ms"] = config.comparisonTimeoutMs;
    j["history_page_limit"] = config.historyPageLimit;

    std::ofstream f(configPath);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot write " + configPath.string());
    }
    f << j.dump(4);
}

} // namespace clausetrail::infrastructure
