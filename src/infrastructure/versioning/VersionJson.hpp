/**
 * @file VersionJson.hpp
 * @brief JSON mapping for versions and comparisons.
 */

#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/versioning/DocumentVersion.hpp"
#include "domain/versioning/DocumentComparison.hpp"

namespace clausetrail::infrastructure::versioning {

using namespace clausetrail::domain::versioning;

long long ToEpochMillis(std::chrono::system_clock::time_point tp);
std::chrono::system_clock::time_point FromEpochMillis(long long ms);

/**
 * @brief Analysis as a flat object: "riskScore" plus every extra field.
 */
nlohmann::json AnalysisToJson(const DocumentAnalysis& analysis);
DocumentAnalysis AnalysisFromJson(const nlohmann::json& j);

/**
 * @brief Parses analysis-service output. Only "riskScore" is interpreted.
 * @throws nlohmann::json::exception on malformed input.
 */
DocumentAnalysis ParseAnalysis(const std::string& jsonText);

nlohmann::json VersionToJson(const DocumentVersion& version);
DocumentVersion VersionFromJson(const nlohmann::json& j);

nlohmann::json ComparisonToJson(const DocumentComparison& comparison);
DocumentComparison ComparisonFromJson(const nlohmann::json& j);

} // namespace clausetrail::infrastructure::versioning
