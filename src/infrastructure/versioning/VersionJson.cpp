/**
 * @file VersionJson.cpp
 * @brief Implementation of the JSON mapping.
 */

#include "infrastructure/versioning/VersionJson.hpp"

namespace clausetrail::infrastructure::versioning {

using json = nlohmann::json;

long long ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochMillis(long long ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

json AnalysisToJson(const DocumentAnalysis& analysis) {
    json j = json::object();
    if (!analysis.extrasJson.empty()) {
        json extras = json::parse(analysis.extrasJson);
        if (extras.is_object()) j = extras;
    }
    j["riskScore"] = analysis.rawRiskScore.empty() ? RiskLevelToString(analysis.riskScore)
                                                   : analysis.rawRiskScore;
    return j;
}

DocumentAnalysis AnalysisFromJson(const json& j) {
    DocumentAnalysis analysis;
    json extras = j.is_object() ? j : json::object();
    if (extras.contains("riskScore") && extras["riskScore"].is_string()) {
        analysis.rawRiskScore = extras["riskScore"].get<std::string>();
        analysis.riskScore = RiskLevelFromString(analysis.rawRiskScore);
    }
    extras.erase("riskScore");
    if (!extras.empty()) {
        analysis.extrasJson = extras.dump();
    }
    return analysis;
}

DocumentAnalysis ParseAnalysis(const std::string& jsonText) {
    return AnalysisFromJson(json::parse(jsonText));
}

json VersionToJson(const DocumentVersion& version) {
    json j = {
        {"id", version.id},
        {"documentId", version.documentId},
        {"versionNumber", version.versionNumber},
        {"filename", version.filename},
        {"uploadedAt", ToEpochMillis(version.uploadedAt)},
        {"metadata", {
            {"pageCount", version.metadata.pageCount},
            {"wordCount", version.metadata.wordCount},
            {"language", version.metadata.language},
            {"extractedText", version.metadata.extractedText}
        }}
    };
    j["analysis"] = version.analysis ? AnalysisToJson(*version.analysis) : json(nullptr);
    j["parentVersionId"] = version.parentVersionId ? json(*version.parentVersionId) : json(nullptr);
    return j;
}

DocumentVersion VersionFromJson(const json& j) {
    DocumentVersion version;
    version.id = j.at("id").get<std::string>();
    version.documentId = j.at("documentId").get<std::string>();
    version.versionNumber = j.at("versionNumber").get<int>();
    version.filename = j.value("filename", "");
    version.uploadedAt = FromEpochMillis(j.value("uploadedAt", 0LL));

    const json& meta = j.at("metadata");
    version.metadata.pageCount = meta.value("pageCount", 0);
    version.metadata.wordCount = meta.value("wordCount", 0);
    version.metadata.language = meta.value("language", "");
    version.metadata.extractedText = meta.value("extractedText", "");

    if (j.contains("analysis") && !j["analysis"].is_null()) {
        version.analysis = AnalysisFromJson(j["analysis"]);
    }
    if (j.contains("parentVersionId") && j["parentVersionId"].is_string()) {
        version.parentVersionId = j["parentVersionId"].get<std::string>();
    }
    return version;
}

json ComparisonToJson(const DocumentComparison& comparison) {
    json changes = json::array();
    for (const auto& c : comparison.changes) {
        json jc = {
            {"id", c.id},
            {"type", ChangeTypeToString(c.type)},
            {"location", {{"startIndex", c.location.startIndex}, {"endIndex", c.location.endIndex}}},
            {"severity", SeverityToString(c.severity)},
            {"description", c.description}
        };
        if (c.originalText) jc["originalText"] = *c.originalText;
        if (c.newText) jc["newText"] = *c.newText;
        changes.push_back(std::move(jc));
    }

    json significant = json::array();
    for (const auto& s : comparison.impactAnalysis.significantChanges) {
        json js = {
            {"changeId", s.changeId},
            {"category", CategoryToString(s.category)},
            {"impact", ImpactToString(s.impact)},
            {"description", s.description}
        };
        if (s.recommendation) js["recommendation"] = *s.recommendation;
        significant.push_back(std::move(js));
    }

    return {
        {"id", comparison.id},
        {"originalVersionId", comparison.originalVersionId},
        {"comparedVersionId", comparison.comparedVersionId},
        {"comparedAt", ToEpochMillis(comparison.comparedAt)},
        {"changes", changes},
        {"impactAnalysis", {
            {"overallImpact", ImpactToString(comparison.impactAnalysis.overallImpact)},
            {"riskScoreChange", comparison.impactAnalysis.riskScoreChange},
            {"significantChanges", significant},
            {"summary", comparison.impactAnalysis.summary}
        }}
    };
}

DocumentComparison ComparisonFromJson(const json& j) {
    DocumentComparison comparison;
    comparison.id = j.at("id").get<std::string>();
    comparison.originalVersionId = j.at("originalVersionId").get<std::string>();
    comparison.comparedVersionId = j.at("comparedVersionId").get<std::string>();
    comparison.comparedAt = FromEpochMillis(j.value("comparedAt", 0LL));

    for (const auto& jc : j.at("changes")) {
        DocumentChange c;
        c.id = jc.at("id").get<std::string>();
        c.type = ChangeTypeFromString(jc.value("type", "addition"));
        if (jc.contains("originalText")) c.originalText = jc["originalText"].get<std::string>();
        if (jc.contains("newText")) c.newText = jc["newText"].get<std::string>();
        if (jc.contains("location")) {
            c.location.startIndex = jc["location"].value("startIndex", size_t{0});
            c.location.endIndex = jc["location"].value("endIndex", size_t{0});
        }
        c.severity = SeverityFromString(jc.value("severity", "low"));
        c.description = jc.value("description", "");
        comparison.changes.push_back(std::move(c));
    }

    const json& ji = j.at("impactAnalysis");
    comparison.impactAnalysis.overallImpact = ImpactFromString(ji.value("overallImpact", "neutral"));
    comparison.impactAnalysis.riskScoreChange = ji.value("riskScoreChange", 0);
    comparison.impactAnalysis.summary = ji.value("summary", "");
    if (ji.contains("significantChanges")) {
        for (const auto& js : ji["significantChanges"]) {
            SignificantChange s;
            s.changeId = js.value("changeId", "");
            s.category = CategoryFromString(js.value("category", "legal"));
            s.impact = ImpactFromString(js.value("impact", "neutral"));
            s.description = js.value("description", "");
            if (js.contains("recommendation")) s.recommendation = js["recommendation"].get<std::string>();
            comparison.impactAnalysis.significantChanges.push_back(std::move(s));
        }
    }
    return comparison;
}

} // namespace clausetrail::infrastructure::versioning
