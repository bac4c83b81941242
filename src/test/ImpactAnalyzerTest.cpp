#include <cassert>
#include <iostream>
#include <string>

#include "domain/versioning/services/DiffEngine.hpp"
#include "domain/versioning/services/ImpactAnalyzer.hpp"

using namespace clausetrail::domain::versioning;

namespace {

DocumentAnalysis analysisWith(RiskLevel level) {
    DocumentAnalysis analysis;
    analysis.riskScore = level;
    analysis.rawRiskScore = RiskLevelToString(level);
    return analysis;
}

DocumentChange change(ChangeType type, const std::string& text) {
    DocumentChange c;
    c.id = "c1";
    c.type = type;
    c.severity = Severity::High;
    c.description = "desc";
    if (type == ChangeType::Deletion) {
        c.originalText = text;
    } else {
        c.newText = text;
        if (type == ChangeType::Modification) c.originalText = "previous wording";
    }
    return c;
}

void testRiskScoreChange() {
    assert(ImpactAnalyzer::riskScoreChange(analysisWith(RiskLevel::Low), analysisWith(RiskLevel::High)) == 2);
    assert(ImpactAnalyzer::riskScoreChange(analysisWith(RiskLevel::High), analysisWith(RiskLevel::Medium)) == -1);
    assert(ImpactAnalyzer::riskScoreChange(std::nullopt, analysisWith(RiskLevel::High)) == 0);
    // Unrecognized labels count as low.
    assert(ImpactAnalyzer::riskScoreChange(analysisWith(RiskLevel::Unknown), analysisWith(RiskLevel::Low)) == 0);
    std::cout << "[PASS] riskScoreChange" << std::endl;
}

void testCategorization() {
    auto financial = ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "A late fee of 5% applies"));
    assert(financial && financial->category == ChangeCategory::Financial);
    assert(financial->impact == Impact::Unfavorable);
    assert(financial->changeId == "c1");
    assert(financial->recommendation);

    auto removedFee = ImpactAnalyzer::categorizeChange(change(ChangeType::Deletion, "A late fee of 5% applies"));
    assert(removedFee && removedFee->impact == Impact::Favorable);

    auto rights = ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "The licensee has the right to audit"));
    assert(rights && rights->category == ChangeCategory::Rights);
    assert(rights->impact == Impact::Favorable);

    auto lostRight = ImpactAnalyzer::categorizeChange(change(ChangeType::Deletion, "The licensee has the right to audit"));
    assert(lostRight && lostRight->impact == Impact::Unfavorable);

    auto obligation = ImpactAnalyzer::categorizeChange(change(ChangeType::Modification, "Tenant must maintain insurance"));
    assert(obligation && obligation->category == ChangeCategory::Obligations);
    assert(obligation->impact == Impact::Unfavorable);

    auto privacy = ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "Data shall remain confidential"));
    assert(privacy && privacy->category == ChangeCategory::Privacy);
    assert(privacy->impact == Impact::Neutral);

    auto legal = ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "Supplier accepts unlimited liability"));
    assert(legal && legal->category == ChangeCategory::Legal);
    assert(legal->impact == Impact::Unfavorable);

    // Financial is checked before rights.
    auto both = ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "The right to waive the payment"));
    assert(both && both->category == ChangeCategory::Financial);

    assert(!ImpactAnalyzer::categorizeChange(change(ChangeType::Addition, "Headings are for convenience only")));
    std::cout << "[PASS] categorizeChange" << std::endl;
}

void testOverallImpact() {
    assert(ImpactAnalyzer::determineOverallImpact({}, 0) == Impact::Neutral);
    assert(ImpactAnalyzer::determineOverallImpact({}, -1) == Impact::Favorable);
    assert(ImpactAnalyzer::determineOverallImpact({}, 2) == Impact::Unfavorable);

    SignificantChange good;
    good.impact = Impact::Favorable;
    SignificantChange bad;
    bad.impact = Impact::Unfavorable;
    assert(ImpactAnalyzer::determineOverallImpact({good, good, bad}, 0) == Impact::Favorable);
    assert(ImpactAnalyzer::determineOverallImpact({good, bad}, 0) == Impact::Neutral);
    // Risk movement dominates the change tally.
    assert(ImpactAnalyzer::determineOverallImpact({good, good}, 1) == Impact::Unfavorable);
    std::cout << "[PASS] determineOverallImpact" << std::endl;
}

void testAnalyzeReplacedPaymentTerm() {
    int next = 0;
    auto changes = DiffEngine::detectChanges("Payment is due within 30 days.",
                                             "Payment is due within 15 days.",
                                             [&next]() { return "id-" + std::to_string(++next); });

    ImpactAnalysis flat = ImpactAnalyzer::analyze(changes, std::nullopt, std::nullopt);
    assert(flat.riskScoreChange == 0);
    assert(flat.significantChanges.size() == 2);
    assert(flat.overallImpact == Impact::Neutral);

    ImpactAnalysis raised = ImpactAnalyzer::analyze(changes, analysisWith(RiskLevel::Low), analysisWith(RiskLevel::High));
    assert(raised.riskScoreChange == 2);
    assert(raised.overallImpact == Impact::Unfavorable);
    assert(raised.summary == "Found 2 changes between document versions, including 2 high-severity changes. "
                             "Overall risk level has increased. Significant changes affect: financial.");
    std::cout << "[PASS] analyze" << std::endl;
}

void testSummaryWithoutChanges() {
    assert(ImpactAnalyzer::generateSummary({}, {}, 0) == "Found 0 changes between document versions.");
    assert(ImpactAnalyzer::generateSummary({}, {}, -1) ==
           "Found 0 changes between document versions. Overall risk level has decreased.");
    std::cout << "[PASS] generateSummary" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ImpactAnalyzer Test..." << std::endl;
    testRiskScoreChange();
    testCategorization();
    testOverallImpact();
    testAnalyzeReplacedPaymentTerm();
    testSummaryWithoutChanges();
    std::cout << "[PASS] ImpactAnalyzer Test." << std::endl;
    return 0;
}
