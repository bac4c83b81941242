/**
 * @file DocumentComparisonService.cpp
 * @brief Implementation of DocumentComparisonService.
 */

#include "application/versioning/DocumentComparisonService.hpp"
#include "domain/versioning/services/DiffEngine.hpp"
#include "domain/versioning/services/ImpactAnalyzer.hpp"

namespace clausetrail::application::versioning {

DocumentComparisonService::DocumentComparisonService(IdFactory idFactory, Clock clock)
    : m_idFactory(std::move(idFactory)), m_clock(std::move(clock)) {}

DocumentComparison DocumentComparisonService::compareDocuments(const DocumentVersion& originalVersion,
                                                               const DocumentVersion& comparedVersion,
                                                               const CancellationToken& token) const {
    auto changes = DiffEngine::detectChanges(originalVersion.metadata.extractedText,
                                             comparedVersion.metadata.extractedText,
                                             m_idFactory,
                                             token);

    DocumentComparison comparison;
    comparison.id = m_idFactory();
    comparison.originalVersionId = originalVersion.id;
    comparison.comparedVersionId = comparedVersion.id;
    comparison.comparedAt = TruncateToMillis(m_clock());
    comparison.impactAnalysis = ImpactAnalyzer::analyze(changes, originalVersion.analysis, comparedVersion.analysis);
    comparison.changes = std::move(changes);
    return comparison;
}

} // namespace clausetrail::application::versioning
