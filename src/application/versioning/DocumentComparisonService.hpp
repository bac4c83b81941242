/**
 * @file DocumentComparisonService.hpp
 * @brief Produces a complete comparison (changes + impact) for two versions.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "domain/versioning/DocumentVersion.hpp"
#include "domain/versioning/DocumentComparison.hpp"
#include "domain/versioning/CancellationToken.hpp"

namespace clausetrail::application::versioning {

using namespace clausetrail::domain::versioning;

/**
 * @class DocumentComparisonService
 * @brief Runs DiffEngine and ImpactAnalyzer and stamps the result with an id and time.
 *
 * Holds no mutable state; one instance can serve any number of threads.
 */
class DocumentComparisonService {
public:
    using IdFactory = std::function<std::string()>;
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    DocumentComparisonService(IdFactory idFactory, Clock clock);

    /**
     * @brief Compares the extracted texts of two versions, in that order.
     * @throws OperationCancelled if the token fires before the diff completes.
     */
    DocumentComparison compareDocuments(const DocumentVersion& originalVersion,
                                        const DocumentVersion& comparedVersion,
                                        const CancellationToken& token = CancellationToken()) const;

private:
    IdFactory m_idFactory;
    Clock m_clock;
};

} // namespace clausetrail::application::versioning
