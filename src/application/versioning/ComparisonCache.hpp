/**
 * @file ComparisonCache.hpp
 * @brief Compute-once cache of comparisons per ordered version pair.
 */

#pragma once

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "domain/versioning/repositories/IVersionRepository.hpp"
#include "domain/versioning/CancellationToken.hpp"
#include "application/versioning/DocumentComparisonService.hpp"

namespace clausetrail::application::versioning {

/**
 * @class ComparisonCache
 * @brief Returns the stored comparison for (original, compared) or computes and stores it.
 *
 * A stored comparison is returned verbatim forever, even if the versions'
 * analyses change later. Concurrent first requests for the same pair inside
 * this process share a single computation; separate processes sharing a
 * store may still both compute and insert.
 */
class ComparisonCache {
public:
    ComparisonCache(std::shared_ptr<IVersionRepository> repository,
                    std::shared_ptr<DocumentComparisonService> comparisonService);

    /**
     * @throws NotFoundError if either version is missing on a cache miss.
     * @throws OperationCancelled if the token fires; nothing is persisted then.
     */
    DocumentComparison compare(const std::string& originalVersionId,
                               const std::string& comparedVersionId,
                               const CancellationToken& token = CancellationToken());

    /** @brief How many comparisons this cache has computed (misses that completed). */
    size_t computedCount() const { return m_computed.load(); }

private:
    using PairKey = std::pair<std::string, std::string>;

    DocumentComparison computeAndStore(const std::string& originalVersionId,
                                       const std::string& comparedVersionId,
                                       const CancellationToken& token);

    std::shared_ptr<IVersionRepository> m_repository;
    std::shared_ptr<DocumentComparisonService> m_comparisonService;

    std::mutex m_inflightMutex;
    std::map<PairKey, std::shared_future<DocumentComparison>> m_inflight;
    std::atomic<size_t> m_computed{0};
};

} // namespace clausetrail::application::versioning
