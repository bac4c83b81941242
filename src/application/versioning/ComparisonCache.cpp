/**
 * @file ComparisonCache.cpp
 * @brief Implementation of ComparisonCache.
 */

#include "application/versioning/ComparisonCache.hpp"
#include "domain/versioning/VersioningErrors.hpp"
#include <chrono>

namespace clausetrail::application::versioning {

ComparisonCache::ComparisonCache(std::shared_ptr<IVersionRepository> repository,
                                 std::shared_ptr<DocumentComparisonService> comparisonService)
    : m_repository(std::move(repository)), m_comparisonService(std::move(comparisonService)) {}

DocumentComparison ComparisonCache::compare(const std::string& originalVersionId,
                                            const std::string& comparedVersionId,
                                            const CancellationToken& token) {
    const PairKey key{originalVersionId, comparedVersionId};

    while (true) {
        if (auto existing = m_repository->getComparison(originalVersionId, comparedVersionId)) {
            return *existing;
        }

        std::promise<DocumentComparison> promise;
        std::shared_future<DocumentComparison> pending;
        bool leader = false;
        {
            std::lock_guard<std::mutex> lock(m_inflightMutex);
            auto it = m_inflight.find(key);
            if (it != m_inflight.end()) {
                pending = it->second;
            } else {
                pending = promise.get_future().share();
                m_inflight.emplace(key, pending);
                leader = true;
            }
        }

        if (!leader) {
            while (pending.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
                token.throwIfCancelled();
            }
            try {
                return pending.get();
            } catch (const OperationCancelled&) {
                // The leader was cancelled, not us. Try again with our own token.
                token.throwIfCancelled();
                continue;
            }
        }

        try {
            DocumentComparison result = computeAndStore(originalVersionId, comparedVersionId, token);
            {
                std::lock_guard<std::mutex> lock(m_inflightMutex);
                m_inflight.erase(key);
            }
            promise.set_value(result);
            return result;
        } catch (...) {
            {
                std::lock_guard<std::mutex> lock(m_inflightMutex);
                m_inflight.erase(key);
            }
            promise.set_exception(std::current_exception());
            throw;
        }
    }
}

DocumentComparison ComparisonCache::computeAndStore(const std::string& originalVersionId,
                                                    const std::string& comparedVersionId,
                                                    const CancellationToken& token) {
    // Another leader may have finished between our lookup and registration.
    if (auto existing = m_repository->getComparison(originalVersionId, comparedVersionId)) {
        return *existing;
    }

    auto originalVersion = m_repository->getVersionById(originalVersionId);
    auto comparedVersion = m_repository->getVersionById(comparedVersionId);
    if (!originalVersion || !comparedVersion) {
        throw NotFoundError("One or both versions not found: " + originalVersionId + ", " + comparedVersionId);
    }

    DocumentComparison comparison = m_comparisonService->compareDocuments(*originalVersion, *comparedVersion, token);
    token.throwIfCancelled();

    m_repository->saveComparison(comparison);
    ++m_computed;
    return comparison;
}

} // namespace clausetrail::application::versioning
