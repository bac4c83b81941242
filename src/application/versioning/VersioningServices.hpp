/**
 * @file VersioningServices.hpp
 * @brief Container for versioning services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "domain/versioning/repositories/IVersionRepository.hpp"
#include "application/versioning/DocumentComparisonService.hpp"
#include "application/versioning/ComparisonCache.hpp"
#include "application/versioning/VersionStatisticsService.hpp"
#include "application/versioning/RetentionService.hpp"
#include "application/versioning/RetentionScheduler.hpp"
#include "application/versioning/DocumentVersioningService.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace clausetrail::application::versioning {

struct VersioningServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<IVersionRepository> repository;
    std::shared_ptr<DocumentComparisonService> comparisonService;
    std::shared_ptr<ComparisonCache> comparisonCache;
    std::shared_ptr<VersionStatisticsService> statisticsService;
    std::shared_ptr<RetentionService> retentionService;
    std::unique_ptr<RetentionScheduler> retentionScheduler;
    std::unique_ptr<DocumentVersioningService> versioningService;
};

} // namespace clausetrail::application::versioning
