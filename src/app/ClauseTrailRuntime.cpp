/**
 * @file ClauseTrailRuntime.cpp
 * @brief Implementation of the ClauseTrailRuntime composition root.
 */

#include "app/ClauseTrailRuntime.hpp"
#include "infrastructure/IdGenerator.hpp"
#include "infrastructure/versioning/VersionRepositoryFs.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace clausetrail::app {

ClauseTrailRuntime::ClauseTrailRuntime(std::string projectRoot)
    : m_projectRoot(std::move(projectRoot)) {}

ClauseTrailRuntime::~ClauseTrailRuntime() {
    Shutdown();
}

bool ClauseTrailRuntime::Init(bool startScheduler) {
    using namespace application::versioning;

    m_config = infrastructure::ConfigLoader::Load(m_projectRoot);

    std::error_code ec;
    std::filesystem::create_directories(m_config.storageRoot, ec);
    if (ec) {
        std::cerr << "[ClauseTrailRuntime] Failed to create storage root " << m_config.storageRoot
                  << ": " << ec.message() << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    auto clock = [] { return std::chrono::system_clock::now(); };

    VersioningServices services;
    services.persistenceService = std::make_shared<infrastructure::PersistenceService>();

    auto repo = std::make_shared<infrastructure::versioning::VersionRepositoryFs>(
        m_config.storageRoot, services.persistenceService);
    try {
        repo->load();
    } catch (const std::exception& e) {
        std::cerr << "[ClauseTrailRuntime] Failed to load store: " << e.what() << std::endl;
        return false;
    }
    services.repository = repo;

    services.comparisonService = std::make_shared<DocumentComparisonService>(&infrastructure::IdGenerator::uuid4, clock);
    services.comparisonCache = std::make_shared<ComparisonCache>(services.repository, services.comparisonService);
    services.statisticsService = std::make_shared<VersionStatisticsService>(services.repository, services.comparisonCache);
    services.retentionService = std::make_shared<RetentionService>(services.repository, clock);
    services.versioningService = std::make_unique<DocumentVersioningService>(
        services.repository,
        services.comparisonCache,
        services.statisticsService,
        services.retentionService,
        clock,
        std::chrono::milliseconds(m_config.comparisonTimeoutMs),
        static_cast<size_t>(m_config.historyPageLimit));

    services.retentionScheduler = std::make_unique<RetentionScheduler>(
        services.retentionService,
        m_config.retentionDays,
        std::chrono::minutes(m_config.sweepIntervalMinutes));

    m_services = std::move(services);
    m_initialized = true;

    if (startScheduler) {
        m_services.retentionScheduler->start();
    }

    std::cout << "[ClauseTrailRuntime] Store ready at " << m_config.storageRoot
              << " (retention " << m_config.retentionDays << " days)" << std::endl;
    return true;
}

void ClauseTrailRuntime::Shutdown() {
    if (!m_initialized) return;
    m_initialized = false;

    if (m_services.retentionScheduler) {
        m_services.retentionScheduler->stop();
    }
    if (m_services.persistenceService) {
        m_services.persistenceService->flush();
        m_services.persistenceService->stop();
    }
}

application::versioning::DocumentVersioningService& ClauseTrailRuntime::versioning() {
    if (!m_initialized || !m_services.versioningService) {
        throw std::logic_error("ClauseTrailRuntime used before Init()");
    }
    return *m_services.versioningService;
}

} // namespace clausetrail::app
