/**
 * @file ClauseTrailRuntime.hpp
 * @brief Composition root wiring configuration, storage and versioning services.
 */

#pragma once

#include <string>
#include "application/versioning/VersioningServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace clausetrail::app {

/**
 * @class ClauseTrailRuntime
 * @brief Owns the service graph for one project root and its retention thread.
 */
class ClauseTrailRuntime {
public:
    explicit ClauseTrailRuntime(std::string projectRoot);
    ~ClauseTrailRuntime();

    ClauseTrailRuntime(const ClauseTrailRuntime&) = delete;
    ClauseTrailRuntime& operator=(const ClauseTrailRuntime&) = delete;

    /**
     * @brief Loads settings.json, opens the store and builds the services.
     * @param startScheduler Start the periodic retention sweep.
     * @return True if initialization succeeded.
     */
    bool Init(bool startScheduler = true);

    /**
     * @brief Stops the sweep and drains pending writes. Safe to call twice.
     */
    void Shutdown();

    application::versioning::DocumentVersioningService& versioning();
    const infrastructure::VersioningConfig& config() const { return m_config; }

private:
    std::string m_projectRoot;
    infrastructure::VersioningConfig m_config;
    application::versioning::VersioningServices m_services; ///< Empty until Init succeeds.
    bool m_initialized = false;
};

} // namespace clausetrail::app
