/**
 * @file GraderServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/GradingOrchestrator.hpp"
#include "application/JobReaper.hpp"
#include "application/JobStore.hpp"
#include "domain/ResultRepository.hpp"

namespace codegrader::application {

/**
 * @struct GraderServices
 * @brief Members are declared in dependency order; the job store outlives its users.
 */
struct GraderServices {
    std::unique_ptr<JobStore> jobStore;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<domain::ResultRepository> repository;
    std::unique_ptr<GradingOrchestrator> orchestrator;
    std::unique_ptr<JobReaper> reaper;
};

} // namespace codegrader::application
