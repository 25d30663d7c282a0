/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/JobRegistry.hpp"
#include "application/PipelineOrchestrator.hpp"
#include "application/WorkerPool.hpp"
#include "domain/ArtifactStore.hpp"
#include "domain/CreditLedger.hpp"
#include "domain/NotesGenerator.hpp"

namespace timenotes::application {

/**
 * @struct AppServices
 * @brief Owns the running pipeline. Members are destroyed bottom-up, so the
 * orchestrator drains its jobs before the pool and registry go away.
 */
struct AppServices {
    std::shared_ptr<domain::ArtifactStore> artifacts;
    std::shared_ptr<domain::CreditLedger> ledger;
    std::shared_ptr<domain::NotesGenerator> notesGenerator;
    std::unique_ptr<JobRegistry> registry;
    std::unique_ptr<WorkerPool> workerPool;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::unique_ptr<PipelineOrchestrator> orchestrator;
};

} // namespace timenotes::application
