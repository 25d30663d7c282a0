/**
 * @file TimeNotesApp.cpp
 * @brief Implementation of the TimeNotesApp class.
 */

#include "app/TimeNotesApp.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>

#include "domain/PipelineErrors.hpp"
#include "infrastructure/FfmpegMediaExtractor.hpp"
#include "infrastructure/FileArtifactStore.hpp"
#include "infrastructure/FileCreditLedger.hpp"
#include "infrastructure/JobLogStore.hpp"
#include "infrastructure/JsonPlanDirectory.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaNotesGenerator.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RateLimiter.hpp"
#include "infrastructure/WhisperCppTranscriber.hpp"

namespace timenotes::app {

void TimeNotesApp::PrintUsage() {
    std::fprintf(stderr,
        "Usage:\n"
        "  timenotes process <input> [--owner ID] [--action TYPE] [--config FILE]\n"
        "  timenotes status <job_id> [--config FILE]\n"
        "  timenotes jobs --owner ID [--config FILE]\n"
        "  timenotes credits <owner> [--config FILE]\n"
        "\n"
        "Inputs: video or audio files (extracted with ffmpeg), .wav, .txt or .md documents.\n"
        "Actions: video_upload, youtube_download, pdf_upload, quiz_generation.\n");
}

int TimeNotesApp::Run(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string configPath;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const char* flag) -> bool {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", flag);
                return false;
            }
            return true;
        };
        if (arg == "--owner") {
            if (!needValue("--owner")) return 2;
            m_owner = argv[++i];
        } else if (arg == "--action") {
            if (!needValue("--action")) return 2;
            m_action = argv[++i];
        } else if (arg == "--config") {
            if (!needValue("--config")) return 2;
            configPath = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return 0;
    }

    if (!Init(configPath)) {
        return 1;
    }

    if (command == "process" && positional.size() == 1) {
        return CmdProcess(positional[0]);
    }
    if (command == "status" && positional.size() == 1) {
        return CmdStatus(positional[0]);
    }
    if (command == "jobs" && positional.empty() && !m_owner.empty()) {
        return CmdJobs();
    }
    if (command == "credits" && positional.size() == 1) {
        return CmdCredits(positional[0]);
    }

    PrintUsage();
    return 2;
}

bool TimeNotesApp::Init(const std::string& configPath) {
    m_config = infrastructure::ConfigLoader::Load(
        configPath.empty() ? infrastructure::ConfigLoader::DefaultSettingsPath() : std::filesystem::path(configPath));

    for (const auto& dir : {m_config.dataDir, m_config.outputDir, m_config.tempDir}) {
        if (!infrastructure::PathUtils::EnsureDirectory(dir)) {
            std::fprintf(stderr, "Failed to initialize folder structure at %s\n", dir.string().c_str());
            return false;
        }
    }

    // Composition Root
    auto limiter = std::make_shared<infrastructure::RateLimiter>(
        std::chrono::milliseconds(static_cast<long long>(m_config.notesMinIntervalSeconds * 1000.0)));
    auto ollama = std::make_shared<infrastructure::OllamaClient>(m_config.ollamaHost, m_config.ollamaPort, limiter);

    m_services.artifacts = std::make_shared<infrastructure::FileArtifactStore>(m_config.outputDir);
    m_services.ledger = std::make_shared<infrastructure::FileCreditLedger>(m_config.creditsFile);
    m_services.notesGenerator = std::make_shared<infrastructure::OllamaNotesGenerator>(ollama, m_config.ollamaModel);

    auto jobLog = std::make_shared<infrastructure::JobLogStore>(m_config.jobsLog);
    m_services.registry = std::make_unique<application::JobRegistry>(jobLog, m_services.artifacts);
    m_services.workerPool = std::make_unique<application::WorkerPool>(m_config.maxWorkers);
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();

    application::PipelineCollaborators collaborators;
    collaborators.extractor = std::make_shared<infrastructure::FfmpegMediaExtractor>(m_config.ffmpegPath, m_config.ffprobePath);
    collaborators.transcriber = std::make_shared<infrastructure::WhisperCppTranscriber>(
        m_config.whisperModelPath.string(), m_config.whisperLanguage);
    collaborators.notesGenerator = m_services.notesGenerator;
    collaborators.ledger = m_services.ledger;
    collaborators.artifacts = m_services.artifacts;
    collaborators.plans = std::make_shared<infrastructure::JsonPlanDirectory>(m_config.plansFile);

    application::PipelineSettings settings;
    settings.tempDir = m_config.tempDir;
    settings.cleanupTempFiles = m_config.cleanupTempFiles;

    m_services.orchestrator = std::make_unique<application::PipelineOrchestrator>(
        *m_services.registry, *m_services.workerPool, m_services.taskManager,
        std::move(collaborators), settings);

    std::cout << "[TimeNotesApp] Data directory: " << m_config.dataDir << std::endl;
    return true;
}

int TimeNotesApp::CmdProcess(const std::string& input) {
    auto action = domain::ActionFromString(m_action);
    if (!action) {
        std::fprintf(stderr, "Unknown action type: %s\n", m_action.c_str());
        return 2;
    }

    application::JobRequest request;
    request.inputPath = input;
    request.action = *action;
    if (!m_owner.empty()) {
        request.owner = m_owner;
    }

    std::string jobId = m_services.orchestrator->SubmitJob(request);
    std::cout << "[TimeNotesApp] Submitted job " << jobId << std::endl;
    m_services.orchestrator->WaitForIdle();

    auto job = m_services.registry->Get(jobId);
    if (!job) {
        std::fprintf(stderr, "Job %s vanished from the registry\n", jobId.c_str());
        return 1;
    }
    std::cout << application::JobRegistry::ToStatusJson(*job).dump(2) << std::endl;
    return job->status == domain::JobStatus::Completed ? 0 : 1;
}

int TimeNotesApp::CmdStatus(const std::string& jobId) {
    auto job = m_services.registry->Get(jobId);
    if (!job) {
        std::cout << nlohmann::json{{"error", "Job not found"}, {"job_id", jobId}}.dump(2) << std::endl;
        return 1;
    }
    std::cout << application::JobRegistry::ToStatusJson(*job).dump(2) << std::endl;
    return 0;
}

int TimeNotesApp::CmdJobs() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& job : m_services.registry->ListForOwner(m_owner)) {
        list.push_back(application::JobRegistry::ToStatusJson(job));
    }
    std::cout << list.dump(2) << std::endl;
    return 0;
}

int TimeNotesApp::CmdCredits(const std::string& owner) {
    try {
        auto result = m_services.ledger->check(owner, domain::ActionType::VideoUpload);
        std::cout << nlohmann::json{
            {"owner", owner},
            {"credits", result.currentCredits},
            {"cost_per_action", result.creditsNeeded}
        }.dump(2) << std::endl;
    } catch (const domain::LedgerError& e) {
        std::fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    return 0;
}

} // namespace timenotes::app
