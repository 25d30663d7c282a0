/**
 * @file TimeNotesApp.hpp
 * @brief Command-line front end for the TimeNotes pipeline.
 */

#pragma once

#include <string>
#include <vector>

#include "application/AppServices.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace timenotes::app {

/**
 * @class TimeNotesApp
 * @brief Parses the command line, wires the services and dispatches one command.
 *
 * Commands:
 *   process <input> [--owner ID] [--action TYPE] [--config FILE]
 *   status <job_id> [--config FILE]
 *   jobs --owner ID [--config FILE]
 *   credits <owner> [--config FILE]
 */
class TimeNotesApp {
public:
    /**
     * @brief Runs one command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

    static void PrintUsage();

private:
    /**
     * @brief Loads configuration and builds every service.
     * @return True if initialization succeeded.
     */
    bool Init(const std::string& configPath);

    int CmdProcess(const std::string& input);
    int CmdStatus(const std::string& jobId);
    int CmdJobs();
    int CmdCredits(const std::string& owner);

    infrastructure::PipelineConfig m_config;
    application::AppServices m_services;
    std::string m_owner;
    std::string m_action = "video_upload";
};

} // namespace timenotes::app
