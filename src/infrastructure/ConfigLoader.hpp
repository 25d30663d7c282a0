/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the pipeline configuration (settings.json).
 *
 * Keeps JSON parsing and environment overrides in one place so the rest of
 * the codebase receives a plain PipelineConfig.
 */

#pragma once

#include <filesystem>
#include <string>

namespace timenotes::infrastructure {

struct PipelineConfig {
    std::filesystem::path dataDir;
    std::filesystem::path outputDir;
    std::filesystem::path tempDir;
    std::filesystem::path jobsLog;
    std::filesystem::path creditsFile;
    std::filesystem::path plansFile;
    size_t maxWorkers = 2;
    bool cleanupTempFiles = true;
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "llama3";
    std::filesystem::path whisperModelPath;
    std::string whisperLanguage = "auto";
    double notesMinIntervalSeconds = 1.0;
    std::string ffmpegPath = "ffmpeg";
    std::string ffprobePath = "ffprobe";
};

class ConfigLoader {
public:
    /** @brief Defaults rooted at @p dataDir. */
    static PipelineConfig Defaults(const std::filesystem::path& dataDir);

    /**
     * @brief Reads @p settingsFile over the defaults, then applies environment overrides.
     *
     * A missing file yields the defaults. Unreadable files and invalid values
     * are logged and fall back to the defaults. Relative paths resolve against
     * the settings file's directory.
     */
    static PipelineConfig Load(const std::filesystem::path& settingsFile);

    /** @brief settings.json inside the per-user data directory. */
    static std::filesystem::path DefaultSettingsPath();

    static void ApplyEnvironment(PipelineConfig& config);
};

} // namespace timenotes::infrastructure
