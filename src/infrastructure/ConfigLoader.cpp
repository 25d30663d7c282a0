/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    fs::path Resolve(const fs::path& base, const std::string& value) {
        fs::path p(value);
        return p.is_absolute() ? p : base / p;
    }

    const char* Env(const char* name) {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    }

    bool ParseWorkers(const std::string& text, size_t& out) {
        try {
            long value = std::stol(text);
            if (value < 1) return false;
            out = static_cast<size_t>(value);
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    bool ParseInterval(const std::string& text, double& out) {
        try {
            double value = std::stod(text);
            if (value < 0.0) return false;
            out = value;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
}

PipelineConfig ConfigLoader::Defaults(const fs::path& dataDir) {
    PipelineConfig config;
    config.dataDir = dataDir;
    config.outputDir = dataDir / "outputs";
    config.tempDir = dataDir / "temp";
    config.jobsLog = dataDir / "jobs.ndjson";
    config.creditsFile = dataDir / "credits.json";
    config.plansFile = dataDir / "plans.json";
    config.whisperModelPath = dataDir / "models" / "ggml-base.bin";
    return config;
}

fs::path ConfigLoader::DefaultSettingsPath() {
    return PathUtils::GetAppDataDir() / "settings.json";
}

PipelineConfig ConfigLoader::Load(const fs::path& settingsFile) {
    fs::path base = settingsFile.has_parent_path() ? settingsFile.parent_path() : fs::current_path();
    PipelineConfig config = Defaults(base);

    std::error_code ec;
    if (fs::exists(settingsFile, ec)) {
        try {
            std::ifstream f(settingsFile);
            json j;
            f >> j;

            if (j.contains("output_dir")) config.outputDir = Resolve(base, j["output_dir"].get<std::string>());
            if (j.contains("temp_dir")) config.tempDir = Resolve(base, j["temp_dir"].get<std::string>());
            if (j.contains("jobs_log")) config.jobsLog = Resolve(base, j["jobs_log"].get<std::string>());
            if (j.contains("credits_file")) config.creditsFile = Resolve(base, j["credits_file"].get<std::string>());
            if (j.contains("plans_file")) config.plansFile = Resolve(base, j["plans_file"].get<std::string>());
            if (j.contains("whisper_model_path")) {
                config.whisperModelPath = Resolve(base, j["whisper_model_path"].get<std::string>());
            }
            config.cleanupTempFiles = j.value("cleanup_temp_files", config.cleanupTempFiles);
            config.ollamaHost = j.value("ollama_host", config.ollamaHost);
            config.ollamaPort = j.value("ollama_port", config.ollamaPort);
            config.ollamaModel = j.value("ollama_model", config.ollamaModel);
            config.whisperLanguage = j.value("whisper_language", config.whisperLanguage);
            config.ffmpegPath = j.value("ffmpeg_path", config.ffmpegPath);
            config.ffprobePath = j.value("ffprobe_path", config.ffprobePath);

            if (j.contains("max_workers")) {
                int workers = j["max_workers"].get<int>();
                if (workers >= 1) {
                    config.maxWorkers = static_cast<size_t>(workers);
                } else {
                    std::cerr << "[ConfigLoader] Ignoring max_workers=" << workers << ", using "
                              << config.maxWorkers << std::endl;
                }
            }
            if (j.contains("notes_min_interval_seconds")) {
                double interval = j["notes_min_interval_seconds"].get<double>();
                if (interval >= 0.0) {
                    config.notesMinIntervalSeconds = interval;
                } else {
                    std::cerr << "[ConfigLoader] Ignoring negative notes_min_interval_seconds" << std::endl;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Error reading " << settingsFile << ", using defaults: " << e.what() << std::endl;
            config = Defaults(base);
        }
    }

    ApplyEnvironment(config);
    return config;
}

void ConfigLoader::ApplyEnvironment(PipelineConfig& config) {
    if (const char* v = Env("TIMENOTES_OUTPUT_DIR")) config.outputDir = v;
    if (const char* v = Env("TIMENOTES_MAX_WORKERS")) {
        if (!ParseWorkers(v, config.maxWorkers)) {
            std::cerr << "[ConfigLoader] Invalid TIMENOTES_MAX_WORKERS '" << v << "'" << std::endl;
        }
    }
    if (const char* v = Env("OLLAMA_HOST")) config.ollamaHost = v;
    if (const char* v = Env("OLLAMA_MODEL")) config.ollamaModel = v;
    if (const char* v = Env("WHISPER_MODEL_PATH")) config.whisperModelPath = v;
    if (const char* v = Env("FFMPEG_PATH")) config.ffmpegPath = v;
    if (const char* v = Env("FFPROBE_PATH")) config.ffprobePath = v;
    if (const char* v = Env("NOTES_MIN_INTERVAL_SECONDS")) {
        if (!ParseInterval(v, config.notesMinIntervalSeconds)) {
            std::cerr << "[ConfigLoader] Invalid NOTES_MIN_INTERVAL_SECONDS '" << v << "'" << std::endl;
        }
    }
}

} // namespace timenotes::infrastructure
