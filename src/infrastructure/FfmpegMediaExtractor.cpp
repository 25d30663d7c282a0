#include "infrastructure/FfmpegMediaExtractor.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "domain/PipelineErrors.hpp"

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
    std::string Tail(const std::string& text, size_t maxChars) {
        return text.size() <= maxChars ? text : text.substr(text.size() - maxChars);
    }
}

FfmpegMediaExtractor::FfmpegMediaExtractor(std::string ffmpegPath, std::string ffprobePath, int timeoutSeconds)
    : m_ffmpegPath(std::move(ffmpegPath)),
      m_ffprobePath(std::move(ffprobePath)),
      m_timeoutSeconds(timeoutSeconds) {}

void FfmpegMediaExtractor::extractAudio(const std::string& inputPath, const std::string& outputPath) {
    std::error_code ec;
    if (!fs::exists(inputPath, ec)) {
        throw domain::AcquisitionError("Media file not found: " + inputPath);
    }

    CommandResult res = AudioUtils::RunCommand({
        m_ffmpegPath, "-loglevel", "error",
        "-i", inputPath,
        "-vn",
        "-acodec", "pcm_s16le",
        "-ar", "16000",
        "-ac", "1",
        "-y", outputPath
    }, m_timeoutSeconds);

    if (res.timedOut) {
        throw domain::AcquisitionError("Audio extraction timed out after " + std::to_string(m_timeoutSeconds) + "s");
    }
    if (res.exitCode != 0) {
        throw domain::AcquisitionError("Audio extraction failed: " + Tail(res.output, 500));
    }
    if (!fs::exists(outputPath, ec) || fs::file_size(outputPath, ec) == 0) {
        throw domain::AcquisitionError("Audio extraction produced no output: " + outputPath);
    }
    std::cout << "[FfmpegMediaExtractor] Extracted audio to " << outputPath << std::endl;
}

std::optional<double> FfmpegMediaExtractor::ParseProbeOutput(const std::string& text) {
    try {
        auto j = json::parse(text);
        if (!j.contains("format") || !j["format"].contains("duration")) {
            return std::nullopt;
        }
        const auto& duration = j["format"]["duration"];
        if (duration.is_number()) {
            return duration.get<double>();
        }
        if (duration.is_string()) {
            return std::stod(duration.get<std::string>());
        }
    } catch (const std::exception& e) {
        std::cerr << "[FfmpegMediaExtractor] Unreadable ffprobe output: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<double> FfmpegMediaExtractor::probeDuration(const std::string& inputPath) {
    CommandResult res = AudioUtils::RunCommand({
        m_ffprobePath, "-v", "quiet",
        "-print_format", "json",
        "-show_format",
        inputPath
    }, 30);

    if (res.exitCode != 0) {
        std::cerr << "[FfmpegMediaExtractor] ffprobe failed for " << inputPath << " (exit " << res.exitCode << ")" << std::endl;
        return std::nullopt;
    }
    return ParseProbeOutput(res.output);
}

} // namespace timenotes::infrastructure
