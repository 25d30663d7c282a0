/**
 * @file FfmpegMediaExtractor.hpp
 * @brief MediaExtractor that shells out to ffmpeg and ffprobe.
 */

#pragma once

#include "domain/MediaExtractor.hpp"
#include <string>

namespace timenotes::infrastructure {

class FfmpegMediaExtractor : public domain::MediaExtractor {
public:
    static constexpr int kDefaultTimeoutSeconds = 120;

    FfmpegMediaExtractor(std::string ffmpegPath = "ffmpeg",
                         std::string ffprobePath = "ffprobe",
                         int timeoutSeconds = kDefaultTimeoutSeconds);

    void extractAudio(const std::string& inputPath, const std::string& outputPath) override;
    std::optional<double> probeDuration(const std::string& inputPath) override;

    /** @brief Reads format.duration from ffprobe's JSON output. */
    static std::optional<double> ParseProbeOutput(const std::string& json);

private:
    std::string m_ffmpegPath;
    std::string m_ffprobePath;
    int m_timeoutSeconds;
};

} // namespace timenotes::infrastructure
