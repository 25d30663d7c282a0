/**
 * @file MediaExtractor.hpp
 * @brief Interface for media probing and audio extraction.
 */

#pragma once

#include <optional>
#include <string>

namespace timenotes::domain {

class MediaExtractor {
public:
    virtual ~MediaExtractor() = default;

    /**
     * @brief Extracts a 16 kHz mono PCM WAV track from a media file.
     * @throws AcquisitionError if the media cannot be decoded.
     */
    virtual void extractAudio(const std::string& inputPath, const std::string& outputPath) = 0;

    /** @brief Media duration in seconds, or nullopt if it cannot be determined. */
    virtual std::optional<double> probeDuration(const std::string& inputPath) = 0;
};

} // namespace timenotes::domain
