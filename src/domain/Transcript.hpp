/**
 * @file Transcript.hpp
 * @brief Value types produced by the transcription collaborator.
 */

#pragma once

#include <string>
#include <vector>

namespace timenotes::domain {

/**
 * @struct TranscriptSegment
 * @brief A time-coded span of transcribed speech. Offsets are in seconds.
 */
struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

/**
 * @struct Transcript
 * @brief Full transcription output. Segments are sorted and non-overlapping.
 */
struct Transcript {
    std::string text;
    std::string language;
    std::vector<TranscriptSegment> segments;
};

} // namespace timenotes::domain
