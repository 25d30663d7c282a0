/**
 * @file TimestampMapping.hpp
 * @brief Note sections and their alignment onto the transcript timeline.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace timenotes::domain {

enum class SectionKind {
    TitleOnly,
    Content
};

/**
 * @struct NoteSection
 * @brief A heading-delimited block of the generated notes.
 */
struct NoteSection {
    std::string title;
    std::string content;
    int level = 1; ///< Heading depth (number of '#').
    SectionKind kind = SectionKind::Content;
};

/**
 * @struct TimestampRange
 * @brief One merged run of transcript segments claimed by a section.
 */
struct TimestampRange {
    double start = 0.0;
    double end = 0.0;
    std::string text;
    double similarity = 0.0;           ///< Best similarity inside the run.
    std::string matchedPhrase;         ///< Phrase that claimed the first segment.
    std::vector<std::size_t> segmentIndices;
};

/**
 * @struct SectionMapping
 * @brief A section together with the ranges it was aligned to.
 */
struct SectionMapping {
    NoteSection section;
    std::vector<TimestampRange> timestamps;
    std::optional<double> startTime;
    std::optional<double> endTime;
    double duration = 0.0;

    bool isMapped() const { return !timestamps.empty(); }
};

/**
 * @struct TimestampMapping
 * @brief Result of aligning a notes document against a transcript.
 */
struct TimestampMapping {
    std::vector<SectionMapping> sections;
    std::size_t totalSections = 0;
    std::size_t mappedSections = 0;
    double coveragePercentage = 0.0;
};

} // namespace timenotes::domain
