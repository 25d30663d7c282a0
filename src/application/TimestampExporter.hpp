/**
 * @file TimestampExporter.hpp
 * @brief Renders a TimestampMapping for programmatic consumers, readers and video players.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "domain/TimestampMapping.hpp"

namespace timenotes::application {

/**
 * @class TimestampExporter
 * @brief Stateless renderers for an aligned notes document.
 *
 * @note Subtitle cues follow document order. Sections can map to earlier
 *       audio than the section before them, and one section's span can
 *       enclose another's, so SRT and VTT cue times may go backwards or
 *       overlap.
 */
class TimestampExporter {
public:
    /** @brief Structured form, also written as the timestamped JSON artifact. */
    static nlohmann::json ToJson(const domain::TimestampMapping& mapping);

    /** @brief Annotated outline: each header tagged with its `[MM:SS - MM:SS]` range. */
    static std::string ToMarkdown(const domain::TimestampMapping& mapping);

    /** @brief SubRip cues, one per mapped section, numbered from 1. */
    static std::string ToSrt(const domain::TimestampMapping& mapping);

    /** @brief WebVTT cues, one per mapped section. */
    static std::string ToVtt(const domain::TimestampMapping& mapping);

    static std::string FormatClock(double seconds, char millisSeparator);
    static std::string FormatMinutes(double seconds);
};

} // namespace timenotes::application
