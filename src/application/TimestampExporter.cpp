#include "application/TimestampExporter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace timenotes::application {

using json = nlohmann::json;
using domain::SectionKind;

namespace {
    long long ToMillis(double seconds) {
        if (seconds < 0.0) seconds = 0.0;
        return std::llround(seconds * 1000.0);
    }

    /** UTF-8 safe prefix of at most @p maxBytes bytes. */
    std::string Excerpt(const std::string& text, size_t maxBytes) {
        if (text.size() <= maxBytes) return text;
        size_t cut = maxBytes;
        while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
        return text.substr(0, cut);
    }
}

std::string TimestampExporter::FormatClock(double seconds, char millisSeparator) {
    long long total = ToMillis(seconds);
    long long millis = total % 1000;
    long long secs = (total / 1000) % 60;
    long long minutes = (total / 60000) % 60;
    long long hours = total / 3600000;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld%c%03lld", hours, minutes, secs, millisSeparator, millis);
    return buf;
}

std::string TimestampExporter::FormatMinutes(double seconds) {
    long long whole = seconds < 0.0 ? 0 : static_cast<long long>(std::floor(seconds));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", whole / 60, whole % 60);
    return buf;
}

json TimestampExporter::ToJson(const domain::TimestampMapping& mapping) {
    json sections = json::array();
    for (const auto& s : mapping.sections) {
        json timestamps = json::array();
        for (const auto& r : s.timestamps) {
            timestamps.push_back({
                {"start", r.start},
                {"end", r.end},
                {"text", r.text},
                {"similarity", r.similarity},
                {"matched_phrase", r.matchedPhrase},
                {"segment_indices", r.segmentIndices},
                {"segment_count", r.segmentIndices.size()}
            });
        }
        sections.push_back({
            {"title", s.section.title},
            {"content", s.section.content},
            {"level", s.section.level},
            {"type", s.section.kind == SectionKind::TitleOnly ? "title" : "content"},
            {"timestamps", timestamps},
            {"start_time", s.startTime ? json(*s.startTime) : json(nullptr)},
            {"end_time", s.endTime ? json(*s.endTime) : json(nullptr)},
            {"duration", s.duration}
        });
    }

    return {
        {"sections", sections},
        {"total_sections", mapping.totalSections},
        {"mapped_sections", mapping.mappedSections},
        {"coverage_percentage", mapping.coveragePercentage}
    };
}

std::string TimestampExporter::ToMarkdown(const domain::TimestampMapping& mapping) {
    std::ostringstream md;
    md << "# Timestamped Learning Notes\n\n";
    md << "**Coverage:** " << std::fixed << std::setprecision(1) << mapping.coveragePercentage
       << "% of original audio\n\n";
    md << "---\n\n";

    for (const auto& s : mapping.sections) {
        md << std::string(static_cast<size_t>(std::min(s.section.level + 1, 6)), '#') << " " << s.section.title;
        if (s.startTime && s.endTime) {
            md << " `[" << FormatMinutes(*s.startTime) << " - " << FormatMinutes(*s.endTime) << "]`";
        } else {
            md << " `[No timestamp found]`";
        }
        if (s.section.kind == SectionKind::TitleOnly) {
            md << " `[TITLE]`";
        }
        md << "\n\n";

        if (!s.section.content.empty()) {
            md << s.section.content << "\n\n";
        } else {
            md << "*This is a title-only section without additional content.*\n\n";
        }

        if (s.isMapped()) {
            md << "**Audio Segments:**\n";
            for (const auto& r : s.timestamps) {
                md << "- " << FormatMinutes(r.start) << " - " << FormatMinutes(r.end) << ": ";
                if (r.text.size() > 100) {
                    md << Excerpt(r.text, 100) << "...";
                } else {
                    md << r.text;
                }
                md << "\n";
            }
            md << "\n";
        }
        md << "---\n\n";
    }
    return md.str();
}

std::string TimestampExporter::ToSrt(const domain::TimestampMapping& mapping) {
    std::ostringstream srt;
    int counter = 1;
    for (const auto& s : mapping.sections) {
        if (!s.isMapped()) continue;
        srt << counter++ << "\n"
            << FormatClock(*s.startTime, ',') << " --> " << FormatClock(*s.endTime, ',') << "\n"
            << s.section.title << "\n\n";
    }
    return srt.str();
}

std::string TimestampExporter::ToVtt(const domain::TimestampMapping& mapping) {
    std::ostringstream vtt;
    vtt << "WEBVTT\n\n";
    for (const auto& s : mapping.sections) {
        if (!s.isMapped()) continue;
        vtt << FormatClock(*s.startTime, '.') << " --> " << FormatClock(*s.endTime, '.') << "\n"
            << s.section.title << "\n\n";
    }
    return vtt.str();
}

} // namespace timenotes::application
