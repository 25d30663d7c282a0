/**
 * @file TimestampAligner.hpp
 * @brief Maps generated note sections back onto time-coded transcript segments.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/TimestampMapping.hpp"
#include "domain/Transcript.hpp"

namespace timenotes::application {

/**
 * @class TimestampAligner
 * @brief Fuzzy text-to-timeline alignment of a heading-delimited notes document.
 *
 * Sections are processed in document order. Each section extracts up to
 * maxPhrases phrases, each phrase claims up to matchesPerPhrase unclaimed
 * segments scoring at least similarityThreshold, and a claimed segment is
 * never offered to any later phrase or section. Claimed segments are then
 * merged into ranges when the gap between them is at most maxMergeGap.
 *
 * The aligner holds no mutable state and is safe to call from several threads.
 */
class TimestampAligner {
public:
    struct Options {
        double similarityThreshold = 0.3;
        size_t minContentLength = 10;   ///< Shorter bodies are matched on the title.
        size_t minSentenceLength = 20;  ///< Exclusive lower bound.
        size_t maxSentenceLength = 200; ///< Exclusive upper bound.
        size_t minQuoteLength = 10;     ///< Exclusive lower bound.
        size_t maxPhrases = 10;
        size_t matchesPerPhrase = 3;
        double maxMergeGap = 5.0;       ///< Seconds.
    };

    TimestampAligner() = default;
    explicit TimestampAligner(Options options) : m_options(options) {}

    /**
     * @brief Aligns @p notes against @p segments.
     *
     * Notes without any heading yield an empty mapping with zero coverage.
     */
    domain::TimestampMapping Align(const std::string& notes,
                                   const std::vector<domain::TranscriptSegment>& segments) const;

    const Options& GetOptions() const { return m_options; }

    /** @brief Splits markdown into sections at `#`..`######` headings. Text before the first heading is ignored. */
    static std::vector<domain::NoteSection> ParseSections(const std::string& notes);

    std::vector<std::string> ExtractPhrases(const std::string& text) const;

    static bool IsFillerSentence(const std::string& sentence);

    /** @brief Lowercases ASCII and drops characters that are neither word characters nor whitespace. */
    static std::string Normalize(const std::string& text);

    /**
     * @brief Ratcliff/Obershelp ratio 2*M/(|a|+|b|) of the normalized strings.
     *
     * M counts characters in the matching blocks found by recursively taking
     * the longest common block. No junk heuristic is applied.
     */
    static double Similarity(const std::string& a, const std::string& b);

private:
    std::vector<domain::TimestampRange> MergeClaims(std::vector<domain::TimestampRange> claims) const;

    static double ComputeCoverage(const std::vector<domain::SectionMapping>& sections,
                                  const std::vector<domain::TranscriptSegment>& segments);

    Options m_options;
};

} // namespace timenotes::application
