/**
 * @file TimestampAligner.cpp
 * @brief Implementation of TimestampAligner.
 */

#include "application/TimestampAligner.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <tuple>

namespace timenotes::application {

using domain::NoteSection;
using domain::SectionKind;
using domain::SectionMapping;
using domain::TimestampMapping;
using domain::TimestampRange;
using domain::TranscriptSegment;

namespace {

    void Trim(std::string& s) {
        const char* ws = " \t\r\n\f\v";
        s.erase(0, s.find_first_not_of(ws));
        auto last = s.find_last_not_of(ws);
        if (last == std::string::npos) {
            s.clear();
        } else {
            s.erase(last + 1);
        }
    }

    bool IsWordByte(unsigned char c) {
        // Bytes of multi-byte UTF-8 sequences count as word characters.
        return std::isalnum(c) || c == '_' || c >= 0x80;
    }

    struct Block {
        size_t a;
        size_t b;
        size_t size;
    };

    Block LongestMatch(const std::string& a, size_t alo, size_t ahi,
                       const std::string& b, size_t blo, size_t bhi) {
        Block best{alo, blo, 0};
        std::vector<size_t> prev(b.size() + 1, 0);
        std::vector<size_t> cur(b.size() + 1, 0);
        for (size_t i = alo; i < ahi; ++i) {
            for (size_t j = blo; j < bhi; ++j) {
                if (a[i] == b[j]) {
                    size_t k = prev[j] + 1;
                    cur[j + 1] = k;
                    if (k > best.size) {
                        best = {i + 1 - k, j + 1 - k, k};
                    }
                } else {
                    cur[j + 1] = 0;
                }
            }
            std::swap(prev, cur);
        }
        return best;
    }

    /** Ratcliff/Obershelp over already-normalized strings. */
    double MatchRatio(const std::string& a, const std::string& b) {
        size_t total = a.size() + b.size();
        if (total == 0) {
            return 1.0;
        }

        size_t matched = 0;
        std::vector<std::tuple<size_t, size_t, size_t, size_t>> pending;
        pending.emplace_back(0, a.size(), 0, b.size());
        while (!pending.empty()) {
            auto [alo, ahi, blo, bhi] = pending.back();
            pending.pop_back();
            Block block = LongestMatch(a, alo, ahi, b, blo, bhi);
            if (block.size == 0) {
                continue;
            }
            matched += block.size;
            if (alo < block.a && blo < block.b) {
                pending.emplace_back(alo, block.a, blo, block.b);
            }
            if (block.a + block.size < ahi && block.b + block.size < bhi) {
                pending.emplace_back(block.a + block.size, ahi, block.b + block.size, bhi);
            }
        }
        return 2.0 * static_cast<double>(matched) / static_cast<double>(total);
    }

    std::string StripMarkdown(const std::string& text) {
        static const std::regex bold(R"(\*\*([^*]+)\*\*)");
        static const std::regex italic(R"(\*([^*]+)\*)");
        static const std::regex code("`([^`]+)`");

        std::string clean = std::regex_replace(text, bold, "$1");
        clean = std::regex_replace(clean, italic, "$1");
        clean = std::regex_replace(clean, code, "$1");

        std::stringstream in(clean);
        std::string out;
        std::string line;
        bool first = true;
        while (std::getline(in, line)) {
            size_t pos = line.find_first_not_of(" \t");
            if (pos != std::string::npos && pos + 1 < line.size() &&
                (line[pos] == '-' || line[pos] == '*' || line[pos] == '+') &&
                std::isspace(static_cast<unsigned char>(line[pos + 1]))) {
                size_t textStart = line.find_first_not_of(" \t", pos + 1);
                line = textStart == std::string::npos ? std::string() : line.substr(textStart);
            }
            if (!first) out += '\n';
            out += line;
            first = false;
        }
        return out;
    }

} // namespace

std::vector<NoteSection> TimestampAligner::ParseSections(const std::string& notes) {
    std::vector<NoteSection> sections;
    std::vector<std::string> body;
    bool open = false;

    auto closeSection = [&]() {
        if (!open) return;
        std::string content;
        for (size_t i = 0; i < body.size(); ++i) {
            if (i > 0) content += '\n';
            content += body[i];
        }
        Trim(content);
        sections.back().content = content;
        sections.back().kind = content.empty() ? SectionKind::TitleOnly : SectionKind::Content;
        body.clear();
    };

    std::stringstream ss(notes);
    std::string line;
    while (std::getline(ss, line)) {
        Trim(line);
        if (line.empty()) continue;

        size_t hashes = 0;
        while (hashes < line.size() && line[hashes] == '#') ++hashes;
        bool isHeading = hashes >= 1 && hashes <= 6 && hashes < line.size() &&
                         std::isspace(static_cast<unsigned char>(line[hashes]));
        if (isHeading) {
            std::string title = line.substr(hashes);
            Trim(title);
            isHeading = !title.empty();
            if (isHeading) {
                closeSection();
                NoteSection section;
                section.title = title;
                section.level = static_cast<int>(hashes);
                sections.push_back(std::move(section));
                open = true;
                continue;
            }
        }

        if (open) {
            body.push_back(line);
        }
    }
    closeSection();
    return sections;
}

bool TimestampAligner::IsFillerSentence(const std::string& sentence) {
    static const std::vector<std::regex> fillers = {
        std::regex(R"(^(this|that|these|those|it|they)\s+(is|are|was|were))"),
        std::regex(R"(^(in|on|at|for|with|by)\s+this)"),
        std::regex(R"(^(here|there)\s+(is|are))"),
        std::regex(R"(^(as\s+we\s+can\s+see|as\s+mentioned|as\s+discussed))"),
        std::regex(R"(^(the\s+following|the\s+above|the\s+below))"),
    };

    std::string lower = sentence;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& pattern : fillers) {
        if (std::regex_search(lower, pattern, std::regex_constants::match_continuous)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> TimestampAligner::ExtractPhrases(const std::string& text) const {
    std::vector<std::string> phrases;
    std::string clean = StripMarkdown(text);

    size_t start = 0;
    while (start <= clean.size()) {
        size_t stop = clean.find_first_of(".!?", start);
        std::string sentence = clean.substr(start, stop == std::string::npos ? std::string::npos : stop - start);
        Trim(sentence);
        if (sentence.size() > m_options.minSentenceLength &&
            sentence.size() < m_options.maxSentenceLength &&
            !IsFillerSentence(sentence)) {
            phrases.push_back(sentence);
        }
        if (stop == std::string::npos) break;
        start = clean.find_first_not_of(".!?", stop);
        if (start == std::string::npos) break;
    }

    static const std::regex quoted("\"([^\"]+)\"");
    for (auto it = std::sregex_iterator(text.begin(), text.end(), quoted); it != std::sregex_iterator(); ++it) {
        std::string quote = (*it)[1].str();
        if (quote.size() > m_options.minQuoteLength) {
            phrases.push_back(quote);
        }
    }

    if (phrases.size() > m_options.maxPhrases) {
        phrases.resize(m_options.maxPhrases);
    }
    return phrases;
}

std::string TimestampAligner::Normalize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (IsWordByte(c)) {
            out += static_cast<char>(std::tolower(c));
        } else if (std::isspace(c)) {
            out += static_cast<char>(c);
        }
    }
    return out;
}

double TimestampAligner::Similarity(const std::string& a, const std::string& b) {
    return MatchRatio(Normalize(a), Normalize(b));
}

std::vector<TimestampRange> TimestampAligner::MergeClaims(std::vector<TimestampRange> claims) const {
    std::vector<TimestampRange> merged;
    if (claims.empty()) {
        return merged;
    }

    std::stable_sort(claims.begin(), claims.end(),
                     [](const TimestampRange& x, const TimestampRange& y) { return x.start < y.start; });

    merged.push_back(claims.front());
    for (size_t i = 1; i < claims.size(); ++i) {
        TimestampRange& current = merged.back();
        const TimestampRange& next = claims[i];
        if (next.start - current.end <= m_options.maxMergeGap) {
            current.end = std::max(current.end, next.end);
            current.text += " " + next.text;
            current.similarity = std::max(current.similarity, next.similarity);
            current.segmentIndices.insert(current.segmentIndices.end(),
                                          next.segmentIndices.begin(), next.segmentIndices.end());
        } else {
            merged.push_back(next);
        }
    }
    return merged;
}

double TimestampAligner::ComputeCoverage(const std::vector<SectionMapping>& sections,
                                         const std::vector<TranscriptSegment>& segments) {
    if (segments.empty()) {
        return 0.0;
    }

    double first = segments.front().start;
    double last = segments.front().end;
    for (const auto& seg : segments) {
        first = std::min(first, seg.start);
        last = std::max(last, seg.end);
    }
    double span = last - first;
    if (span <= 0.0) {
        return 0.0;
    }

    std::vector<std::pair<double, double>> ranges;
    for (const auto& mapping : sections) {
        for (const auto& range : mapping.timestamps) {
            ranges.emplace_back(range.start, range.end);
        }
    }
    std::sort(ranges.begin(), ranges.end());

    double covered = 0.0;
    double runStart = 0.0;
    double runEnd = 0.0;
    bool inRun = false;
    for (const auto& [s, e] : ranges) {
        if (inRun && s <= runEnd) {
            runEnd = std::max(runEnd, e);
            continue;
        }
        if (inRun) covered += runEnd - runStart;
        runStart = s;
        runEnd = e;
        inRun = true;
    }
    if (inRun) covered += runEnd - runStart;

    double pct = covered / span * 100.0;
    return std::clamp(pct, 0.0, 100.0);
}

TimestampMapping TimestampAligner::Align(const std::string& notes,
                                         const std::vector<TranscriptSegment>& segments) const {
    std::vector<NoteSection> sections = ParseSections(notes);
    if (sections.empty()) {
        return TimestampMapping{};
    }

    std::vector<std::string> normalizedSegments;
    normalizedSegments.reserve(segments.size());
    for (const auto& seg : segments) {
        normalizedSegments.push_back(Normalize(seg.text));
    }
    std::vector<bool> claimed(segments.size(), false);

    TimestampMapping mapping;
    mapping.totalSections = sections.size();

    for (auto& section : sections) {
        SectionMapping sectionMapping;

        const std::string& searchText =
            (section.kind == SectionKind::TitleOnly || section.content.size() < m_options.minContentLength)
                ? section.title
                : section.content;

        std::vector<TimestampRange> claims;
        for (const auto& phrase : ExtractPhrases(searchText)) {
            std::string normalizedPhrase = Normalize(phrase);

            std::vector<std::pair<size_t, double>> candidates;
            for (size_t i = 0; i < segments.size(); ++i) {
                if (claimed[i]) continue;
                double score = MatchRatio(normalizedPhrase, normalizedSegments[i]);
                if (score >= m_options.similarityThreshold) {
                    candidates.emplace_back(i, score);
                }
            }
            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const auto& x, const auto& y) { return x.second > y.second; });
            if (candidates.size() > m_options.matchesPerPhrase) {
                candidates.resize(m_options.matchesPerPhrase);
            }

            for (const auto& [index, score] : candidates) {
                claimed[index] = true;
                TimestampRange range;
                range.start = segments[index].start;
                range.end = segments[index].end;
                range.text = segments[index].text;
                range.similarity = score;
                range.matchedPhrase = phrase;
                range.segmentIndices.push_back(index);
                claims.push_back(std::move(range));
            }
        }

        sectionMapping.timestamps = MergeClaims(std::move(claims));
        if (!sectionMapping.timestamps.empty()) {
            sectionMapping.startTime = sectionMapping.timestamps.front().start;
            sectionMapping.endTime = sectionMapping.timestamps.back().end;
            sectionMapping.duration = *sectionMapping.endTime - *sectionMapping.startTime;
            ++mapping.mappedSections;
        }
        sectionMapping.section = std::move(section);
        mapping.sections.push_back(std::move(sectionMapping));
    }

    mapping.coveragePercentage = ComputeCoverage(mapping.sections, segments);
    return mapping;
}

} // namespace timenotes::application
