#include <cassert>
#include <cmath>
#include <iostream>
#include <algorithm>

#include "application/TimestampAligner.hpp"

using namespace timenotes;
using application::TimestampAligner;
using domain::TranscriptSegment;

static bool Near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

static bool Claims(const domain::SectionMapping& mapping, size_t index) {
    for (const auto& range : mapping.timestamps) {
        if (std::find(range.segmentIndices.begin(), range.segmentIndices.end(), index) != range.segmentIndices.end()) {
            return true;
        }
    }
    return false;
}

static void TestSingleSectionMapsToMatchingSegment() {
    std::cout << "[Test] a section maps onto the segment it paraphrases..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {0.0, 5.0, "intro to sets"},
        {5.0, 12.0, "sets are collections of elements"},
    };
    TimestampAligner aligner;
    auto mapping = aligner.Align("## Sets\nSets are collections of elements.", segments);

    assert(mapping.totalSections == 1);
    assert(mapping.mappedSections == 1);
    const auto& section = mapping.sections[0];
    assert(section.section.title == "Sets");
    assert(section.timestamps.size() == 1);
    assert(Near(section.timestamps[0].start, 5.0));
    assert(Near(section.timestamps[0].end, 12.0));
    assert(Near(*section.startTime, 5.0));
    assert(Near(*section.endTime, 12.0));
    assert(Near(section.duration, 7.0));
    assert(mapping.coveragePercentage > 0.0);
    assert(Near(mapping.coveragePercentage, 7.0 / 12.0 * 100.0, 1e-3));
    std::cout << "[PASS]" << std::endl;
}

static void TestNoSegmentsMeansNoCoverage() {
    std::cout << "[Test] an empty transcript leaves every section unmapped..." << std::endl;
    TimestampAligner aligner;
    auto mapping = aligner.Align("# Intro\nSomething reasonably long to match.\n## Details\nMore words here for the body.", {});
    assert(mapping.totalSections == 2);
    assert(mapping.mappedSections == 0);
    assert(mapping.coveragePercentage == 0.0);
    for (const auto& section : mapping.sections) {
        assert(section.timestamps.empty());
        assert(!section.startTime && !section.endTime);
    }
    std::cout << "[PASS]" << std::endl;
}

static void TestClaimedSegmentIsNotReused() {
    std::cout << "[Test] a segment claimed by an earlier section is not offered to a later one..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {0.0, 2.0, "uhh"},
        {2.0, 4.0, "xyz"},
        {4.0, 6.0, "hmm"},
        {6.0, 12.0, "plants convert sunlight into chemical energy"},
        {30.0, 32.0, "zzz"},
    };
    const std::string notes =
        "## Photosynthesis\nPlants convert sunlight into chemical energy.\n"
        "## Energy\nPlants convert sunlight into chemical energy every day.\n";

    TimestampAligner aligner;
    auto mapping = aligner.Align(notes, segments);
    assert(mapping.sections.size() == 2);
    assert(Claims(mapping.sections[0], 3));
    assert(!Claims(mapping.sections[1], 3));
    assert(!mapping.sections[1].isMapped());
    assert(mapping.mappedSections == 1);
    std::cout << "[PASS]" << std::endl;
}

static void TestNearbyClaimsMerge() {
    std::cout << "[Test] claims within the merge gap collapse into one range..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {0.0, 4.0, "cells divide by mitosis in the body"},
        {6.0, 9.0, "mitosis produces two identical daughter cells"},
        {30.0, 35.0, "zzz"},
    };
    const std::string notes =
        "## Cells\nCells divide by mitosis in the body. Mitosis produces two identical daughter cells.";

    TimestampAligner aligner;
    auto mapping = aligner.Align(notes, segments);
    const auto& section = mapping.sections[0];
    assert(section.timestamps.size() == 1);
    assert(Near(section.timestamps[0].start, 0.0));
    assert(Near(section.timestamps[0].end, 9.0));
    assert(section.timestamps[0].segmentIndices.size() == 2);
    assert(Near(mapping.coveragePercentage, 9.0 / 35.0 * 100.0, 1e-3));
    std::cout << "[PASS]" << std::endl;
}

static void TestDistantClaimsStaySeparate() {
    std::cout << "[Test] claims farther apart than the merge gap stay separate..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {0.0, 4.0, "cells divide by mitosis in the body"},
        {20.0, 25.0, "mitosis produces two identical daughter cells"},
    };
    const std::string notes =
        "## Cells\nCells divide by mitosis in the body. Mitosis produces two identical daughter cells.";

    TimestampAligner aligner;
    auto mapping = aligner.Align(notes, segments);
    const auto& section = mapping.sections[0];
    assert(section.timestamps.size() == 2);
    assert(section.timestamps[0].start < section.timestamps[1].start);
    assert(Near(*section.startTime, 0.0));
    assert(Near(*section.endTime, 25.0));
    for (const auto& range : section.timestamps) {
        assert(range.start <= range.end);
        assert(range.similarity >= aligner.GetOptions().similarityThreshold);
    }
    std::cout << "[PASS]" << std::endl;
}

static void TestTitleOnlySections() {
    std::cout << "[Test] title-only sections are parsed and kept..." << std::endl;
    auto sections = TimestampAligner::ParseSections("preamble\n# Course\n## Part One\nThe body of part one.\n### Empty\n");
    assert(sections.size() == 3);
    assert(sections[0].title == "Course" && sections[0].level == 1);
    assert(sections[0].kind == domain::SectionKind::TitleOnly);
    assert(sections[1].content == "The body of part one.");
    assert(sections[1].kind == domain::SectionKind::Content);
    assert(sections[2].level == 3 && sections[2].content.empty());

    TimestampAligner aligner;
    auto mapping = aligner.Align("# Course\n", {{0.0, 3.0, "course"}});
    assert(mapping.totalSections == 1);
    assert(!mapping.sections[0].isMapped());
    std::cout << "[PASS]" << std::endl;
}

static void TestNotesWithoutHeadingsGiveEmptyMapping() {
    std::cout << "[Test] notes without headings give an empty mapping..." << std::endl;
    TimestampAligner aligner;
    auto mapping = aligner.Align("Plain notes without any heading at all.", {});
    assert(mapping.sections.empty());
    assert(mapping.totalSections == 0);
    assert(mapping.mappedSections == 0);
    assert(mapping.coveragePercentage == 0.0);

    mapping = aligner.Align("Just a paragraph without any heading at all.", {{0.0, 1.0, "paragraph"}});
    assert(mapping.sections.empty());
    assert(mapping.coveragePercentage == 0.0);
    std::cout << "[PASS]" << std::endl;
}

static void TestRangesStayInsideTranscriptAndApart() {
    std::cout << "[Test] merged ranges are disjoint, ordered and inside the transcript..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {1.5, 6.0, "today we talk about cell membranes"},
        {6.0, 11.0, "the membrane is a lipid bilayer with proteins"},
        {11.0, 15.5, "uhh let me find the slide"},
        {15.5, 21.0, "proteins in the membrane move molecules across"},
        {30.0, 36.0, "next topic is cellular respiration"},
        {36.0, 42.0, "respiration turns glucose into usable energy"},
        {42.0, 47.0, "mitochondria are where respiration happens"},
        {60.0, 66.0, "the lipid bilayer blocks charged molecules"},
        {66.0, 73.5, "glucose is broken down in several stages"},
    };
    const char* notes =
        "# Cell Biology\n"
        "## Membranes\n"
        "The membrane is a lipid bilayer with proteins. "
        "Proteins in the membrane move molecules across. "
        "The lipid bilayer blocks charged molecules.\n"
        "## Respiration\n"
        "Respiration turns glucose into usable energy. "
        "Mitochondria are where respiration happens. "
        "Glucose is broken down in several stages.\n"
        "## Review\n"
        "Today we talk about cell membranes and cellular respiration.\n";

    TimestampAligner aligner;
    auto mapping = aligner.Align(notes, segments);
    assert(mapping.totalSections == 4);
    assert(mapping.mappedSections >= 2);

    const double first = 1.5;
    const double last = 73.5;
    std::vector<int> owners(segments.size(), 0);
    for (const auto& section : mapping.sections) {
        const auto& ranges = section.timestamps;
        for (size_t i = 0; i < ranges.size(); ++i) {
            assert(ranges[i].start >= first && ranges[i].end <= last);
            assert(ranges[i].start <= ranges[i].end);
            if (i + 1 < ranges.size()) {
                assert(ranges[i].end < ranges[i + 1].start);
            }
            for (size_t index : ranges[i].segmentIndices) {
                assert(index < segments.size());
                ++owners[index];
            }
        }
        if (section.isMapped()) {
            assert(*section.startTime == ranges.front().start);
            assert(*section.endTime == ranges.back().end);
        }
    }
    for (int count : owners) {
        assert(count <= 1);
    }
    assert(mapping.coveragePercentage >= 0.0 && mapping.coveragePercentage <= 100.0);
    std::cout << "[PASS]" << std::endl;
}

static void TestPhraseExtraction() {
    std::cout << "[Test] phrase extraction filters short and filler sentences..." << std::endl;
    TimestampAligner aligner;
    auto phrases = aligner.ExtractPhrases(
        "Short one. This is a filler sentence of decent length. "
        "**Enzymes** lower the activation energy of reactions! "
        "He said \"catalysts are reused\" at the end.");

    assert(std::find(phrases.begin(), phrases.end(), "Short one") == phrases.end());
    assert(std::find(phrases.begin(), phrases.end(), "Enzymes lower the activation energy of reactions") != phrases.end());
    assert(std::find(phrases.begin(), phrases.end(), "catalysts are reused") != phrases.end());
    for (const auto& p : phrases) {
        assert(!TimestampAligner::IsFillerSentence(p));
    }

    assert(TimestampAligner::IsFillerSentence("This is an example"));
    assert(TimestampAligner::IsFillerSentence("As mentioned earlier the cell grows"));
    assert(TimestampAligner::IsFillerSentence("Here are the main points"));
    assert(!TimestampAligner::IsFillerSentence("Photosynthesis converts light"));
    assert(!TimestampAligner::IsFillerSentence("Thistle grows in the field"));

    TimestampAligner::Options opts;
    opts.maxPhrases = 2;
    TimestampAligner limited(opts);
    auto few = limited.ExtractPhrases(
        "First long sentence about biology here. Second long sentence about biology here. "
        "Third long sentence about biology here.");
    assert(few.size() == 2);
    std::cout << "[PASS]" << std::endl;
}

static void TestSimilarity() {
    std::cout << "[Test] similarity and normalization..." << std::endl;
    assert(TimestampAligner::Normalize("Hello, World!") == "hello world");
    assert(Near(TimestampAligner::Similarity("Sets are collections", "sets are collections"), 1.0));
    assert(Near(TimestampAligner::Similarity("abc", "xyz"), 0.0));
    double partial = TimestampAligner::Similarity("abcd", "abxd");
    assert(Near(partial, 0.75));
    std::cout << "[PASS]" << std::endl;
}

static void TestCoverageIsBounded() {
    std::cout << "[Test] coverage stays within [0, 100]..." << std::endl;
    std::vector<TranscriptSegment> segments = {
        {0.0, 10.0, "water boils at one hundred degrees celsius"},
        {10.0, 20.0, "ice melts at zero degrees celsius normally"},
    };
    const std::string notes =
        "## Boiling\nWater boils at one hundred degrees celsius.\n"
        "## Melting\nIce melts at zero degrees celsius normally.\n";
    TimestampAligner aligner;
    auto mapping = aligner.Align(notes, segments);
    assert(mapping.coveragePercentage >= 0.0 && mapping.coveragePercentage <= 100.0);
    assert(Near(mapping.coveragePercentage, 100.0));
    assert(mapping.mappedSections <= mapping.totalSections);
    std::cout << "[PASS]" << std::endl;
}

int main() {
    std::cout << "[Test] Starting TimestampAligner tests..." << std::endl;
    TestSingleSectionMapsToMatchingSegment();
    TestNoSegmentsMeansNoCoverage();
    TestClaimedSegmentIsNotReused();
    TestNearbyClaimsMerge();
    TestDistantClaimsStaySeparate();
    TestTitleOnlySections();
    TestNotesWithoutHeadingsGiveEmptyMapping();
    TestRangesStayInsideTranscriptAndApart();
    TestPhraseExtraction();
    TestSimilarity();
    TestCoverageIsBounded();
    std::cout << "[Test] All TimestampAligner tests passed." << std::endl;
    return 0;
}
