#pragma once
#include <string>

namespace timenotes::infrastructure {

/** @brief Plain-text rendering of generated notes for the .txt artifact. */
class MarkdownText {
public:
    /** @brief Strips headings, emphasis, code, links and rules; bullets become "• ". */
    static std::string ToPlainText(const std::string& markdown);
};

} // namespace timenotes::infrastructure
