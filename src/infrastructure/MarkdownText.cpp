#include "infrastructure/MarkdownText.hpp"

#include <regex>
#include <sstream>

namespace timenotes::infrastructure {

namespace {
    std::string TrimCopy(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }
}

std::string MarkdownText::ToPlainText(const std::string& markdown) {
    static const std::regex fencedCode("```[^`]*```");
    static const std::regex bold(R"(\*\*([^*]+)\*\*)");
    static const std::regex italic(R"(\*([^*]+)\*)");
    static const std::regex boldUnderscore("__([^_]+)__");
    static const std::regex italicUnderscore("_([^_]+)_");
    static const std::regex inlineCode("`([^`]+)`");
    static const std::regex link(R"(\[([^\]]+)\]\([^)]+\))");
    static const std::regex heading(R"(^#{1,6}\s+)");
    static const std::regex bullet(R"(^\s*[*+-]\s+)");
    static const std::regex rule("^---+$");

    // Fences span lines, so they go before the line pass.
    std::string text = std::regex_replace(markdown, fencedCode, "");

    std::stringstream in(text);
    std::string line;
    std::string lines;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = std::regex_replace(line, heading, "", std::regex_constants::format_first_only);
        if (std::regex_match(line, rule)) {
            line.clear();
        }
        line = std::regex_replace(line, bullet, "\xE2\x80\xA2 ", std::regex_constants::format_first_only);
        lines += line;
        lines += '\n';
    }

    text = std::regex_replace(lines, bold, "$1");
    text = std::regex_replace(text, italic, "$1");
    text = std::regex_replace(text, boldUnderscore, "$1");
    text = std::regex_replace(text, italicUnderscore, "$1");
    text = std::regex_replace(text, inlineCode, "$1");
    text = std::regex_replace(text, link, "$1");

    // Collapse runs of blank lines into one.
    std::stringstream collapse(text);
    std::string out;
    int blankRun = 0;
    while (std::getline(collapse, line)) {
        if (TrimCopy(line).empty()) {
            ++blankRun;
            if (blankRun > 1) continue;
            out += '\n';
            continue;
        }
        blankRun = 0;
        out += line;
        out += '\n';
    }
    return TrimCopy(out);
}

} // namespace timenotes::infrastructure
