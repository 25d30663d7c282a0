#include "infrastructure/PromptCatalog.hpp"

#include <array>

namespace timenotes::infrastructure {

namespace {
    bool IsDocument(domain::ActionType action) {
        return action == domain::ActionType::PdfUpload;
    }
}

std::string PromptCatalog::GetSystemPrompt(bool sequential) {
    if (sequential) {
        return
            "You are an expert AI learning assistant helping students learn complex material efficiently. "
            "You create sequential, bite-sized notes that keep the logical flow of the source with short, focused sections.";
    }
    return
        "You are an expert AI learning assistant helping students learn complex material efficiently "
        "through bite-sized, focused notes.";
}

std::string PromptCatalog::GetNotesPrompt(domain::ActionType action, const std::string& content) {
    if (IsDocument(action)) {
        return
            "You are given the text of a document (textbook, paper, manual or other study material). "
            "Turn it into short, focused study notes that keep its academic accuracy.\n\n"
            "REQUIREMENTS:\n"
            "1. Each section holds 50-60 words at most.\n"
            "2. Follow the document's own order from beginning to end.\n"
            "3. Break complex topics into several short sections.\n\n"
            "FORMAT:\n"
            "- Every concept starts with a heading: ## Concept Title\n"
            "- Under it, a concise explanation with key definitions in simple terms\n"
            "- **Bold** important terms; one essential example when relevant\n\n"
            "[DOCUMENT START]\n" + content + "\n[DOCUMENT END]\n\n"
            "Generate the sequential, short-format notes (50-60 words per section):";
    }
    return
        "You are given a transcript from an educational video or course. Turn it into well-structured, "
        "student-friendly notes with short, digestible sections.\n\n"
        "REQUIREMENTS:\n"
        "1. Each section holds 50-60 words at most.\n"
        "2. Follow the instructor's teaching sequence in chronological order.\n"
        "3. Break complex topics into several short sections.\n"
        "4. Remove filler words and repeated phrases from the transcript.\n\n"
        "FORMAT:\n"
        "- Every concept starts with a heading: ## Concept Title\n"
        "- Under it, a concise explanation with key definitions in simple terms\n"
        "- **Bold** important terms; one essential example from the lecture when relevant\n\n"
        "[TRANSCRIPT START]\n" + content + "\n[TRANSCRIPT END]\n\n"
        "Generate the structured learning notes in chronological order (50-60 words per section):";
}

std::string PromptCatalog::GetSequentialPrompt(domain::ActionType action, const std::string& content,
                                               size_t chunkNum, size_t totalChunks) {
    std::string context = "This is part " + std::to_string(chunkNum) + " of " + std::to_string(totalChunks) +
                          " sequential sections from the same " + (IsDocument(action) ? "document" : "lecture") + ".\n\n";
    return context +
        "Create bite-sized notes for this part only, keeping its order.\n"
        "- Use ## for every concept title\n"
        "- 50-60 words at most per section\n"
        "- Key definitions in simple terms, **bold** important terms\n\n"
        "Content to process:\n" + content + "\n\n"
        "Generate sequential, short-format notes (50-60 words per section):";
}

std::string PromptCatalog::GetVariation(size_t index) {
    static const std::array<const char*, 8> focus = {
        "Focus on practical applications and real-world examples.",
        "Emphasize theoretical foundations and conceptual understanding.",
        "Highlight step-by-step processes and methodologies.",
        "Concentrate on problem-solving approaches and critical thinking.",
        "Focus on connections between concepts and interdisciplinary links.",
        "Emphasize historical context and development of ideas.",
        "Highlight comparative analysis and contrasting viewpoints.",
        "Focus on implementation strategies and best practices."
    };
    return std::string("\n\nUNIQUENESS REQUIREMENTS:\n- ") + focus[index % focus.size()] + "\n"
        "- Avoid generic openers such as \"This section covers\" or \"Key principles are\"\n"
        "- Give every section a specific, descriptive title\n"
        "- Do not add a generic \"Key Takeaways\" section\n";
}

std::string PromptCatalog::GetCombinedHeader(domain::ActionType action) {
    if (IsDocument(action)) {
        return "# Complete Document Notes\n\n"
               "*Generated from the document and organized into structured learning notes.*\n\n---\n\n";
    }
    return "# Complete Course Notes\n\n"
           "*Generated from the video transcription and organized into structured learning notes.*\n\n---\n\n";
}

} // namespace timenotes::infrastructure
