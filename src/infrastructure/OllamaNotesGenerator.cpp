#include "infrastructure/OllamaNotesGenerator.hpp"
#include "infrastructure/PromptCatalog.hpp"

#include <functional>
#include <iostream>

namespace timenotes::infrastructure {

namespace {
    std::string Trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(ws);
        return s.substr(first, last - first + 1);
    }
}

OllamaNotesGenerator::OllamaNotesGenerator(std::shared_ptr<OllamaClient> client,
                                           std::string model,
                                           size_t cacheCapacity,
                                           int maxAttempts)
    : m_client(std::move(client)),
      m_model(std::move(model)),
      m_maxAttempts(maxAttempts < 1 ? 1 : maxAttempts),
      m_recentNotes(cacheCapacity) {}

bool OllamaNotesGenerator::isAvailable() const {
    return m_client && !m_client->getAvailableModels().empty();
}

std::string OllamaNotesGenerator::HashNotes(const std::string& notes) {
    return std::to_string(std::hash<std::string>{}(notes));
}

std::vector<std::string> OllamaNotesGenerator::SplitContent(const std::string& text, size_t maxChars) {
    if (text.size() <= maxChars) {
        return {text};
    }

    std::vector<std::string> chunks;
    std::string current;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t stop = text.find(". ", pos);
        std::string sentence = text.substr(pos, stop == std::string::npos ? std::string::npos : stop - pos);
        pos = stop == std::string::npos ? text.size() : stop + 2;

        if (current.size() + sentence.size() + 2 <= maxChars) {
            current += sentence + ". ";
        } else {
            if (!current.empty()) {
                chunks.push_back(Trim(current));
            }
            current = sentence + ". ";
        }
    }
    if (!Trim(current).empty()) {
        chunks.push_back(Trim(current));
    }
    return chunks;
}

std::optional<std::string> OllamaNotesGenerator::GenerateOnce(const std::vector<std::string>& chunks,
                                                              domain::ActionType action, size_t variation) {
    if (chunks.size() == 1) {
        auto notes = m_client->generate(m_model, PromptCatalog::GetSystemPrompt(false),
                                        PromptCatalog::GetNotesPrompt(action, chunks.front()) +
                                        PromptCatalog::GetVariation(variation));
        if (!notes) return std::nullopt;
        std::string trimmed = Trim(*notes);
        if (trimmed.empty()) return std::nullopt;
        return trimmed;
    }

    std::string combined = PromptCatalog::GetCombinedHeader(action);
    bool any = false;
    for (size_t i = 0; i < chunks.size(); ++i) {
        std::cout << "[OllamaNotesGenerator] Processing chunk " << (i + 1) << "/" << chunks.size() << std::endl;
        auto part = m_client->generate(m_model, PromptCatalog::GetSystemPrompt(true),
                                       PromptCatalog::GetSequentialPrompt(action, chunks[i], i + 1, chunks.size()) +
                                       PromptCatalog::GetVariation(variation + i));
        if (!part || Trim(*part).empty()) {
            std::cerr << "[OllamaNotesGenerator] Chunk " << (i + 1) << " produced nothing." << std::endl;
            continue;
        }
        if (any) combined += "\n\n";
        combined += Trim(*part);
        any = true;
    }
    if (!any) return std::nullopt;
    return combined;
}

std::optional<std::string> OllamaNotesGenerator::generateNotes(const std::string& sourceText, domain::ActionType action) {
    if (!m_client) {
        std::cerr << "[OllamaNotesGenerator] No client configured." << std::endl;
        return std::nullopt;
    }
    if (Trim(sourceText).size() < kMinSourceChars) {
        std::cerr << "[OllamaNotesGenerator] Content too short for notes generation." << std::endl;
        return std::nullopt;
    }

    std::vector<std::string> chunks = SplitContent(sourceText, kMaxChunkChars);
    std::optional<std::string> last;

    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        auto notes = GenerateOnce(chunks, action, m_variationCounter++);
        if (!notes) {
            std::cerr << "[OllamaNotesGenerator] Failed to generate notes on attempt " << attempt << std::endl;
            continue;
        }
        last = notes;

        std::string hash = HashNotes(*notes);
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        if (!m_recentNotes.Contains(hash)) {
            m_recentNotes.Put(hash, true);
            std::cout << "[OllamaNotesGenerator] Generated unique notes on attempt " << attempt << std::endl;
            return notes;
        }
        std::cerr << "[OllamaNotesGenerator] Notes repeat recent output, retrying (attempt " << attempt << ")" << std::endl;
    }

    if (last) {
        std::cerr << "[OllamaNotesGenerator] Using possibly repeated notes after " << m_maxAttempts << " attempts." << std::endl;
        std::lock_guard<std::mutex> lock(m_cacheMutex);
        m_recentNotes.Put(HashNotes(*last), true);
    }
    return last;
}

} // namespace timenotes::infrastructure
