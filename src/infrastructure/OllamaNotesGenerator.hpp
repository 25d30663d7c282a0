/**
 * @file OllamaNotesGenerator.hpp
 * @brief NotesGenerator backed by a local Ollama model.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "domain/NotesGenerator.hpp"
#include "infrastructure/LruCache.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace timenotes::infrastructure {

/**
 * @class OllamaNotesGenerator
 * @brief Generates heading-delimited notes and avoids handing back a document it produced recently.
 *
 * Hashes of recently returned notes live in a bounded LRU cache. A result
 * whose hash is already cached is regenerated with a different variation
 * prompt, up to maxAttempts times; the last attempt is returned regardless.
 */
class OllamaNotesGenerator : public domain::NotesGenerator {
public:
    static constexpr size_t kDefaultCacheCapacity = 50;
    static constexpr size_t kMinSourceChars = 50;
    static constexpr size_t kMaxChunkChars = 15000;

    OllamaNotesGenerator(std::shared_ptr<OllamaClient> client,
                         std::string model,
                         size_t cacheCapacity = kDefaultCacheCapacity,
                         int maxAttempts = 3);

    bool isAvailable() const override;
    std::optional<std::string> generateNotes(const std::string& sourceText, domain::ActionType action) override;

    /** @brief Splits long input at sentence boundaries into pieces of at most @p maxChars. */
    static std::vector<std::string> SplitContent(const std::string& text, size_t maxChars);

private:
    std::optional<std::string> GenerateOnce(const std::vector<std::string>& chunks,
                                            domain::ActionType action, size_t variation);
    static std::string HashNotes(const std::string& notes);

    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
    int m_maxAttempts;
    std::atomic<size_t> m_variationCounter{0};

    LruCache<std::string, bool> m_recentNotes;
    std::mutex m_cacheMutex;
};

} // namespace timenotes::infrastructure
