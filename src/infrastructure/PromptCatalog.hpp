/**
 * @file PromptCatalog.hpp
 * @brief Central storage for the note generation prompts.
 */

#pragma once

#include <string>
#include "domain/Job.hpp"

namespace timenotes::infrastructure {

class PromptCatalog {
public:
    /** @brief System prompt for single-pass or chunked generation. */
    static std::string GetSystemPrompt(bool sequential);

    /** @brief Full user prompt for a transcript or document that fits in one request. */
    static std::string GetNotesPrompt(domain::ActionType action, const std::string& content);

    /** @brief User prompt for part @p chunkNum of @p totalChunks of a long input. */
    static std::string GetSequentialPrompt(domain::ActionType action, const std::string& content,
                                           size_t chunkNum, size_t totalChunks);

    /** @brief Extra instructions that steer retries away from repeating earlier output. */
    static std::string GetVariation(size_t index);

    /** @brief Title placed above notes stitched together from several chunks. */
    static std::string GetCombinedHeader(domain::ActionType action);
};

} // namespace timenotes::infrastructure
