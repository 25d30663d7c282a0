/**
 * @file NotesGenerator.hpp
 * @brief Interface for AI-powered structured note generation.
 */

#pragma once

#include "domain/Job.hpp"
#include <optional>
#include <string>

namespace timenotes::domain {

/**
 * @class NotesGenerator
 * @brief Abstract interface for services that turn raw text into a heading-delimited notes document.
 */
class NotesGenerator {
public:
    virtual ~NotesGenerator() = default;

    /** @brief Whether the backing model can be reached at all. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Generates markdown notes (## headings) from a transcript or document text.
     * @param sourceText Transcript text or extracted document text.
     * @param action Kind of job, used to pick the prompt.
     * @return Notes document, or nullopt if nothing could be generated.
     */
    virtual std::optional<std::string> generateNotes(const std::string& sourceText, ActionType action) = 0;
};

} // namespace timenotes::domain
