/**
 * @file TranscriptionService.hpp
 * @brief Interface for audio-to-text transcription.
 */

#pragma once

#include "domain/Transcript.hpp"
#include <string>

namespace timenotes::domain {

/**
 * @class TranscriptionService
 * @brief Abstract interface for services that convert an audio file into a time-coded transcript.
 *
 * Calls are blocking; the orchestrator runs them on its worker pool.
 */
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    /**
     * @brief Transcribes a 16 kHz mono WAV file.
     * @param audioPath Path to the input audio file.
     * @return Transcript with ordered segments.
     * @throws TranscriptionError when the engine fails.
     */
    virtual Transcript transcribe(const std::string& audioPath) = 0;
};

} // namespace timenotes::domain
