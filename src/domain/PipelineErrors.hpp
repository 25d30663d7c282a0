/**
 * @file PipelineErrors.hpp
 * @brief Failure taxonomy shared by the pipeline and its collaborators.
 *
 * Validation, acquisition and transcription errors end a job. The remaining
 * kinds are caught by the orchestrator and only degrade the result.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace timenotes::domain {

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Entitlement or quota violation detected before expensive work. */
class ValidationError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Input media could not be obtained or decoded. */
class AcquisitionError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class TranscriptionError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Notes collaborator absent or produced nothing. Soft. */
class GenerationUnavailable : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Alignment raised or produced nothing. Soft. */
class AlignmentFailure : public PipelineError {
public:
    using PipelineError::PipelineError;
};

/** @brief Credit check or deduction failed. Soft. */
class LedgerError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

} // namespace timenotes::domain
