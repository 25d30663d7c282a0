/**
 * @file PipelineOrchestrator.hpp
 * @brief Runs each job through acquire, extract, transcribe, generate, align, persist and charge.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "application/AsyncTaskManager.hpp"
#include "application/JobRegistry.hpp"
#include "application/TimestampAligner.hpp"
#include "application/WorkerPool.hpp"
#include "domain/ArtifactStore.hpp"
#include "domain/CreditLedger.hpp"
#include "domain/Entitlement.hpp"
#include "domain/MediaExtractor.hpp"
#include "domain/NotesGenerator.hpp"
#include "domain/TimestampMapping.hpp"
#include "domain/Transcript.hpp"
#include "domain/TranscriptionService.hpp"

namespace timenotes::application {

/**
 * @enum InputKind
 * @brief How an input file enters the pipeline.
 */
enum class InputKind {
    Media,     ///< Video or compressed audio; audio is extracted first.
    Audio,     ///< Already a WAV file; goes straight to transcription.
    Document   ///< .txt or .md text; no extraction, transcription or alignment.
};

/**
 * @struct JobRequest
 * @brief Caller-supplied description of one job.
 */
struct JobRequest {
    std::string inputPath;
    std::optional<std::string> owner;
    domain::ActionType action = domain::ActionType::VideoUpload;
    bool inputIsTemporary = false; ///< Delete the input itself during cleanup.
};

/**
 * @struct PipelineCollaborators
 * @brief External services the pipeline consumes. Any of them may be null except the artifact store.
 */
struct PipelineCollaborators {
    std::shared_ptr<domain::MediaExtractor> extractor;
    std::shared_ptr<domain::TranscriptionService> transcriber;
    std::shared_ptr<domain::NotesGenerator> notesGenerator;
    std::shared_ptr<domain::CreditLedger> ledger;
    std::shared_ptr<domain::ArtifactStore> artifacts;
    std::shared_ptr<domain::PlanDirectory> plans;
};

struct PipelineSettings {
    std::filesystem::path tempDir;
    bool cleanupTempFiles = true;
    size_t minDocumentChars = 50;
    size_t transcriptExcerptChars = 500;
    size_t notesPreviewChars = 200;
};

/**
 * @class PipelineOrchestrator
 * @brief Sequences the stages of every job and records each transition in the registry.
 *
 * Each job runs on its own AsyncTaskManager task. Extraction, transcription,
 * note generation and alignment are dispatched to the shared WorkerPool and
 * the job task waits on the returned future.
 *
 * Validation, acquisition and transcription failures end the job in "error".
 * Missing notes, alignment failures and ledger failures are logged and the job
 * still completes with what it has. Usage is charged only once notes exist.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(JobRegistry& registry,
                         WorkerPool& pool,
                         std::shared_ptr<AsyncTaskManager> taskManager,
                         PipelineCollaborators collaborators,
                         PipelineSettings settings,
                         TimestampAligner aligner = TimestampAligner());
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /** @brief Creates a job for @p request and starts it in the background. */
    std::string SubmitJob(const JobRequest& request);

    /** @brief Starts an already created job in the background. */
    std::shared_ptr<TaskStatus> ProcessJobAsync(const std::string& jobId, const JobRequest& request);

    /**
     * @brief Runs every stage of a job on the calling thread.
     *
     * Never throws; failures are recorded in the registry.
     * @param status Optional task status receiving fractional progress.
     */
    void RunJob(const std::string& jobId, const JobRequest& request, TaskStatus* status = nullptr);

    /** @brief Blocks until all background jobs submitted so far have finished. */
    void WaitForIdle();

    static InputKind DetectInputKind(const std::filesystem::path& input);

    /** @brief Human readable dump of a transcript, written as the transcription artifact. */
    static std::string FormatTranscription(const domain::Transcript& transcript);

private:
    void ValidateEntitlement(const std::string& jobId, const JobRequest& request, InputKind kind);
    std::optional<std::string> GenerateNotes(const std::string& jobId, const std::string& sourceText,
                                             domain::ActionType action);
    std::optional<domain::TimestampMapping> AlignNotes(const std::string& jobId, const std::string& notes,
                                                       const std::vector<domain::TranscriptSegment>& segments);
    void PersistNotes(const std::string& jobId, const std::string& notes);
    void PersistMapping(const std::string& jobId, const domain::TimestampMapping& mapping);
    bool ChargeUsage(const std::string& jobId, const JobRequest& request);
    void WriteArtifact(const std::string& jobId, domain::ArtifactKind kind, const std::string& content);
    void CleanupTempFiles(const std::string& jobId, const std::vector<std::filesystem::path>& files);

    static std::string Preview(const std::string& text, size_t maxChars);

    JobRegistry& m_registry;
    WorkerPool& m_pool;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    PipelineCollaborators m_collab;
    PipelineSettings m_settings;
    TimestampAligner m_aligner;
};

} // namespace timenotes::application
