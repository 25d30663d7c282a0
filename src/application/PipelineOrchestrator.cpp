/**
 * @file PipelineOrchestrator.cpp
 * @brief Implementation of PipelineOrchestrator.
 */

#include "application/PipelineOrchestrator.hpp"
#include "application/TimestampExporter.hpp"
#include "domain/PipelineErrors.hpp"
#include "infrastructure/MarkdownText.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>

namespace timenotes::application {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ArtifactKind;
using domain::JobStatus;

namespace {
    std::string ReadWholeFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw domain::AcquisitionError("Cannot open input file: " + path.string());
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    size_t TrimmedLength(const std::string& text) {
        size_t first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return 0;
        size_t last = text.find_last_not_of(" \t\r\n");
        return last - first + 1;
    }

    void SetProgress(TaskStatus* status, float value) {
        if (status) status->progress = value;
    }
}

PipelineOrchestrator::PipelineOrchestrator(JobRegistry& registry,
                                           WorkerPool& pool,
                                           std::shared_ptr<AsyncTaskManager> taskManager,
                                           PipelineCollaborators collaborators,
                                           PipelineSettings settings,
                                           TimestampAligner aligner)
    : m_registry(registry),
      m_pool(pool),
      m_taskManager(std::move(taskManager)),
      m_collab(std::move(collaborators)),
      m_settings(std::move(settings)),
      m_aligner(std::move(aligner)) {
    if (!m_taskManager) {
        m_taskManager = std::make_shared<AsyncTaskManager>();
    }
    if (m_settings.tempDir.empty()) {
        m_settings.tempDir = fs::temp_directory_path() / "timenotes";
    }
}

PipelineOrchestrator::~PipelineOrchestrator() {
    WaitForIdle();
}

void PipelineOrchestrator::WaitForIdle() {
    m_taskManager->WaitAll();
}

InputKind PipelineOrchestrator::DetectInputKind(const fs::path& input) {
    std::string ext = input.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".txt" || ext == ".md") return InputKind::Document;
    if (ext == ".wav") return InputKind::Audio;
    return InputKind::Media;
}

std::string PipelineOrchestrator::SubmitJob(const JobRequest& request) {
    std::string jobId = m_registry.Create(request.owner, request.action);
    ProcessJobAsync(jobId, request);
    return jobId;
}

std::shared_ptr<TaskStatus> PipelineOrchestrator::ProcessJobAsync(const std::string& jobId, const JobRequest& request) {
    TaskType type = DetectInputKind(request.inputPath) == InputKind::Document
                        ? TaskType::DocumentPipeline
                        : TaskType::MediaPipeline;
    return m_taskManager->SubmitTask(type, "Processing: " + request.inputPath,
        [this, jobId, request](std::shared_ptr<TaskStatus> status) {
            RunJob(jobId, request, status.get());
        });
}

std::string PipelineOrchestrator::Preview(const std::string& text, size_t maxChars) {
    if (text.size() <= maxChars) return text;
    size_t cut = maxChars;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + "...";
}

std::string PipelineOrchestrator::FormatTranscription(const domain::Transcript& transcript) {
    const std::string rule(50, '=');
    std::ostringstream out;
    out << "Transcription Result\n";
    out << "Language: " << transcript.language << "\n";
    out << rule << "\n\n";
    out << transcript.text;
    out << "\n\n" << rule << "\n";
    out << "Detailed Segments:\n\n";
    out << std::fixed << std::setprecision(2);
    for (const auto& seg : transcript.segments) {
        out << "[" << seg.start << "s - " << seg.end << "s]: " << seg.text << "\n";
    }
    return out.str();
}

void PipelineOrchestrator::ValidateEntitlement(const std::string& jobId, const JobRequest& request, InputKind kind) {
    if (!request.owner) {
        return;
    }

    if (m_collab.plans && m_collab.extractor && kind != InputKind::Document) {
        m_registry.UpdateProgress(jobId, "Validating video duration...");
        auto duration = m_pool.Submit([this, &request]() {
            return m_collab.extractor->probeDuration(request.inputPath);
        }).get();
        if (duration) {
            domain::PlanType plan = m_collab.plans->planFor(*request.owner);
            domain::DurationCheck check = domain::CheckDuration(plan, *duration);
            if (!check.valid) {
                throw domain::ValidationError(check.message);
            }
            std::cout << "[PipelineOrchestrator] " << check.message << std::endl;
        } else {
            std::cerr << "[PipelineOrchestrator] Could not determine duration for job " << jobId
                      << "; skipping plan limit check." << std::endl;
        }
    }

    if (m_collab.ledger) {
        domain::CreditCheckResult credits;
        try {
            credits = m_collab.ledger->check(*request.owner, request.action);
        } catch (const domain::LedgerError& e) {
            std::cerr << "[PipelineOrchestrator] Credit pre-check unavailable for job " << jobId
                      << ": " << e.what() << std::endl;
            return;
        }
        if (!credits.allowed) {
            throw domain::ValidationError(credits.message);
        }
    }
}

std::optional<std::string> PipelineOrchestrator::GenerateNotes(const std::string& jobId,
                                                               const std::string& sourceText,
                                                               domain::ActionType action) {
    try {
        if (!m_collab.notesGenerator) {
            throw domain::GenerationUnavailable("No notes generator configured");
        }
        if (!m_collab.notesGenerator->isAvailable()) {
            throw domain::GenerationUnavailable("Notes generator is not available");
        }

        m_registry.UpdateProgress(jobId, "Generating structured learning notes...");
        std::cout << "[PipelineOrchestrator] Generating structured notes for job " << jobId << std::endl;
        auto notes = m_pool.Submit([this, &sourceText, action]() {
            return m_collab.notesGenerator->generateNotes(sourceText, action);
        }).get();

        if (!notes || TrimmedLength(*notes) == 0) {
            throw domain::GenerationUnavailable("Notes generator returned nothing");
        }
        std::cout << "[PipelineOrchestrator] Generated structured notes for job " << jobId << std::endl;
        return notes;
    } catch (const domain::GenerationUnavailable& e) {
        std::cerr << "[PipelineOrchestrator] No notes for job " << jobId << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PipelineOrchestrator] Notes generation failed for job " << jobId << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::optional<domain::TimestampMapping> PipelineOrchestrator::AlignNotes(
    const std::string& jobId, const std::string& notes,
    const std::vector<domain::TranscriptSegment>& segments) {
    m_registry.UpdateProgress(jobId, "Mapping notes to audio timestamps...");
    try {
        auto mapping = m_pool.Submit([this, &notes, &segments]() {
            return m_aligner.Align(notes, segments);
        }).get();
        if (mapping.sections.empty()) {
            throw domain::AlignmentFailure("Notes contain no headed sections");
        }
        std::cout << "[PipelineOrchestrator] Mapped " << mapping.mappedSections << "/" << mapping.totalSections
                  << " sections, coverage " << std::fixed << std::setprecision(1)
                  << mapping.coveragePercentage << "% for job " << jobId << std::endl;
        return mapping;
    } catch (const domain::AlignmentFailure& e) {
        std::cerr << "[PipelineOrchestrator] Alignment produced nothing for job " << jobId << ": " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PipelineOrchestrator] Alignment failed for job " << jobId << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

void PipelineOrchestrator::WriteArtifact(const std::string& jobId, ArtifactKind kind, const std::string& content) {
    if (!m_collab.artifacts->write(jobId, kind, content)) {
        std::cerr << "[PipelineOrchestrator] Failed to store " << domain::ArtifactSuffix(kind)
                  << " for job " << jobId << std::endl;
    }
}

void PipelineOrchestrator::PersistNotes(const std::string& jobId, const std::string& notes) {
    WriteArtifact(jobId, ArtifactKind::NotesMarkdown, notes);
    WriteArtifact(jobId, ArtifactKind::NotesText, infrastructure::MarkdownText::ToPlainText(notes));
}

void PipelineOrchestrator::PersistMapping(const std::string& jobId, const domain::TimestampMapping& mapping) {
    WriteArtifact(jobId, ArtifactKind::TimestampedJson, TimestampExporter::ToJson(mapping).dump(2));
    WriteArtifact(jobId, ArtifactKind::TimestampedMarkdown, TimestampExporter::ToMarkdown(mapping));
    WriteArtifact(jobId, ArtifactKind::Srt, TimestampExporter::ToSrt(mapping));
    WriteArtifact(jobId, ArtifactKind::Vtt, TimestampExporter::ToVtt(mapping));
}

bool PipelineOrchestrator::ChargeUsage(const std::string& jobId, const JobRequest& request) {
    if (!request.owner || !m_collab.ledger) {
        return false;
    }

    m_registry.UpdateProgress(jobId, "Processing payment...");
    try {
        domain::CreditCheckResult result = m_collab.ledger->deduct(*request.owner, request.action);
        if (!result.allowed) {
            std::cerr << "[PipelineOrchestrator] Credit deduction refused for job " << jobId
                      << ": " << result.message << std::endl;
            return false;
        }
        std::cout << "[PipelineOrchestrator] Credits deducted for job " << jobId
                  << ": " << result.message << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[PipelineOrchestrator] Credit deduction error for job " << jobId
                  << ": " << e.what() << std::endl;
        return false;
    }
}

void PipelineOrchestrator::CleanupTempFiles(const std::string& jobId, const std::vector<fs::path>& files) {
    if (!m_settings.cleanupTempFiles) {
        return;
    }
    for (const auto& file : files) {
        std::error_code ec;
        if (!fs::exists(file, ec)) continue;
        if (fs::remove(file, ec)) {
            std::cout << "[PipelineOrchestrator] Cleaned up temporary file: " << file.string() << std::endl;
        } else if (ec) {
            std::cerr << "[PipelineOrchestrator] Failed to clean up " << file.string()
                      << " for job " << jobId << ": " << ec.message() << std::endl;
        }
    }
}

void PipelineOrchestrator::RunJob(const std::string& jobId, const JobRequest& request, TaskStatus* status) {
    const auto startedAt = std::chrono::steady_clock::now();
    std::vector<fs::path> tempFiles;
    if (request.inputIsTemporary) {
        tempFiles.emplace_back(request.inputPath);
    }

    try {
        if (!m_collab.artifacts) {
            throw domain::PipelineError("No artifact store configured");
        }

        // acquire
        m_registry.UpdateStatus(jobId, JobStatus::Processing, std::string("Acquiring input..."));
        std::error_code ec;
        if (!fs::is_regular_file(request.inputPath, ec)) {
            throw domain::AcquisitionError("Input file not found: " + request.inputPath);
        }
        const InputKind kind = DetectInputKind(request.inputPath);
        ValidateEntitlement(jobId, request, kind);
        SetProgress(status, 0.05f);

        json result = json::object();
        domain::Transcript transcript;
        std::string sourceText;

        if (kind == InputKind::Document) {
            m_registry.UpdateProgress(jobId, "Extracting text from document...");
            sourceText = ReadWholeFile(request.inputPath);
            if (TrimmedLength(sourceText) < m_settings.minDocumentChars) {
                throw domain::AcquisitionError("Document appears to be empty or contains insufficient text content");
            }
            result["extracted_text"] = Preview(sourceText, m_settings.transcriptExcerptChars);
            result["text_length"] = sourceText.size();
            SetProgress(status, 0.3f);
        } else {
            std::string audioPath = request.inputPath;
            if (kind == InputKind::Media) {
                if (!m_collab.extractor) {
                    throw domain::AcquisitionError("No media extractor configured");
                }
                m_registry.UpdateProgress(jobId, "Extracting audio...");
                fs::create_directories(m_settings.tempDir, ec);
                audioPath = (m_settings.tempDir / (jobId + "_audio.wav")).string();
                tempFiles.emplace_back(audioPath);
                m_pool.Submit([this, &request, &audioPath]() {
                    m_collab.extractor->extractAudio(request.inputPath, audioPath);
                }).get();
            }
            SetProgress(status, 0.15f);

            if (!m_collab.transcriber) {
                throw domain::TranscriptionError("No transcription service configured");
            }
            m_registry.UpdateProgress(jobId, "Transcribing audio...");
            transcript = m_pool.Submit([this, &audioPath]() {
                return m_collab.transcriber->transcribe(audioPath);
            }).get();
            sourceText = transcript.text;

            result["transcription"] = Preview(transcript.text, m_settings.transcriptExcerptChars);
            result["language"] = transcript.language;
            result["segments_count"] = transcript.segments.size();
            SetProgress(status, 0.5f);
        }

        std::optional<std::string> notes = GenerateNotes(jobId, sourceText, request.action);
        SetProgress(status, 0.75f);

        std::optional<domain::TimestampMapping> mapping;
        if (notes && kind != InputKind::Document) {
            mapping = AlignNotes(jobId, *notes, transcript.segments);
        }
        SetProgress(status, 0.85f);

        // persist
        m_registry.UpdateProgress(jobId, "Saving results...");
        if (kind == InputKind::Document) {
            WriteArtifact(jobId, ArtifactKind::ExtractedText, sourceText);
        } else {
            WriteArtifact(jobId, ArtifactKind::Transcription, FormatTranscription(transcript));
        }
        if (notes) {
            PersistNotes(jobId, *notes);
        }
        if (mapping) {
            PersistMapping(jobId, *mapping);
        }
        SetProgress(status, 0.95f);

        // charge only when notes were produced
        bool charged = notes ? ChargeUsage(jobId, request) : false;

        result["has_notes"] = notes.has_value();
        result["notes_preview"] = notes ? json(Preview(*notes, m_settings.notesPreviewChars)) : json(nullptr);
        if (kind != InputKind::Document) {
            result["has_timestamped_notes"] = mapping.has_value();
            result["timestamp_coverage"] = mapping ? mapping->coveragePercentage : 0.0;
            result["mapped_sections"] = mapping ? mapping->mappedSections : 0;
        }
        result["credits_deducted"] = charged;
        result["processing_time"] = std::chrono::duration<double>(std::chrono::steady_clock::now() - startedAt).count();

        m_registry.Complete(jobId, result);
        std::cout << "[PipelineOrchestrator] Job " << jobId << " completed." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[PipelineOrchestrator] Job " << jobId << " failed: " << e.what() << std::endl;
        m_registry.Fail(jobId, e.what());
    } catch (...) {
        std::cerr << "[PipelineOrchestrator] Job " << jobId << " failed with a non-standard exception." << std::endl;
        m_registry.Fail(jobId, "Unknown error during processing");
    }

    CleanupTempFiles(jobId, tempFiles);
}

} // namespace timenotes::application
