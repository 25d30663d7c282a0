/**
 * @file ArtifactStore.hpp
 * @brief Interface for named per-job output artifacts.
 */

#pragma once

#include <array>
#include <optional>
#include <string>

namespace timenotes::domain {

/**
 * @enum ArtifactKind
 * @brief Every output a completed job may leave behind.
 */
enum class ArtifactKind {
    Transcription,
    ExtractedText,
    NotesMarkdown,
    NotesText,
    TimestampedJson,
    TimestampedMarkdown,
    Srt,
    Vtt
};

inline constexpr std::array<ArtifactKind, 8> kAllArtifactKinds = {
    ArtifactKind::Transcription,
    ArtifactKind::ExtractedText,
    ArtifactKind::NotesMarkdown,
    ArtifactKind::NotesText,
    ArtifactKind::TimestampedJson,
    ArtifactKind::TimestampedMarkdown,
    ArtifactKind::Srt,
    ArtifactKind::Vtt
};

/** @brief File name suffix appended to the job id. */
inline std::string ArtifactSuffix(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Transcription: return "_transcription.txt";
        case ArtifactKind::ExtractedText: return "_extracted_text.txt";
        case ArtifactKind::NotesMarkdown: return "_notes.md";
        case ArtifactKind::NotesText: return "_notes.txt";
        case ArtifactKind::TimestampedJson: return "_timestamped_notes.json";
        case ArtifactKind::TimestampedMarkdown: return "_timestamped_notes.md";
        case ArtifactKind::Srt: return "_notes.srt";
        case ArtifactKind::Vtt: return "_notes.vtt";
    }
    return "_unknown";
}

/**
 * @class ArtifactStore
 * @brief Durable storage for job outputs. The registry probes it to recover lost jobs.
 */
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    /** @brief Writes an artifact. Returns false on failure (already logged). */
    virtual bool write(const std::string& jobId, ArtifactKind kind, const std::string& content) = 0;

    virtual bool exists(const std::string& jobId, ArtifactKind kind) const = 0;

    /** @brief True if at least one artifact exists for the job. */
    virtual bool hasAny(const std::string& jobId) const = 0;

    virtual std::optional<std::string> read(const std::string& jobId, ArtifactKind kind) const = 0;
};

} // namespace timenotes::domain
