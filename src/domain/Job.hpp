/**
 * @file Job.hpp
 * @brief Domain entity describing one end-to-end processing request.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace timenotes::domain {

/**
 * @enum JobStatus
 * @brief Lifecycle states. Ordered: a job only moves forward.
 */
enum class JobStatus {
    Created,
    Processing,
    Completed,
    Error
};

/**
 * @enum ActionType
 * @brief Billable action a job was submitted for.
 */
enum class ActionType {
    VideoUpload,
    YoutubeDownload,
    PdfUpload,
    QuizGeneration
};

inline std::string StatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Created: return "created";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Error: return "error";
    }
    return "created";
}

inline std::optional<JobStatus> StatusFromString(const std::string& value) {
    if (value == "created") return JobStatus::Created;
    if (value == "processing") return JobStatus::Processing;
    if (value == "completed") return JobStatus::Completed;
    if (value == "error") return JobStatus::Error;
    return std::nullopt;
}

/** @brief True for states a job never leaves. */
inline bool IsTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Error;
}

inline std::string ActionToString(ActionType action) {
    switch (action) {
        case ActionType::VideoUpload: return "video_upload";
        case ActionType::YoutubeDownload: return "youtube_download";
        case ActionType::PdfUpload: return "pdf_upload";
        case ActionType::QuizGeneration: return "quiz_generation";
    }
    return "video_upload";
}

inline std::optional<ActionType> ActionFromString(const std::string& value) {
    if (value == "video_upload") return ActionType::VideoUpload;
    if (value == "youtube_download") return ActionType::YoutubeDownload;
    if (value == "pdf_upload") return ActionType::PdfUpload;
    if (value == "quiz_generation") return ActionType::QuizGeneration;
    return std::nullopt;
}

/**
 * @struct Job
 * @brief Snapshot of a job as tracked by the registry.
 */
struct Job {
    std::string id;                          ///< Opaque identifier.
    JobStatus status = JobStatus::Created;   ///< Current lifecycle state.
    std::string progress;                    ///< Human readable progress text.
    std::optional<std::string> owner;        ///< Identity that submitted the job, if known.
    std::optional<ActionType> actionType;    ///< Billable action.
    bool creditsDeducted = false;            ///< Whether usage was charged.
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;
    nlohmann::json result = nlohmann::json::object(); ///< Stage outputs.
    std::optional<std::string> error;        ///< Failure text when status is Error.
    bool recovered = false;                  ///< Rebuilt from artifacts after state loss.
};

} // namespace timenotes::domain
