/**
 * @file JobRegistry.hpp
 * @brief Durable ledger of job lifecycle state.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/ArtifactStore.hpp"
#include "domain/Job.hpp"
#include "domain/JobRepository.hpp"

namespace timenotes::application {

/**
 * @class JobRegistry
 * @brief Tracks every job by id and writes each mutation through to the repository.
 *
 * Mutations on unknown ids, and transitions out of a terminal state, are logged
 * and ignored; the methods return false in that case. A lookup that misses
 * memory runs Reconcile(), which rebuilds a reduced-fidelity entry when output
 * artifacts for the id exist (owner unknown, charge assumed).
 *
 * Every mutation appends a full record, so the repository is compacted on
 * construction and again whenever the appends since the last compaction reach
 * kCompactionFactor times the live job count (at least kMinCompactionAppends).
 */
class JobRegistry {
public:
    static constexpr size_t kCompactionFactor = 4;
    static constexpr size_t kMinCompactionAppends = 64;

    /**
     * @param repository Durable job storage; replayed and compacted on construction.
     * @param artifacts Optional artifact store used by reconciliation.
     */
    JobRegistry(std::shared_ptr<domain::JobRepository> repository,
                std::shared_ptr<domain::ArtifactStore> artifacts);

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    /** @brief Creates a job in status "created" and returns its fresh id. */
    std::string Create(std::optional<std::string> owner = std::nullopt,
                       std::optional<domain::ActionType> actionType = std::nullopt);

    /**
     * @brief Moves a job to @p status, optionally replacing its progress text.
     * @param fields Extra result fields merged into the job's result object.
     */
    bool UpdateStatus(const std::string& jobId, domain::JobStatus status,
                      const std::optional<std::string>& progress = std::nullopt,
                      const nlohmann::json& fields = nlohmann::json::object());

    bool UpdateProgress(const std::string& jobId, const std::string& message);

    /** @brief Terminal success. Merges @p result; a boolean "credits_deducted" key also sets the flag. */
    bool Complete(const std::string& jobId, const nlohmann::json& result);

    /** @brief Terminal failure. Records @p error and clears credits_deducted. */
    bool Fail(const std::string& jobId, const std::string& error);

    bool MarkCreditsDeducted(const std::string& jobId, bool deducted);

    std::optional<domain::Job> Get(const std::string& jobId);
    bool Exists(const std::string& jobId);

    /**
     * @brief Rebuilds a missing entry from the artifact store.
     * @return true if the job is known afterwards.
     */
    bool Reconcile(const std::string& jobId);

    std::vector<domain::Job> ListForOwner(const std::string& owner) const;
    size_t Size() const;

    /** @brief Renders the job status read model: status, progress, result and error. */
    static nlohmann::json ToStatusJson(const domain::Job& job);

    static std::string GenerateJobId();

private:
    /** @brief Applies @p mutate to a live entry and persists it. Caller must not hold m_mutex. */
    template<typename Mutator>
    bool Mutate(const std::string& jobId, const char* operation, Mutator&& mutate);

    // Both require m_mutex held.
    void AppendLocked(const domain::Job& job);
    void CompactIfNeededLocked();

    std::shared_ptr<domain::JobRepository> m_repository;
    std::shared_ptr<domain::ArtifactStore> m_artifacts;
    std::map<std::string, domain::Job> m_jobs;
    size_t m_appendsSinceCompaction = 0;
    mutable std::mutex m_mutex;
};

} // namespace timenotes::application
