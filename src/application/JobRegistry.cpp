/**
 * @file JobRegistry.cpp
 * @brief Implementation of JobRegistry.
 */

#include "application/JobRegistry.hpp"

#include <algorithm>
#include <cstdio>
#include <iostream>
#include <random>

namespace timenotes::application {

using json = nlohmann::json;
using domain::Job;
using domain::JobStatus;

namespace {

int StatusRank(JobStatus status) {
    switch (status) {
        case JobStatus::Created: return 0;
        case JobStatus::Processing: return 1;
        case JobStatus::Completed:
        case JobStatus::Error: return 2;
    }
    return 0;
}

} // namespace

JobRegistry::JobRegistry(std::shared_ptr<domain::JobRepository> repository,
                         std::shared_ptr<domain::ArtifactStore> artifacts)
    : m_repository(std::move(repository)), m_artifacts(std::move(artifacts)) {
    if (!m_repository) {
        return;
    }

    std::vector<Job> stored;
    try {
        stored = m_repository->loadAll();
    } catch (const std::exception& e) {
        std::cerr << "[JobRegistry] Failed to load job log, starting empty: " << e.what() << std::endl;
        stored.clear();
    }

    for (auto& job : stored) {
        std::string id = job.id;
        m_jobs[id] = std::move(job);
    }

    if (!m_jobs.empty()) {
        std::vector<Job> snapshot;
        snapshot.reserve(m_jobs.size());
        for (const auto& [id, job] : m_jobs) {
            snapshot.push_back(job);
        }
        m_repository->compact(snapshot);
    }
    std::cout << "[JobRegistry] Loaded " << m_jobs.size() << " jobs." << std::endl;
}

std::string JobRegistry::GenerateJobId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> dist;

    unsigned long long hi = dist(rng);
    unsigned long long lo = dist(rng);
    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (hi >> 32) & 0xFFFFFFFFULL,
                  (hi >> 16) & 0xFFFFULL,
                  hi & 0xFFFFULL,
                  (lo >> 48) & 0xFFFFULL,
                  lo & 0xFFFFFFFFFFFFULL);
    return std::string(buf);
}

std::string JobRegistry::Create(std::optional<std::string> owner,
                                std::optional<domain::ActionType> actionType) {
    Job job;
    job.status = JobStatus::Created;
    job.progress = "Job created...";
    job.owner = std::move(owner);
    job.actionType = actionType;
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;

    std::lock_guard<std::mutex> lock(m_mutex);
    do {
        job.id = GenerateJobId();
    } while (m_jobs.count(job.id) > 0);

    AppendLocked(job);
    std::string id = job.id;
    m_jobs.emplace(id, std::move(job));
    CompactIfNeededLocked();
    std::cout << "[JobRegistry] Created job " << id << std::endl;
    return id;
}

template<typename Mutator>
bool JobRegistry::Mutate(const std::string& jobId, const char* operation, Mutator&& mutate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        std::cerr << "[JobRegistry] " << operation << ": job " << jobId << " not found" << std::endl;
        return false;
    }

    Job updated = it->second;
    if (!mutate(updated)) {
        return false;
    }
    updated.updatedAt = std::chrono::system_clock::now();

    AppendLocked(updated);
    it->second = std::move(updated);
    CompactIfNeededLocked();
    return true;
}

void JobRegistry::AppendLocked(const Job& job) {
    if (m_repository) {
        m_repository->append(job);
        ++m_appendsSinceCompaction;
    }
}

void JobRegistry::CompactIfNeededLocked() {
    if (!m_repository) {
        return;
    }
    size_t threshold = std::max(kCompactionFactor * m_jobs.size(), kMinCompactionAppends);
    if (m_appendsSinceCompaction < threshold) {
        return;
    }

    std::vector<Job> snapshot;
    snapshot.reserve(m_jobs.size());
    for (const auto& [id, job] : m_jobs) {
        snapshot.push_back(job);
    }
    try {
        m_repository->compact(snapshot);
        std::cout << "[JobRegistry] Compacted job log to " << snapshot.size() << " records." << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[JobRegistry] Job log compaction failed: " << e.what() << std::endl;
    }
    m_appendsSinceCompaction = 0;
}

bool JobRegistry::UpdateStatus(const std::string& jobId, JobStatus status,
                               const std::optional<std::string>& progress,
                               const json& fields) {
    return Mutate(jobId, "UpdateStatus", [&](Job& job) {
        if (domain::IsTerminal(job.status) || StatusRank(status) < StatusRank(job.status)) {
            std::cerr << "[JobRegistry] Refusing transition of job " << jobId << " from "
                      << domain::StatusToString(job.status) << " to "
                      << domain::StatusToString(status) << std::endl;
            return false;
        }
        job.status = status;
        if (progress && !progress->empty()) {
            job.progress = *progress;
        }
        if (fields.is_object()) {
            job.result.update(fields);
        }
        return true;
    });
}

bool JobRegistry::UpdateProgress(const std::string& jobId, const std::string& message) {
    return Mutate(jobId, "UpdateProgress", [&](Job& job) {
        job.progress = message;
        return true;
    });
}

bool JobRegistry::Complete(const std::string& jobId, const json& result) {
    return Mutate(jobId, "Complete", [&](Job& job) {
        if (domain::IsTerminal(job.status)) {
            std::cerr << "[JobRegistry] Job " << jobId << " already finished as "
                      << domain::StatusToString(job.status) << std::endl;
            return false;
        }
        job.status = JobStatus::Completed;
        job.progress = "Processing completed successfully!";
        if (result.is_object()) {
            job.result.update(result);
            auto flag = result.find("credits_deducted");
            if (flag != result.end() && flag->is_boolean()) {
                job.creditsDeducted = flag->get<bool>();
            }
        }
        return true;
    });
}

bool JobRegistry::Fail(const std::string& jobId, const std::string& error) {
    return Mutate(jobId, "Fail", [&](Job& job) {
        if (domain::IsTerminal(job.status)) {
            std::cerr << "[JobRegistry] Job " << jobId << " already finished as "
                      << domain::StatusToString(job.status) << std::endl;
            return false;
        }
        job.status = JobStatus::Error;
        job.progress = "Processing failed";
        job.error = error;
        job.creditsDeducted = false;
        job.result["credits_deducted"] = false;
        return true;
    });
}

bool JobRegistry::MarkCreditsDeducted(const std::string& jobId, bool deducted) {
    return Mutate(jobId, "MarkCreditsDeducted", [&](Job& job) {
        if (job.status == JobStatus::Error && deducted) {
            std::cerr << "[JobRegistry] Cannot mark failed job " << jobId << " as charged" << std::endl;
            return false;
        }
        job.creditsDeducted = deducted;
        return true;
    });
}

std::optional<Job> JobRegistry::Get(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(jobId);
        if (it != m_jobs.end()) {
            return it->second;
        }
    }

    if (!Reconcile(jobId)) {
        std::cerr << "[JobRegistry] Job " << jobId << " not found" << std::endl;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JobRegistry::Exists(const std::string& jobId) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_jobs.count(jobId) > 0) {
            return true;
        }
    }
    return Reconcile(jobId);
}

bool JobRegistry::Reconcile(const std::string& jobId) {
    if (!m_artifacts || jobId.empty()) {
        return false;
    }

    bool found = false;
    try {
        found = m_artifacts->hasAny(jobId);
    } catch (const std::exception& e) {
        std::cerr << "[JobRegistry] Artifact probe failed for " << jobId << ": " << e.what() << std::endl;
        return false;
    }
    if (!found) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_jobs.count(jobId) > 0) {
        return true;
    }

    Job job;
    job.id = jobId;
    job.status = JobStatus::Completed;
    job.progress = "Recovered from stored artifacts";
    job.creditsDeducted = true;
    job.recovered = true;
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;
    job.result["recovered"] = true;
    job.result["credits_deducted"] = true;
    job.result["has_notes"] = m_artifacts->exists(jobId, domain::ArtifactKind::NotesMarkdown);
    job.result["has_timestamped_notes"] = m_artifacts->exists(jobId, domain::ArtifactKind::TimestampedJson);

    AppendLocked(job);
    m_jobs.emplace(jobId, std::move(job));
    CompactIfNeededLocked();
    std::cout << "[JobRegistry] Recovered job " << jobId << " from artifacts." << std::endl;
    return true;
}

std::vector<Job> JobRegistry::ListForOwner(const std::string& owner) const {
    std::vector<Job> jobs;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, job] : m_jobs) {
        if (job.owner && *job.owner == owner) {
            jobs.push_back(job);
        }
    }
    return jobs;
}

size_t JobRegistry::Size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.size();
}

json JobRegistry::ToStatusJson(const Job& job) {
    json j;
    j["job_id"] = job.id;
    j["status"] = domain::StatusToString(job.status);
    j["progress"] = job.progress;
    j["credits_deducted"] = job.creditsDeducted;
    if (!job.result.empty()) {
        j["result"] = job.result;
    }
    if (job.error) {
        j["error"] = *job.error;
    }
    if (job.recovered) {
        j["recovered"] = true;
    }
    return j;
}

} // namespace timenotes::application
