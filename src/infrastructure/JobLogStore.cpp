/**
 * @file JobLogStore.cpp
 * @brief Implementation of JobLogStore.
 */

#include "infrastructure/JobLogStore.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace timenotes::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

JobLogStore::JobLogStore(fs::path logPath) : m_logPath(std::move(logPath)) {
    PathUtils::EnsureDirectory(m_logPath.parent_path());
}

std::string JobLogStore::FormatTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::chrono::system_clock::time_point JobLogStore::ParseTimestamp(const std::string& iso) {
    std::tm utc{};
    std::istringstream ss(iso);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Bad timestamp: " + iso);
    }
    return std::chrono::system_clock::from_time_t(timegm(&utc));
}

json JobLogStore::ToJson(const domain::Job& job) {
    json j;
    j["id"] = job.id;
    j["status"] = domain::StatusToString(job.status);
    j["progress"] = job.progress;
    j["owner"] = job.owner ? json(*job.owner) : json(nullptr);
    j["action_type"] = job.actionType ? json(domain::ActionToString(*job.actionType)) : json(nullptr);
    j["credits_deducted"] = job.creditsDeducted;
    j["created_at"] = FormatTimestamp(job.createdAt);
    j["updated_at"] = FormatTimestamp(job.updatedAt);
    j["result"] = job.result;
    if (job.error) {
        j["error"] = *job.error;
    }
    if (job.recovered) {
        j["recovered"] = true;
    }
    return j;
}

domain::Job JobLogStore::FromJson(const json& j) {
    domain::Job job;
    job.id = j.at("id").get<std::string>();
    if (job.id.empty()) {
        throw std::invalid_argument("Job record without id");
    }
    auto status = domain::StatusFromString(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("Unknown status for job " + job.id);
    }
    job.status = *status;
    job.progress = j.value("progress", "");
    if (j.contains("owner") && j["owner"].is_string()) {
        job.owner = j["owner"].get<std::string>();
    }
    if (j.contains("action_type") && j["action_type"].is_string()) {
        job.actionType = domain::ActionFromString(j["action_type"].get<std::string>());
    }
    job.creditsDeducted = j.value("credits_deducted", false);
    job.createdAt = ParseTimestamp(j.at("created_at").get<std::string>());
    job.updatedAt = ParseTimestamp(j.value("updated_at", j.at("created_at").get<std::string>()));
    if (j.contains("result") && j["result"].is_object()) {
        job.result = j["result"];
    }
    if (j.contains("error") && j["error"].is_string()) {
        job.error = j["error"].get<std::string>();
    }
    job.recovered = j.value("recovered", false);
    return job;
}

void JobLogStore::append(const domain::Job& job) {
    std::string line = ToJson(job).dump() + "\n";

    std::lock_guard<std::mutex> lock(m_fileMutex);
    std::ofstream out(m_logPath, std::ios::app | std::ios::binary);
    if (!out.is_open()) {
        std::cerr << "[JobLogStore] Cannot open log for append: " << m_logPath << std::endl;
        return;
    }
    out << line;
    out.flush();
    if (out.fail()) {
        std::cerr << "[JobLogStore] Append failed for job " << job.id << std::endl;
    }
}

std::vector<domain::Job> JobLogStore::loadAll() {
    std::vector<domain::Job> jobs;
    std::unordered_map<std::string, size_t> indexById;

    std::lock_guard<std::mutex> lock(m_fileMutex);
    std::error_code ec;
    if (!fs::exists(m_logPath, ec)) {
        return jobs;
    }

    std::ifstream in(m_logPath);
    if (!in.is_open()) {
        std::cerr << "[JobLogStore] Cannot read log, starting empty: " << m_logPath << std::endl;
        return jobs;
    }

    std::string line;
    size_t lineNo = 0;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            domain::Job job = FromJson(json::parse(line));
            auto it = indexById.find(job.id);
            if (it == indexById.end()) {
                indexById.emplace(job.id, jobs.size());
                jobs.push_back(std::move(job));
            } else {
                jobs[it->second] = std::move(job);
            }
        } catch (const std::exception& e) {
            ++skipped;
            std::cerr << "[JobLogStore] Skipping malformed line " << lineNo << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[JobLogStore] Replayed " << jobs.size() << " jobs";
    if (skipped > 0) {
        std::cout << " (" << skipped << " malformed lines skipped)";
    }
    std::cout << "." << std::endl;
    return jobs;
}

void JobLogStore::compact(const std::vector<domain::Job>& jobs) {
    std::ostringstream content;
    for (const auto& job : jobs) {
        content << ToJson(job).dump() << "\n";
    }

    std::lock_guard<std::mutex> lock(m_fileMutex);
    if (!AtomicFileWriter::Write(m_logPath, content.str())) {
        std::cerr << "[JobLogStore] Compaction failed; keeping existing log." << std::endl;
    }
}

} // namespace timenotes::infrastructure
