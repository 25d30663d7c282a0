/**
 * @file JobLogStore.hpp
 * @brief Append-only NDJSON log of job records.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/JobRepository.hpp"

namespace timenotes::infrastructure {

/**
 * @class JobLogStore
 * @brief File-backed JobRepository. One full job record per line; the last line for an id wins.
 */
class JobLogStore : public domain::JobRepository {
public:
    explicit JobLogStore(std::filesystem::path logPath);

    void append(const domain::Job& job) override;
    std::vector<domain::Job> loadAll() override;
    void compact(const std::vector<domain::Job>& jobs) override;

    static nlohmann::json ToJson(const domain::Job& job);
    /** @throws nlohmann::json::exception or std::invalid_argument on malformed records. */
    static domain::Job FromJson(const nlohmann::json& j);

    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    static std::chrono::system_clock::time_point ParseTimestamp(const std::string& iso);

private:
    std::filesystem::path m_logPath;
    std::mutex m_fileMutex;
};

} // namespace timenotes::infrastructure
