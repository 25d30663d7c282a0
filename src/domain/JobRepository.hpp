/**
 * @file JobRepository.hpp
 * @brief Interface for durable storage of job records.
 */

#pragma once

#include "domain/Job.hpp"
#include <vector>

namespace timenotes::domain {

/**
 * @class JobRepository
 * @brief Abstract persistence behind the job registry.
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    /** @brief Durably records the current state of one job. */
    virtual void append(const Job& job) = 0;

    /**
     * @brief Loads the latest record of every stored job.
     * @return Stored jobs, or an empty list if storage cannot be read.
     */
    virtual std::vector<Job> loadAll() = 0;

    /** @brief Rewrites storage so it holds exactly @p jobs. */
    virtual void compact(const std::vector<Job>& jobs) = 0;
};

} // namespace timenotes::domain
