#pragma once

#include "domain/Entitlement.hpp"
#include <filesystem>

namespace timenotes::infrastructure {

/**
 * @class JsonPlanDirectory
 * @brief Reads `{ "<identity>": "student" | ... }` from a plans file. Unlisted identities are on the free plan.
 */
class JsonPlanDirectory : public domain::PlanDirectory {
public:
    explicit JsonPlanDirectory(std::filesystem::path file);

    domain::PlanType planFor(const std::string& identity) override;

private:
    std::filesystem::path m_file;
};

} // namespace timenotes::infrastructure
