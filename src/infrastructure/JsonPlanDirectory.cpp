#include "infrastructure/JsonPlanDirectory.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;

JsonPlanDirectory::JsonPlanDirectory(fs::path file) : m_file(std::move(file)) {}

domain::PlanType JsonPlanDirectory::planFor(const std::string& identity) {
    std::error_code ec;
    if (identity.empty() || !fs::exists(m_file, ec)) {
        return domain::PlanType::Free;
    }

    std::ifstream in(m_file);
    if (!in.is_open()) {
        std::cerr << "[JsonPlanDirectory] Cannot open " << m_file << std::endl;
        return domain::PlanType::Free;
    }

    try {
        auto j = nlohmann::json::parse(in);
        if (j.contains(identity) && j[identity].is_string()) {
            auto plan = domain::PlanFromString(j[identity].get<std::string>());
            if (plan) return *plan;
            std::cerr << "[JsonPlanDirectory] Unknown plan for " << identity << ", using free" << std::endl;
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[JsonPlanDirectory] Error parsing " << m_file << ": " << e.what() << std::endl;
    }
    return domain::PlanType::Free;
}

} // namespace timenotes::infrastructure
