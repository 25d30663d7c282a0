/**
 * @file Entitlement.hpp
 * @brief Subscription plans and their input-duration limits.
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <iomanip>

namespace timenotes::domain {

enum class PlanType {
    Free,
    Student,
    Researcher,
    Expert
};

/** @brief Maximum input length in minutes for a plan. */
inline int AllowedMinutes(PlanType plan) {
    switch (plan) {
        case PlanType::Free: return 30;
        case PlanType::Student: return 60;
        case PlanType::Researcher: return 120;
        case PlanType::Expert: return 300;
    }
    return 30;
}

inline std::string PlanToString(PlanType plan) {
    switch (plan) {
        case PlanType::Free: return "free";
        case PlanType::Student: return "student";
        case PlanType::Researcher: return "researcher";
        case PlanType::Expert: return "expert";
    }
    return "free";
}

inline std::optional<PlanType> PlanFromString(const std::string& value) {
    if (value == "free") return PlanType::Free;
    if (value == "student") return PlanType::Student;
    if (value == "researcher") return PlanType::Researcher;
    if (value == "expert") return PlanType::Expert;
    return std::nullopt;
}

/**
 * @struct DurationCheck
 * @brief Outcome of validating an input duration against a plan.
 */
struct DurationCheck {
    bool valid = true;
    double durationMinutes = 0.0;
    int allowedMinutes = 0;
    std::string message;
};

/**
 * @brief Validates @p durationSeconds against @p plan and suggests the smallest plan that fits.
 */
inline DurationCheck CheckDuration(PlanType plan, double durationSeconds) {
    DurationCheck check;
    check.durationMinutes = durationSeconds / 60.0;
    check.allowedMinutes = AllowedMinutes(plan);

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(1);
    if (check.durationMinutes <= check.allowedMinutes) {
        msg << "Video approved. Duration: " << check.durationMinutes
            << " minutes (limit: " << check.allowedMinutes << " minutes)";
        check.message = msg.str();
        return check;
    }

    check.valid = false;
    msg << "Video duration (" << check.durationMinutes << " minutes) exceeds your plan limit of "
        << check.allowedMinutes << " minutes.";
    for (PlanType candidate : {PlanType::Free, PlanType::Student, PlanType::Researcher, PlanType::Expert}) {
        if (candidate != plan && AllowedMinutes(candidate) >= check.durationMinutes) {
            msg << " Consider upgrading to the " << PlanToString(candidate)
                << " plan (allows videos up to " << AllowedMinutes(candidate) << " minutes)";
            break;
        }
    }
    check.message = msg.str();
    return check;
}

/**
 * @class PlanDirectory
 * @brief Resolves the subscription plan of an identity.
 */
class PlanDirectory {
public:
    virtual ~PlanDirectory() = default;
    virtual PlanType planFor(const std::string& identity) = 0;
};

} // namespace timenotes::domain
