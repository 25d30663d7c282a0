/**
 * @file CreditLedger.hpp
 * @brief Interface for usage accounting.
 */

#pragma once

#include "domain/Job.hpp"
#include <string>

namespace timenotes::domain {

/**
 * @struct CreditCheckResult
 * @brief Outcome of a balance check or a deduction.
 */
struct CreditCheckResult {
    bool allowed = false;
    int currentCredits = 0;
    int creditsNeeded = 0;
    std::string message;
};

/**
 * @class CreditLedger
 * @brief Abstract credit store. Implementations throw LedgerError when the store itself is unusable.
 */
class CreditLedger {
public:
    virtual ~CreditLedger() = default;

    /** @brief Checks the balance without changing it. */
    virtual CreditCheckResult check(const std::string& identity, ActionType action) = 0;

    /** @brief Deducts the cost of @p action if the balance allows it. */
    virtual CreditCheckResult deduct(const std::string& identity, ActionType action) = 0;
};

} // namespace timenotes::domain
