/**
 * @file FileCreditLedger.hpp
 * @brief CreditLedger persisted as a JSON object of balances.
 */

#pragma once

#include "domain/CreditLedger.hpp"
#include <filesystem>
#include <map>
#include <mutex>

namespace timenotes::infrastructure {

/**
 * @class FileCreditLedger
 * @brief Keeps `{ "<identity>": <credits> }` in a JSON file.
 *
 * Unknown identities start with trial credits. Every action costs one credit.
 * An empty identity is anonymous usage and is never charged.
 */
class FileCreditLedger : public domain::CreditLedger {
public:
    static constexpr int kTrialCredits = 10;

    explicit FileCreditLedger(std::filesystem::path file, int trialCredits = kTrialCredits);

    domain::CreditCheckResult check(const std::string& identity, domain::ActionType action) override;
    domain::CreditCheckResult deduct(const std::string& identity, domain::ActionType action) override;

    static int CostOf(domain::ActionType action);

    /** @brief Current balance, including unclaimed trial credits. */
    int Balance(const std::string& identity);

    /** @brief Adds @p amount credits and persists. */
    void Grant(const std::string& identity, int amount);

private:
    std::map<std::string, int> load() const;
    void save(const std::map<std::string, int>& balances) const;

    std::filesystem::path m_file;
    int m_trialCredits;
    std::mutex m_mutex;
};

} // namespace timenotes::infrastructure
