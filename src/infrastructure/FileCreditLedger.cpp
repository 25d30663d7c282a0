/**
 * @file FileCreditLedger.cpp
 * @brief Implementation of FileCreditLedger.
 */
#include "infrastructure/FileCreditLedger.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "domain/PipelineErrors.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace timenotes::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

FileCreditLedger::FileCreditLedger(fs::path file, int trialCredits)
    : m_file(std::move(file)), m_trialCredits(trialCredits) {}

int FileCreditLedger::CostOf(domain::ActionType) {
    return 1;
}

std::map<std::string, int> FileCreditLedger::load() const {
    std::map<std::string, int> balances;
    std::error_code ec;
    if (!fs::exists(m_file, ec)) {
        return balances;
    }

    std::ifstream in(m_file);
    if (!in.is_open()) {
        throw domain::LedgerError("Cannot open credit ledger: " + m_file.string());
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            throw domain::LedgerError("Credit ledger is not a JSON object: " + m_file.string());
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (it.value().is_number_integer()) {
                balances[it.key()] = it.value().get<int>();
            }
        }
    } catch (const json::exception& e) {
        throw domain::LedgerError("Corrupt credit ledger " + m_file.string() + ": " + e.what());
    }
    return balances;
}

void FileCreditLedger::save(const std::map<std::string, int>& balances) const {
    json j = json::object();
    for (const auto& [identity, credits] : balances) {
        j[identity] = credits;
    }
    if (!AtomicFileWriter::Write(m_file, j.dump(2))) {
        throw domain::LedgerError("Cannot write credit ledger: " + m_file.string());
    }
}

domain::CreditCheckResult FileCreditLedger::check(const std::string& identity, domain::ActionType action) {
    domain::CreditCheckResult result;
    result.creditsNeeded = CostOf(action);
    if (identity.empty()) {
        result.allowed = true;
        result.creditsNeeded = 0;
        result.message = "Anonymous usage";
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto balances = load();
    auto it = balances.find(identity);
    result.currentCredits = it != balances.end() ? it->second : m_trialCredits;
    result.allowed = result.currentCredits >= result.creditsNeeded;
    result.message = result.allowed
        ? "Sufficient credits"
        : "Insufficient credits: " + std::to_string(result.currentCredits) +
          " available, " + std::to_string(result.creditsNeeded) + " needed";
    return result;
}

domain::CreditCheckResult FileCreditLedger::deduct(const std::string& identity, domain::ActionType action) {
    domain::CreditCheckResult result;
    result.creditsNeeded = CostOf(action);
    if (identity.empty()) {
        result.allowed = true;
        result.creditsNeeded = 0;
        result.message = "Anonymous usage, nothing deducted";
        return result;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto balances = load();
    auto it = balances.find(identity);
    int current = it != balances.end() ? it->second : m_trialCredits;

    if (current < result.creditsNeeded) {
        result.allowed = false;
        result.currentCredits = current;
        result.message = "Insufficient credits";
        return result;
    }

    balances[identity] = current - result.creditsNeeded;
    save(balances);

    result.allowed = true;
    result.currentCredits = balances[identity];
    result.message = "Deducted " + std::to_string(result.creditsNeeded) + " credit(s)";
    std::cout << "[FileCreditLedger] " << identity << ": " << current << " -> "
              << result.currentCredits << " (" << domain::ActionToString(action) << ")" << std::endl;
    return result;
}

int FileCreditLedger::Balance(const std::string& identity) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto balances = load();
    auto it = balances.find(identity);
    return it != balances.end() ? it->second : m_trialCredits;
}

void FileCreditLedger::Grant(const std::string& identity, int amount) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto balances = load();
    auto it = balances.find(identity);
    int current = it != balances.end() ? it->second : m_trialCredits;
    balances[identity] = current + amount;
    save(balances);
}

} // namespace timenotes::infrastructure
