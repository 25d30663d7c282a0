/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "infrastructure/RateLimiter.hpp"

namespace timenotes::infrastructure {

class OllamaClient {
public:
    /**
     * @param limiter Throttle applied before every generation request. May be null.
     */
    OllamaClient(const std::string& host = "localhost", int port = 11434,
                 std::shared_ptr<RateLimiter> limiter = nullptr);

    /** @brief Sends a POST request to /api/generate. */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        double temperature = 0.3);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    std::shared_ptr<RateLimiter> m_limiter;
};

} // namespace timenotes::infrastructure
