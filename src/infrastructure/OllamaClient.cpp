#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace timenotes::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kTopP = 0.9;
constexpr int kMaxTokens = 4000;
}

OllamaClient::OllamaClient(const std::string& host, int port, std::shared_ptr<RateLimiter> limiter)
    : m_host(host), m_port(port), m_limiter(std::move(limiter)) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  double temperature) {
    if (m_limiter) {
        m_limiter->Acquire();
    }

    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600); // 10 min

    json requestData = {
        {"model", model},
        {"system", system},
        {"prompt", prompt},
        {"stream", false},
        {"options", {
            {"temperature", temperature},
            {"top_p", kTopP},
            {"num_predict", kMaxTokens}
        }}
    };

    auto res = cli.Post("/api/generate", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("response")) {
                return body["response"].get<std::string>();
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[OllamaClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(3);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    std::vector<std::string> models;
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("models") && body["models"].is_array()) {
                for (const auto& item : body["models"]) {
                    if (item.contains("name")) {
                        models.push_back(item["name"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OllamaClient] Model list parse error: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace timenotes::infrastructure
