#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <iostream>

namespace ssdverifier::infrastructure {

using json = nlohmann::json;

namespace {

// Per-phase limits (connect, read, write), not an overall deadline for the call.
template <typename Duration>
void ApplyTimeout(httplib::Client& cli, Duration timeout) {
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
    cli.set_connection_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    cli.set_read_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
    cli.set_write_timeout(static_cast<time_t>(secs.count()), static_cast<time_t>(usecs.count()));
}

} // namespace

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::vector<std::vector<float>>> OllamaClient::embed(const std::string& model,
                                                                   const std::vector<std::string>& texts,
                                                                   std::chrono::milliseconds timeout,
                                                                   std::string& error) {
    httplib::Client cli(m_host, m_port);
    ApplyTimeout(cli, timeout);

    json requestData = {
        {"model", model},
        {"input", texts}
    };

    auto res = cli.Post("/api/embed", requestData.dump(), "application/json");
    if (!res) {
        error = "Connection failed: " + std::to_string(static_cast<int>(res.error()));
        std::cerr << "[OllamaClient] " << error << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        error = "HTTP Error " + std::to_string(res->status) + ": " + res->body;
        std::cerr << "[OllamaClient] " << error << std::endl;
        return std::nullopt;
    }

    try {
        auto body = json::parse(res->body);
        if (!body.contains("embeddings") || !body["embeddings"].is_array()) {
            error = "Response has no 'embeddings' array.";
            std::cerr << "[OllamaClient] " << error << std::endl;
            return std::nullopt;
        }
        return body["embeddings"].get<std::vector<std::vector<float>>>();
    } catch (const std::exception& e) {
        error = std::string("JSON Parse Error: ") + e.what();
        std::cerr << "[OllamaClient] " << error << std::endl;
    }
    return std::nullopt;
}

std::vector<std::string> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
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
            std::cerr << "[OllamaClient] Error parsing model list: " << e.what() << std::endl;
        }
    }
    return models;
}

} // namespace ssdverifier::infrastructure
