/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ssdverifier::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/embed with all texts in one payload.
     * @param model Embedding model name.
     * @param texts Texts to embed.
     * @param timeout Applied separately to the connect, write and read phases.
     *        Each read waits at most @p timeout for the next data, so a server
     *        that keeps streaming slowly can hold the call for longer in total.
     * @param error Receives a description of the failure, if any.
     * @return One vector per text, or nullopt on failure.
     */
    std::optional<std::vector<std::vector<float>>> embed(const std::string& model,
                                                         const std::vector<std::string>& texts,
                                                         std::chrono::milliseconds timeout,
                                                         std::string& error);

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels();

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace ssdverifier::infrastructure
