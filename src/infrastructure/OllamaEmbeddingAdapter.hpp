/**
 * @file OllamaEmbeddingAdapter.hpp
 * @brief Adapter exposing a local Ollama server as an EmbeddingService.
 */

#pragma once
#include "domain/EmbeddingService.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <mutex>
#include <string>

namespace ssdverifier::infrastructure {

/**
 * @class OllamaEmbeddingAdapter
 * @brief Implements EmbeddingService using the Ollama REST API.
 */
class OllamaEmbeddingAdapter : public domain::EmbeddingService {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred embedding model.
     */
    OllamaEmbeddingAdapter(const std::string& host = "localhost",
                           int port = 11434,
                           const std::string& model = "nomic-embed-text");

    /** @brief Lists installed models and picks the embedding model. */
    void initialize() override;

    /** @see domain::EmbeddingService::embedBatch */
    std::vector<Embedding> embedBatch(const std::vector<std::string>& texts,
                                      std::chrono::milliseconds timeout) override;

    std::string getModelName() const override;

private:
    OllamaClient m_client;
    mutable std::mutex m_modelMutex;
    std::string m_model; ///< Target model name.
};

} // namespace ssdverifier::infrastructure
