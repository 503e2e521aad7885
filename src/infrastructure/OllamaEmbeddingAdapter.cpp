/**
 * @file OllamaEmbeddingAdapter.cpp
 * @brief Implementation of the OllamaEmbeddingAdapter class.
 */
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include "infrastructure/ModelSelector.hpp"
#include <iostream>
#include <utility>

namespace ssdverifier::infrastructure {

OllamaEmbeddingAdapter::OllamaEmbeddingAdapter(const std::string& host, int port, const std::string& model)
    : m_client(host, port), m_model(model) {}

void OllamaEmbeddingAdapter::initialize() {
    auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaEmbeddingAdapter] Failed to list models. Is Ollama running? Keeping default: "
                  << getModelName() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(m_modelMutex);
    const std::string selected = ModelSelector::SelectEmbeddingModel(available, m_model);
    if (selected != m_model) {
        std::cout << "[OllamaEmbeddingAdapter] Auto-selected model: " << selected << std::endl;
    }
    m_model = selected;
}

std::vector<domain::EmbeddingService::Embedding> OllamaEmbeddingAdapter::embedBatch(
    const std::vector<std::string>& texts,
    std::chrono::milliseconds timeout) {
    if (texts.empty()) return {};

    std::string error;
    auto vectors = m_client.embed(getModelName(), texts, timeout, error);
    if (!vectors) {
        throw domain::EmbeddingError("Ollama " + m_client.host() + ":" + std::to_string(m_client.port()) +
                                     " could not embed " + std::to_string(texts.size()) + " texts: " + error);
    }
    if (vectors->size() != texts.size()) {
        throw domain::EmbeddingError("Ollama returned " + std::to_string(vectors->size()) +
                                     " embeddings for " + std::to_string(texts.size()) + " texts.");
    }
    return std::move(*vectors);
}

std::string OllamaEmbeddingAdapter::getModelName() const {
    std::lock_guard<std::mutex> lock(m_modelMutex);
    return m_model;
}

} // namespace ssdverifier::infrastructure
