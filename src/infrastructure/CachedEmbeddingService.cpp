/**
 * @file CachedEmbeddingService.cpp
 * @brief Implementation of CachedEmbeddingService.
 */

#include "infrastructure/CachedEmbeddingService.hpp"
#include <utility>

namespace ssdverifier::infrastructure {

CachedEmbeddingService::CachedEmbeddingService(std::shared_ptr<domain::EmbeddingService> inner,
                                               std::shared_ptr<EmbeddingCache> cache)
    : m_inner(std::move(inner)), m_cache(std::move(cache)) {}

void CachedEmbeddingService::initialize() {
    m_inner->initialize();
}

std::vector<domain::EmbeddingService::Embedding> CachedEmbeddingService::embedBatch(
    const std::vector<std::string>& texts,
    std::chrono::milliseconds timeout) {
    std::vector<Embedding> result(texts.size());
    std::vector<std::string> misses;
    std::vector<size_t> missIndices;

    for (size_t i = 0; i < texts.size(); ++i) {
        if (auto cached = m_cache->get(texts[i])) {
            result[i] = std::move(*cached);
        } else {
            misses.push_back(texts[i]);
            missIndices.push_back(i);
        }
    }

    if (misses.empty()) return result;

    auto fresh = m_inner->embedBatch(misses, timeout);
    if (fresh.size() != misses.size()) {
        throw domain::EmbeddingError("Provider returned " + std::to_string(fresh.size()) +
                                     " embeddings for " + std::to_string(misses.size()) + " texts.");
    }
    for (size_t k = 0; k < misses.size(); ++k) {
        m_cache->update(misses[k], fresh[k]);
        result[missIndices[k]] = std::move(fresh[k]);
    }
    return result;
}

std::string CachedEmbeddingService::getModelName() const {
    return m_inner->getModelName();
}

} // namespace ssdverifier::infrastructure
