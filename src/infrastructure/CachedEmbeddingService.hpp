/**
 * @file CachedEmbeddingService.hpp
 * @brief EmbeddingService decorator backed by an EmbeddingCache.
 */

#pragma once
#include <memory>
#include "domain/EmbeddingService.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace ssdverifier::infrastructure {

/**
 * @class CachedEmbeddingService
 * @brief Serves cached vectors and forwards only the misses, still as one batch.
 */
class CachedEmbeddingService : public domain::EmbeddingService {
public:
    CachedEmbeddingService(std::shared_ptr<domain::EmbeddingService> inner,
                           std::shared_ptr<EmbeddingCache> cache);

    void initialize() override;

    std::vector<Embedding> embedBatch(const std::vector<std::string>& texts,
                                      std::chrono::milliseconds timeout) override;

    std::string getModelName() const override;

private:
    std::shared_ptr<domain::EmbeddingService> m_inner;
    std::shared_ptr<EmbeddingCache> m_cache;
};

} // namespace ssdverifier::infrastructure
