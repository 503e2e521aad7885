/**
 * @file EmbeddingService.hpp
 * @brief Interface for text embedding providers.
 */

#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ssdverifier::domain {

/**
 * @class EmbeddingError
 * @brief Raised when a provider cannot embed a batch (timeout, unavailable, bad payload).
 */
class EmbeddingError : public std::runtime_error {
public:
    explicit EmbeddingError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class EmbeddingService
 * @brief Abstract interface for services that map text to fixed-length vectors.
 */
class EmbeddingService {
public:
    using Embedding = std::vector<float>;

    virtual ~EmbeddingService() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Embeds a batch of texts in a single provider round trip.
     * @param texts Texts to embed.
     * @param timeout Provider timeout. How it bounds the call (per phase or in
     *        total) is up to the implementation.
     * @return One embedding per input text, in input order.
     * @throws EmbeddingError on timeout, transport failure or malformed response.
     */
    virtual std::vector<Embedding> embedBatch(const std::vector<std::string>& texts,
                                              std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Embeds a single text.
     * @see embedBatch
     */
    virtual Embedding getEmbedding(const std::string& text, std::chrono::milliseconds timeout) {
        auto vectors = embedBatch({text}, timeout);
        if (vectors.size() != 1) {
            throw EmbeddingError("Provider returned " + std::to_string(vectors.size()) + " vectors for one text.");
        }
        return std::move(vectors.front());
    }

    /**
     * @brief Gets the name of the embedding model in use.
     * @return The model name.
     */
    virtual std::string getModelName() const = 0;
};

} // namespace ssdverifier::domain
