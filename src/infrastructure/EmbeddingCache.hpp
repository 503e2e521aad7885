/**
 * @file EmbeddingCache.hpp
 * @brief Persistence for text embeddings.
 */

#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ssdverifier::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Thread-safe cache of embeddings keyed by exact text, tied to one model.
 */
class EmbeddingCache {
public:
    /**
     * @param cacheFile JSON file used by persist()/load(). Empty disables persistence.
     * @param modelName Entries written by another model are discarded on load.
     */
    EmbeddingCache(const std::string& cacheFile, const std::string& modelName);

    /** @brief Updates or adds an embedding to the cache. */
    void update(const std::string& text, const std::vector<float>& embedding);

    /** @brief Retrieves an embedding for the exact text. */
    std::optional<std::vector<float>> get(const std::string& text) const;

    size_t size() const;

    /** @brief Saves cache to disk. Returns false if the file could not be written. */
    bool persist() const;

    /** @brief Loads cache from disk. */
    void load();

private:
    std::string m_cacheFile;
    std::string m_modelName;
    mutable std::mutex m_mutex;
    std::map<std::string, std::vector<float>> m_entries;
};

} // namespace ssdverifier::infrastructure
