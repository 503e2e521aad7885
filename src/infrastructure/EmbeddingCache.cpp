/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace ssdverifier::infrastructure {

EmbeddingCache::EmbeddingCache(const std::string& cacheFile, const std::string& modelName)
    : m_cacheFile(cacheFile), m_modelName(modelName) {}

void EmbeddingCache::update(const std::string& text, const std::vector<float>& embedding) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries[text] = embedding;
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& text) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(text);
    if (it != m_entries.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t EmbeddingCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool EmbeddingCache::persist() const {
    if (m_cacheFile.empty()) return false;
    fs::path p(m_cacheFile);

    json j = {
        {"model", m_modelName},
        {"entries", json::array()}
    };
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [text, vector] : m_entries) {
            j["entries"].push_back({ {"text", text}, {"vector", vector} });
        }
    }

    std::string error;
    if (!AtomicFileWriter::Write(p.string(), j.dump(), error)) {
        std::cerr << "[EmbeddingCache] " << error << std::endl;
        return false;
    }
    return true;
}

void EmbeddingCache::load() {
    if (m_cacheFile.empty()) return;
    fs::path p(m_cacheFile);
    if (!fs::exists(p)) return;

    try {
        std::ifstream f(p);
        if (!f.is_open()) return;

        json j = json::parse(f);
        if (j.value("model", std::string()) != m_modelName) {
            std::cout << "[EmbeddingCache] Cache built with another model; starting empty." << std::endl;
            return;
        }
        std::map<std::string, std::vector<float>> loaded;
        for (const auto& entry : j.value("entries", json::array())) {
            if (entry.contains("text") && entry["text"].is_string() &&
                entry.contains("vector") && entry["vector"].is_array()) {
                loaded[entry["text"].get<std::string>()] = entry["vector"].get<std::vector<float>>();
            }
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries = std::move(loaded);
    } catch (const std::exception& e) {
        std::cerr << "[EmbeddingCache] Ignoring unreadable cache " << p.string() << ": " << e.what() << std::endl;
    }
}

} // namespace ssdverifier::infrastructure
