/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving verifier configuration (settings.json).
 *
 * Provides a unified way to access configuration like the embedding endpoint
 * and extraction vocabulary without scattering JSON parsing logic throughout
 * the codebase.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/fidelity/ExtractionVocabulary.hpp"

namespace ssdverifier::infrastructure {

/**
 * @struct VerifierSettings
 * @brief Runtime configuration. Every field has a usable default.
 */
struct VerifierSettings {
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string embeddingModel = "nomic-embed-text";
    long embeddingTimeoutMs = 30000;
    size_t workers = 4;
    bool embeddingCache = true;
    domain::fidelity::ExtractionVocabulary vocabulary = domain::fidelity::ExtractionVocabulary::Defaults();
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param path Path to settings.json.
     * @return Defaults overlaid with the keys present in the file. A missing or
     *         unreadable file yields the defaults.
     */
    static VerifierSettings Load(const std::string& path);

    /**
     * @brief Saves the settings to a JSON file, preserving unknown keys if possible.
     * @return false if the file could not be written.
     */
    static bool Save(const std::string& path, const VerifierSettings& settings);

    /** @brief Default settings path: $XDG_CONFIG_HOME/SsdVerifier/settings.json. */
    static std::string DefaultSettingsPath();

    /** @brief Default embedding cache file under $XDG_CACHE_HOME/SsdVerifier/. */
    static std::string DefaultEmbeddingCachePath();
};

} // namespace ssdverifier::infrastructure
