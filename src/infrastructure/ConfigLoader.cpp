/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

namespace ssdverifier::infrastructure {

namespace {

constexpr const char* kAppDir = "SsdVerifier";

void ReadStringList(const nlohmann::json& j, const char* key, std::vector<std::string>& target) {
    if (!j.contains(key) || !j[key].is_array()) return;
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (item.is_string()) values.push_back(item.get<std::string>());
    }
    target = std::move(values);
}

void ReadVocabulary(const nlohmann::json& j, domain::fidelity::ExtractionVocabulary& vocabulary) {
    ReadStringList(j, "equation_patterns", vocabulary.equationPatterns);
    ReadStringList(j, "assumption_keywords", vocabulary.assumptionKeywords);
    ReadStringList(j, "constraint_keywords", vocabulary.constraintKeywords);
    ReadStringList(j, "structural_markers", vocabulary.structuralMarkers);
    ReadStringList(j, "domain_keywords", vocabulary.domainKeywords);
    if (j.contains("expression_pattern") && j["expression_pattern"].is_string()) {
        vocabulary.expressionPattern = j["expression_pattern"].get<std::string>();
    }
    if (j.contains("parameter_pattern") && j["parameter_pattern"].is_string()) {
        vocabulary.parameterPattern = j["parameter_pattern"].get<std::string>();
    }
}

nlohmann::json WriteVocabulary(const domain::fidelity::ExtractionVocabulary& vocabulary) {
    return {
        {"equation_patterns", vocabulary.equationPatterns},
        {"expression_pattern", vocabulary.expressionPattern},
        {"parameter_pattern", vocabulary.parameterPattern},
        {"assumption_keywords", vocabulary.assumptionKeywords},
        {"constraint_keywords", vocabulary.constraintKeywords},
        {"structural_markers", vocabulary.structuralMarkers},
        {"domain_keywords", vocabulary.domainKeywords}
    };
}

} // namespace

VerifierSettings ConfigLoader::Load(const std::string& path) {
    VerifierSettings settings;
    std::filesystem::path configPath(path);
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        settings.ollamaHost = j.value("ollama_host", settings.ollamaHost);
        settings.ollamaPort = j.value("ollama_port", settings.ollamaPort);
        settings.embeddingModel = j.value("embedding_model", settings.embeddingModel);
        settings.embeddingTimeoutMs = j.value("embedding_timeout_ms", settings.embeddingTimeoutMs);
        const long long workers = j.value("workers", static_cast<long long>(settings.workers));
        settings.workers = workers > 0 ? static_cast<size_t>(workers) : 1;
        settings.embeddingCache = j.value("embedding_cache", settings.embeddingCache);
        if (j.contains("vocabulary") && j["vocabulary"].is_object()) {
            ReadVocabulary(j["vocabulary"], settings.vocabulary);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath.string() << ": " << e.what() << std::endl;
        return VerifierSettings{};
    }

    if (settings.embeddingTimeoutMs <= 0) settings.embeddingTimeoutMs = VerifierSettings{}.embeddingTimeoutMs;
    return settings;
}

bool ConfigLoader::Save(const std::string& path, const VerifierSettings& settings) {
    std::filesystem::path configPath(path);
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const std::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath.string() << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["ollama_host"] = settings.ollamaHost;
    j["ollama_port"] = settings.ollamaPort;
    j["embedding_model"] = settings.embeddingModel;
    j["embedding_timeout_ms"] = settings.embeddingTimeoutMs;
    j["workers"] = settings.workers;
    j["embedding_cache"] = settings.embeddingCache;
    j["vocabulary"] = WriteVocabulary(settings.vocabulary);

    std::string error;
    if (!AtomicFileWriter::Write(configPath.string(), j.dump(4), error)) {
        std::cerr << "[ConfigLoader] Error writing settings: " << error << std::endl;
        return false;
    }
    return true;
}

std::string ConfigLoader::DefaultSettingsPath() {
    return (PathUtils::GetConfigHome() / kAppDir / "settings.json").string();
}

std::string ConfigLoader::DefaultEmbeddingCachePath() {
    return (PathUtils::GetCacheHome() / kAppDir / "embeddings.json").string();
}

} // namespace ssdverifier::infrastructure
