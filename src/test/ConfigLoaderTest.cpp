#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"

using namespace ssdverifier::infrastructure;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    std::string testRoot = "test_config_loader";
    std::filesystem::create_directories(testRoot);
    const std::string settingsFile = testRoot + "/settings.json";

    // Missing file -> defaults
    {
        auto settings = ConfigLoader::Load(testRoot + "/absent.json");
        assert(settings.ollamaHost == "localhost");
        assert(settings.ollamaPort == 11434);
        assert(settings.embeddingModel == "nomic-embed-text");
        assert(settings.workers == 4);
        assert(settings.embeddingCache);
        assert(!settings.vocabulary.assumptionKeywords.empty());
    }

    // Partial file overlays defaults
    {
        std::ofstream(settingsFile) << R"({
            "ollama_port": 9000,
            "workers": 0,
            "embedding_timeout_ms": -5,
            "vocabulary": { "assumption_keywords": ["suppose", 42] }
        })";
        auto settings = ConfigLoader::Load(settingsFile);
        assert(settings.ollamaPort == 9000);
        assert(settings.ollamaHost == "localhost");
        assert(settings.workers == 1 && "Zero workers is clamped to one.");
        assert(settings.embeddingTimeoutMs == 30000);
        assert(settings.vocabulary.assumptionKeywords.size() == 1);
        assert(settings.vocabulary.assumptionKeywords[0] == "suppose");
        assert(!settings.vocabulary.constraintKeywords.empty() && "Untouched lists keep defaults.");
        std::cout << "[PASS] Partial settings." << std::endl;
    }

    // Negative worker counts are clamped, not wrapped around
    {
        std::ofstream(settingsFile) << R"({"workers": -3})";
        auto settings = ConfigLoader::Load(settingsFile);
        assert(settings.workers == 1);

        std::ofstream(settingsFile) << R"({"workers": 6})";
        assert(ConfigLoader::Load(settingsFile).workers == 6);
    }

    // Malformed file -> defaults
    {
        std::ofstream(settingsFile) << "{ \"ollama_port\": ";
        auto settings = ConfigLoader::Load(settingsFile);
        assert(settings.ollamaPort == 11434);
    }

    // Save preserves unknown keys
    {
        std::ofstream(settingsFile) << R"({"ui_theme": "dark", "ollama_host": "old"})";
        VerifierSettings settings;
        settings.ollamaHost = "gpu-box";
        settings.workers = 8;
        assert(ConfigLoader::Save(settingsFile, settings));

        std::ifstream in(settingsFile);
        nlohmann::json j = nlohmann::json::parse(in);
        assert(j["ui_theme"] == "dark");
        assert(j["ollama_host"] == "gpu-box");

        auto reloaded = ConfigLoader::Load(settingsFile);
        assert(reloaded.ollamaHost == "gpu-box");
        assert(reloaded.workers == 8);
        assert(reloaded.vocabulary.domainKeywords == settings.vocabulary.domainKeywords);
        std::cout << "[PASS] Save and reload." << std::endl;
    }

    // XDG locations
    {
        setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
        setenv("XDG_CACHE_HOME", "/tmp/xdg-cache", 1);
        assert(ConfigLoader::DefaultSettingsPath() == "/tmp/xdg-config/SsdVerifier/settings.json");
        assert(ConfigLoader::DefaultEmbeddingCachePath() == "/tmp/xdg-cache/SsdVerifier/embeddings.json");
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
