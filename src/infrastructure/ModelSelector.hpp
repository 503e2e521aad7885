/**
 * @file ModelSelector.hpp
 * @brief Utility for selecting the embedding model from available options.
 */

#pragma once
#include <string>
#include <vector>

namespace ssdverifier::infrastructure {

/**
 * @class ModelSelector
 * @brief Separates model selection policy from adapter I/O.
 */
class ModelSelector {
public:
    /** @brief Keeps the configured model when installed, otherwise the first match of the priority list. */
    static std::string SelectEmbeddingModel(const std::vector<std::string>& availableModels,
                                            const std::string& configured = "nomic-embed-text") {
        if (availableModels.empty()) {
            return configured;
        }

        // Ollama reports "name:tag"; "nomic-embed-text" is installed as "nomic-embed-text:latest".
        for (const auto& model : availableModels) {
            if (model == configured || model == configured + ":latest") {
                return model;
            }
        }

        const std::vector<std::string> priorities = {
            "nomic-embed-text",
            "mxbai-embed-large",
            "all-minilm",
            "snowflake-arctic-embed",
            "bge-m3"
        };

        for (const auto& priority : priorities) {
            for (const auto& model : availableModels) {
                if (model.find(priority) != std::string::npos) {
                    return model;
                }
            }
        }

        // Chat models are not valid embedding providers; leave the configured name
        // and let the first request report the problem.
        return configured;
    }
};

} // namespace ssdverifier::infrastructure
