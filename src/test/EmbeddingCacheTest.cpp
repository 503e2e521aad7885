#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "infrastructure/CachedEmbeddingService.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/ModelSelector.hpp"
#include "TestEmbeddingService.hpp"

using namespace ssdverifier::infrastructure;

int main() {
    std::cout << "[Test] Starting EmbeddingCache Test..." << std::endl;

    std::string testRoot = "test_embedding_cache";
    std::filesystem::create_directories(testRoot);
    const std::string cacheFile = testRoot + "/embeddings.json";

    // Persist and reload
    {
        EmbeddingCache cache(cacheFile, "test-bow");
        assert(!cache.get("missing").has_value());
        cache.update("alpha", {1.0f, 0.5f});
        cache.update("beta", {0.0f, 2.0f});
        assert(cache.size() == 2);
        assert(cache.persist() && "Cache file should be written.");

        EmbeddingCache reloaded(cacheFile, "test-bow");
        reloaded.load();
        assert(reloaded.size() == 2);
        auto alpha = reloaded.get("alpha");
        assert(alpha && alpha->size() == 2 && (*alpha)[1] == 0.5f);

        // Vectors from another model are never reused.
        EmbeddingCache otherModel(cacheFile, "other-model");
        otherModel.load();
        assert(otherModel.size() == 0);
        std::cout << "[PASS] Cache round-trip and model isolation." << std::endl;
    }

    // Unreadable cache file is ignored
    {
        std::ofstream(testRoot + "/broken.json") << "{ not json";
        EmbeddingCache broken(testRoot + "/broken.json", "test-bow");
        broken.load();
        assert(broken.size() == 0);
    }

    // Decorator forwards only misses, in one batch, preserving order.
    {
        auto inner = std::make_shared<TestEmbeddingService>();
        auto cache = std::make_shared<EmbeddingCache>("", "test-bow");
        cache->update("cached text", {9.0f});
        CachedEmbeddingService service(inner, cache);

        auto vectors = service.embedBatch({"fresh one", "cached text", "fresh two"}, std::chrono::milliseconds(100));
        assert(vectors.size() == 3);
        assert(vectors[1].size() == 1 && vectors[1][0] == 9.0f);
        assert(vectors[0] == TestEmbeddingService::Embed("fresh one"));
        assert(vectors[2] == TestEmbeddingService::Embed("fresh two"));
        assert(inner->calls() == 1);
        assert(inner->textsSeen() == 2);
        assert(cache->size() == 3);

        service.embedBatch({"fresh one", "fresh two"}, std::chrono::milliseconds(100));
        assert(inner->calls() == 1 && "Fully cached batch makes no provider call.");
        assert(service.getEmbedding("fresh one", std::chrono::milliseconds(100)) == TestEmbeddingService::Embed("fresh one"));
        assert(inner->calls() == 1);
        assert(service.getModelName() == "test-bow");
        std::cout << "[PASS] CachedEmbeddingService forwards only misses." << std::endl;
    }

    // Model selection
    {
        assert(ModelSelector::SelectEmbeddingModel({}, "nomic-embed-text") == "nomic-embed-text");
        assert(ModelSelector::SelectEmbeddingModel({"llama3:8b", "nomic-embed-text:latest"}) == "nomic-embed-text:latest");
        assert(ModelSelector::SelectEmbeddingModel({"llama3:8b", "bge-m3:567m"}) == "bge-m3:567m");
        assert(ModelSelector::SelectEmbeddingModel({"llama3:8b"}, "custom-embed") == "custom-embed");
        std::cout << "[PASS] Embedding model selection." << std::endl;
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] EmbeddingCache Test." << std::endl;
    return 0;
}
