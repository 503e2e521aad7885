#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "application/fidelity/FactExtractor.hpp"
#include "application/fidelity/FidelityScorer.hpp"
#include "application/fidelity/VerificationRecords.hpp"
#include "application/fidelity/VerificationService.hpp"
#include "infrastructure/CachedEmbeddingService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/EmbeddingCache.hpp"
#include "infrastructure/OllamaEmbeddingAdapter.hpp"

namespace fs = std::filesystem;
using namespace ssdverifier;

namespace {

struct CliOptions {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    std::string embeddingModel;
    size_t workers = 0; ///< 0 = use settings.
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " --input <in.jsonl> --output <out.jsonl>"
              << " [--config <settings.json>] [--embedding-model <name>] [--workers N]" << std::endl;
}

bool ParseArgs(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            return false;
        }
        if (i + 1 >= argc) {
            std::cerr << "[CLI] Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];
        if (arg == "--input") {
            options.inputPath = value;
        } else if (arg == "--output") {
            options.outputPath = value;
        } else if (arg == "--config") {
            options.configPath = value;
        } else if (arg == "--embedding-model") {
            options.embeddingModel = value;
        } else if (arg == "--workers") {
            try {
                long n = std::stol(value);
                if (n <= 0) throw std::out_of_range("workers");
                options.workers = static_cast<size_t>(n);
            } catch (const std::exception&) {
                std::cerr << "[CLI] --workers expects a positive integer, got '" << value << "'" << std::endl;
                return false;
            }
        } else {
            std::cerr << "[CLI] Unknown option " << arg << std::endl;
            return false;
        }
    }
    if (options.inputPath.empty() || options.outputPath.empty()) {
        std::cerr << "[CLI] --input and --output are required." << std::endl;
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!ParseArgs(argc, argv, options)) {
        PrintUsage(argv[0]);
        return 1;
    }

    const std::string configPath = options.configPath.empty()
        ? infrastructure::ConfigLoader::DefaultSettingsPath()
        : options.configPath;
    infrastructure::VerifierSettings settings = infrastructure::ConfigLoader::Load(configPath);
    if (!options.embeddingModel.empty()) settings.embeddingModel = options.embeddingModel;
    if (options.workers > 0) settings.workers = options.workers;

    std::shared_ptr<const application::fidelity::FactExtractor> extractor;
    try {
        extractor = std::make_shared<const application::fidelity::FactExtractor>(settings.vocabulary);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CLI] Invalid extraction vocabulary in " << configPath << ": " << e.what() << std::endl;
        return 1;
    }

    std::vector<application::fidelity::VerificationRequest> requests;
    std::string error;
    if (!application::fidelity::VerificationRecords::ReadRequests(options.inputPath, requests, error)) {
        std::cerr << "[CLI] " << error << std::endl;
        return 1;
    }
    std::cout << "[CLI] Loaded " << requests.size() << " document(s) from " << options.inputPath << std::endl;

    auto ollama = std::make_shared<infrastructure::OllamaEmbeddingAdapter>(
        settings.ollamaHost, settings.ollamaPort, settings.embeddingModel);
    ollama->initialize();
    std::cout << "[CLI] Embedding model: " << ollama->getModelName() << std::endl;

    std::shared_ptr<domain::EmbeddingService> embeddings = ollama;
    std::shared_ptr<infrastructure::EmbeddingCache> cache;
    if (settings.embeddingCache) {
        const std::string cachePath = infrastructure::ConfigLoader::DefaultEmbeddingCachePath();
        std::error_code ec;
        fs::create_directories(fs::path(cachePath).parent_path(), ec);
        if (ec) {
            std::cerr << "[CLI] Embedding cache disabled: " << ec.message() << std::endl;
        } else {
            cache = std::make_shared<infrastructure::EmbeddingCache>(cachePath, ollama->getModelName());
            cache->load();
            embeddings = std::make_shared<infrastructure::CachedEmbeddingService>(ollama, cache);
        }
    }

    auto scorer = std::make_shared<const application::fidelity::FidelityScorer>(
        embeddings, std::chrono::milliseconds(settings.embeddingTimeoutMs));
    application::fidelity::VerificationService service(extractor, scorer);

    auto outcomes = service.verifyBatch(requests, settings.workers, [](std::string status) {
        std::cout << "[Verifier] " << status << std::endl;
    });

    if (cache && !cache->persist()) {
        std::cerr << "[CLI] Could not persist embedding cache." << std::endl;
    }

    if (!application::fidelity::VerificationRecords::WriteOutcomes(options.outputPath, requests, outcomes, error)) {
        std::cerr << "[CLI] " << error << std::endl;
        return 1;
    }

    size_t succeeded = 0;
    size_t retryable = 0;
    double fidelitySum = 0.0;
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            ++succeeded;
            fidelitySum += outcome.verdict->overallFidelity;
        } else if (outcome.retryRecommended) {
            ++retryable;
        }
    }

    std::cout << "[CLI] Verified " << succeeded << "/" << outcomes.size() << " document(s)";
    if (succeeded > 0) {
        std::cout << ", mean overall fidelity " << std::fixed << std::setprecision(2)
                  << (fidelitySum / static_cast<double>(succeeded));
    }
    std::cout << std::endl;
    if (retryable > 0) {
        std::cout << "[CLI] " << retryable << " document(s) failed scoring and can be retried." << std::endl;
    }
    std::cout << "[CLI] Results written to " << options.outputPath << std::endl;
    return 0;
}
