#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "application/fidelity/VerificationService.hpp"
#include "TestEmbeddingService.hpp"

using namespace ssdverifier::application::fidelity;
using namespace ssdverifier::domain::fidelity;

namespace {

VerificationRequest MakeRequest(int i) {
    VerificationRequest request;
    request.sourceDocument = "Assume no drag. y" + std::to_string(i) + " = a*t";
    request.candidate.simulationName = "sim-" + std::to_string(i);
    request.candidate.equations = {"y" + std::to_string(i) + " = a*t"};
    request.candidate.assumptions = {"No drag"};
    return request;
}

} // namespace

int main() {
    std::cout << "[Test] Starting VerificationService Test..." << std::endl;

    auto embeddings = std::make_shared<TestEmbeddingService>();
    auto extractor = std::make_shared<const FactExtractor>();
    auto scorer = std::make_shared<const FidelityScorer>(embeddings, std::chrono::milliseconds(1000));
    VerificationService service(extractor, scorer);

    // Single document
    {
        auto outcome = service.verifyDocument("Assume no drag. y = a*t", MakeRequest(0).candidate);
        assert(outcome.succeeded());
        assert(outcome.inventory.has_value());
        assert(outcome.status == DeriveStatus(outcome.verdict->overallFidelity));
        assert(!outcome.retryRecommended);
    }

    // Batch: input order preserved, one provider call per verification,
    // failures isolated to their own unit.
    {
        const int N = 24;
        std::vector<VerificationRequest> requests;
        for (int i = 0; i < N; ++i) requests.push_back(MakeRequest(i));
        requests[5].candidate.equations = {"FAILME = 1"};
        requests[9].inputError = "Invalid JSON: unexpected end of input";

        auto batchEmbeddings = std::make_shared<TestEmbeddingService>();
        batchEmbeddings->failOn("FAILME");
        auto batchScorer = std::make_shared<const FidelityScorer>(batchEmbeddings, std::chrono::milliseconds(1000));
        VerificationService batchService(extractor, batchScorer);

        std::mutex messagesMutex;
        std::vector<std::string> messages;
        auto outcomes = batchService.verifyBatch(requests, 4, [&](std::string msg) {
            std::lock_guard<std::mutex> lock(messagesMutex);
            messages.push_back(std::move(msg));
        });

        assert(outcomes.size() == static_cast<size_t>(N));
        assert(messages.size() == static_cast<size_t>(N) && "One status line per document.");
        for (int i = 0; i < N; ++i) {
            assert(outcomes[i].index == static_cast<size_t>(i) && "Outcomes keep input order.");
        }

        assert(outcomes[5].status == FidelityStatus::ScoringFailed);
        assert(!outcomes[5].succeeded());
        assert(outcomes[5].retryRecommended);
        assert(!outcomes[5].error.empty());
        assert(outcomes[5].inventory.has_value() && "Extraction still reported for a failed unit.");

        assert(outcomes[9].status == FidelityStatus::InvalidInput);
        assert(!outcomes[9].retryRecommended);
        assert(!outcomes[9].inventory.has_value());

        for (int i = 0; i < N; ++i) {
            if (i == 5 || i == 9) continue;
            assert(outcomes[i].succeeded());
            assert(outcomes[i].verdict->equationAccuracy >= 0.9);
        }
        // Invalid input never reaches the provider; everything else costs one call.
        assert(batchEmbeddings->calls() == N - 1);
        std::cout << "[PASS] Batch order, isolation and one call per verification." << std::endl;
    }

    // A very long single-line document is verified like any other.
    {
        std::vector<VerificationRequest> requests = {MakeRequest(1), MakeRequest(2)};
        requests[0].sourceDocument = "Assume no drag. y1 = ";
        while (requests[0].sourceDocument.size() < 150000) {
            requests[0].sourceDocument += "a slowly varying offset added to the drop height ";
        }
        auto outcomes = service.verifyBatch(requests, 2);
        assert(outcomes.size() == 2);
        assert(outcomes[0].succeeded());
        assert(outcomes[0].inventory->equations.size() == 1);
        assert(outcomes[1].succeeded());
        std::cout << "[PASS] Long single-line document." << std::endl;
    }

    // Degenerate worker counts
    {
        std::vector<VerificationRequest> requests = {MakeRequest(1), MakeRequest(2)};
        auto outcomes = service.verifyBatch(requests, 0);
        assert(outcomes.size() == 2 && outcomes[0].succeeded() && outcomes[1].succeeded());
        assert(service.verifyBatch({}, 8).empty());
    }

    std::cout << "[PASS] VerificationService Test." << std::endl;
    return 0;
}
