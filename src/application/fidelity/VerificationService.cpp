/**
 * @file VerificationService.cpp
 * @brief Implementation of VerificationService.
 */

#include "application/fidelity/VerificationService.hpp"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace ssdverifier::application::fidelity {

using domain::fidelity::FidelityStatus;

VerificationService::VerificationService(std::shared_ptr<const FactExtractor> extractor,
                                         std::shared_ptr<const FidelityScorer> scorer)
    : m_extractor(std::move(extractor)), m_scorer(std::move(scorer)) {}

VerificationOutcome VerificationService::verifyDocument(const std::string& sourceText,
                                                        const domain::fidelity::CandidateDocument& candidate) const {
    VerificationOutcome outcome;
    outcome.inventory = m_extractor->extract(sourceText);

    try {
        auto verdict = m_scorer->score(*outcome.inventory, candidate, sourceText);
        outcome.status = domain::fidelity::DeriveStatus(verdict.overallFidelity);
        outcome.verdict = std::move(verdict);
    } catch (const domain::EmbeddingError& e) {
        outcome.status = FidelityStatus::ScoringFailed;
        outcome.error = std::string("Embedding provider failure: ") + e.what();
        outcome.retryRecommended = true;
        std::cerr << "[VerificationService] " << outcome.error << std::endl;
    } catch (const std::exception& e) {
        outcome.status = FidelityStatus::ScoringFailed;
        outcome.error = e.what();
        std::cerr << "[VerificationService] Scoring error: " << outcome.error << std::endl;
    }
    return outcome;
}

std::vector<VerificationOutcome> VerificationService::verifyBatch(
    const std::vector<VerificationRequest>& requests,
    size_t workers,
    std::function<void(std::string)> statusCallback) const {
    std::vector<VerificationOutcome> outcomes(requests.size());
    if (requests.empty()) return outcomes;

    std::atomic<size_t> next{0};
    std::mutex callbackMutex;
    auto report = [&](const std::string& message) {
        if (!statusCallback) return;
        std::lock_guard<std::mutex> lock(callbackMutex);
        statusCallback(message);
    };

    // Each unit owns its slot in `outcomes`, so input order survives any
    // completion order.
    auto worker = [&]() {
        for (size_t i = next++; i < requests.size(); i = next++) {
            const auto& request = requests[i];
            VerificationOutcome outcome;
            if (request.inputError) {
                outcome.status = FidelityStatus::InvalidInput;
                outcome.error = *request.inputError;
            } else {
                try {
                    outcome = verifyDocument(request.sourceDocument, request.candidate);
                } catch (const std::exception& e) {
                    outcome.status = FidelityStatus::ScoringFailed;
                    outcome.error = e.what();
                    std::cerr << "[VerificationService] Unit " << i << " failed: " << outcome.error << std::endl;
                }
            }
            outcome.index = i;

            std::ostringstream oss;
            oss << "Document " << (i + 1) << "/" << requests.size() << " ("
                << request.candidate.simulationName.value_or("Unknown") << "): "
                << domain::fidelity::StatusToString(outcome.status);
            if (outcome.verdict) {
                oss << ", overall fidelity " << std::fixed << std::setprecision(2) << outcome.verdict->overallFidelity;
            }
            report(oss.str());

            outcomes[i] = std::move(outcome);
        }
    };

    const size_t threadCount = std::max<size_t>(1, std::min(workers, requests.size()));
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (size_t t = 0; t < threadCount; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
    return outcomes;
}

} // namespace ssdverifier::application::fidelity
