/**
 * @file VerificationService.hpp
 * @brief Runs extraction and scoring for single documents and batches.
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/fidelity/FactExtractor.hpp"
#include "application/fidelity/FidelityScorer.hpp"
#include "domain/fidelity/CandidateDocument.hpp"
#include "domain/fidelity/SourceFactInventory.hpp"
#include "domain/fidelity/VerificationVerdict.hpp"

namespace ssdverifier::application::fidelity {

/**
 * @struct VerificationRequest
 * @brief One (source, candidate) pair of a batch.
 */
struct VerificationRequest {
    std::string sourceDocument;
    domain::fidelity::CandidateDocument candidate;
    nlohmann::json rawCandidate = nlohmann::json::object(); ///< Echoed back in the outcome record.
    std::optional<std::string> inputError;                   ///< Set when the input line could not be read.
};

/**
 * @struct VerificationOutcome
 * @brief Result of one verification unit, successful or not.
 */
struct VerificationOutcome {
    size_t index = 0;
    domain::fidelity::FidelityStatus status = domain::fidelity::FidelityStatus::NeedsReview;
    std::optional<domain::fidelity::SourceFactInventory> inventory;
    std::optional<domain::fidelity::VerificationVerdict> verdict;
    std::string error;
    bool retryRecommended = false;

    bool succeeded() const { return verdict.has_value(); }
};

/**
 * @class VerificationService
 * @brief Composes FactExtractor and FidelityScorer and isolates per-unit failures.
 */
class VerificationService {
public:
    VerificationService(std::shared_ptr<const FactExtractor> extractor,
                        std::shared_ptr<const FidelityScorer> scorer);

    /**
     * @brief Verifies one candidate document against its source text.
     *
     * Embedding failures do not propagate: the outcome carries
     * FidelityStatus::ScoringFailed and is flagged for retry.
     */
    VerificationOutcome verifyDocument(const std::string& sourceText,
                                       const domain::fidelity::CandidateDocument& candidate) const;

    /**
     * @brief Verifies independent units in parallel.
     * @param requests Units, in input order.
     * @param workers Maximum number of concurrent units (at least one is used).
     * @param statusCallback Optional progress feedback, invoked from worker threads.
     * @return Exactly one outcome per request, in input order.
     */
    std::vector<VerificationOutcome> verifyBatch(const std::vector<VerificationRequest>& requests,
                                                 size_t workers,
                                                 std::function<void(std::string)> statusCallback = nullptr) const;

private:
    std::shared_ptr<const FactExtractor> m_extractor;
    std::shared_ptr<const FidelityScorer> m_scorer;
};

} // namespace ssdverifier::application::fidelity
