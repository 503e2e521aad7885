/**
 * @file FidelityScorer.hpp
 * @brief Compares a candidate SSD against the fact inventory of its source.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "domain/EmbeddingService.hpp"
#include "domain/fidelity/CandidateDocument.hpp"
#include "domain/fidelity/SourceFactInventory.hpp"
#include "domain/fidelity/VerificationVerdict.hpp"

namespace ssdverifier::application::fidelity {

/**
 * @class FidelityScorer
 * @brief Scores equations, parameters, assumptions and constraints, then aggregates.
 *
 * Matching is greedy per item: every element takes its best cosine similarity
 * over the other side, independently per side. One source equation may cover
 * several candidate paraphrases and vice versa; this is not a one-to-one
 * assignment and must stay that way, since scores on near-duplicate
 * equations depend on it.
 */
class FidelityScorer {
public:
    static constexpr double EquationMatchThreshold = 0.7;
    static constexpr double AssumptionMatchThreshold = 0.6;
    static constexpr double ConstraintMatchThreshold = 0.6;

    static constexpr double EquationFallbackScore = 0.5;
    static constexpr double ParameterOnlyInCandidateScore = 0.8;
    static constexpr double ExtraParameterPenalty = 0.8;
    static constexpr double AssumptionEmptyCandidateScore = 0.0;
    static constexpr double ConstraintEmptyCandidateScore = 0.5;

    /**
     * @param embeddings Provider used for the semantic categories.
     * @param timeout Bound applied to the single embedding call of each verification.
     */
    FidelityScorer(std::shared_ptr<domain::EmbeddingService> embeddings,
                   std::chrono::milliseconds timeout);

    /**
     * @brief Scores a candidate document against a source inventory.
     * @param inventory Facts extracted from @p sourceText.
     * @param candidate Normalized candidate document.
     * @param sourceText Raw source, used to trace candidate parameters mentioned inline.
     * @return The verdict.
     * @throws domain::EmbeddingError if the provider fails; no partial verdict is produced.
     */
    domain::fidelity::VerificationVerdict score(const domain::fidelity::SourceFactInventory& inventory,
                                                const domain::fidelity::CandidateDocument& candidate,
                                                const std::string& sourceText) const;

    /** @brief Cosine similarity; 0 for empty, zero-norm or mismatched vectors. */
    static double cosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2);

private:
    struct CategoryResult {
        double score = 0.0;
        std::vector<std::string> missing;
        std::vector<std::string> extra;
    };

    struct StatementPolicy {
        const char* label;
        double threshold;
        double emptyCandidateScore;
    };

    using EmbeddingTable = std::unordered_map<std::string, domain::EmbeddingService::Embedding>;

    EmbeddingTable embedAll(const std::vector<std::string>& sourceEquations,
                            const domain::fidelity::SourceFactInventory& inventory,
                            const domain::fidelity::CandidateDocument& candidate) const;

    CategoryResult scoreEquations(const std::vector<std::string>& source,
                                  const std::vector<std::string>& candidate,
                                  const EmbeddingTable& table) const;

    CategoryResult scoreParameters(const std::vector<std::string>& source,
                                   const std::vector<std::string>& candidate,
                                   const std::string& sourceText) const;

    CategoryResult scoreStatements(const std::vector<std::string>& source,
                                   const std::vector<std::string>& candidate,
                                   const EmbeddingTable& table,
                                   const StatementPolicy& policy) const;

    double bestSimilarity(const std::string& text,
                          const std::vector<std::string>& others,
                          const EmbeddingTable& table) const;

    std::shared_ptr<domain::EmbeddingService> m_embeddings;
    std::chrono::milliseconds m_timeout;
};

} // namespace ssdverifier::application::fidelity
