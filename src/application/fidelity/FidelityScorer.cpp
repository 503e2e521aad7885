/**
 * @file FidelityScorer.cpp
 * @brief Implementation of FidelityScorer.
 */

#include "application/fidelity/FidelityScorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>
#include <utility>

namespace ssdverifier::application::fidelity {

namespace {

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::vector<std::string> NormalizeAll(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    out.reserve(values.size());
    for (const auto& value : values) out.push_back(Normalize(value));
    return out;
}

bool Contains(const std::vector<std::string>& values, const std::string& needle) {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

void Append(std::vector<std::string>& target, const std::vector<std::string>& items) {
    target.insert(target.end(), items.begin(), items.end());
}

} // namespace

FidelityScorer::FidelityScorer(std::shared_ptr<domain::EmbeddingService> embeddings,
                               std::chrono::milliseconds timeout)
    : m_embeddings(std::move(embeddings)), m_timeout(timeout) {}

domain::fidelity::VerificationVerdict FidelityScorer::score(
    const domain::fidelity::SourceFactInventory& inventory,
    const domain::fidelity::CandidateDocument& candidate,
    const std::string& sourceText) const {
    const std::vector<std::string> sourceEquations(inventory.equations.begin(), inventory.equations.end());
    const std::vector<std::string> sourceParameters(inventory.parameters.begin(), inventory.parameters.end());

    const EmbeddingTable table = embedAll(sourceEquations, inventory, candidate);

    static const StatementPolicy kAssumptions{"Assumption", AssumptionMatchThreshold, AssumptionEmptyCandidateScore};
    static const StatementPolicy kConstraints{"Constraint", ConstraintMatchThreshold, ConstraintEmptyCandidateScore};

    const CategoryResult equations = scoreEquations(sourceEquations, candidate.equations, table);
    const CategoryResult parameters = scoreParameters(sourceParameters, candidate.parameters, sourceText);
    const CategoryResult assumptions = scoreStatements(inventory.assumptions, candidate.assumptions, table, kAssumptions);
    const CategoryResult constraints = scoreStatements(inventory.constraints, candidate.constraints, table, kConstraints);

    domain::fidelity::VerificationVerdict verdict;
    verdict.equationAccuracy = equations.score;
    verdict.parameterCompleteness = parameters.score;
    verdict.assumptionCompleteness = assumptions.score;
    verdict.constraintAccuracy = constraints.score;
    verdict.overallFidelity = domain::fidelity::VerificationVerdict::WeightedFidelity(
        equations.score, parameters.score, assumptions.score, constraints.score);

    Append(verdict.missingElements, equations.missing);
    Append(verdict.missingElements, parameters.missing);
    Append(verdict.missingElements, assumptions.missing);
    Append(verdict.missingElements, constraints.missing);

    // Assumptions and constraints are never flagged as extra: a candidate may
    // phrase them more fully than the source does.
    Append(verdict.extraElements, equations.extra);
    Append(verdict.extraElements, parameters.extra);
    return verdict;
}

FidelityScorer::EmbeddingTable FidelityScorer::embedAll(
    const std::vector<std::string>& sourceEquations,
    const domain::fidelity::SourceFactInventory& inventory,
    const domain::fidelity::CandidateDocument& candidate) const {
    std::vector<std::string> texts;
    std::unordered_set<std::string> seen;
    auto collect = [&](const std::vector<std::string>& source, const std::vector<std::string>& other) {
        // Only categories that reach the similarity comparison need vectors.
        if (source.empty() || other.empty()) return;
        for (const auto* side : {&source, &other}) {
            for (const auto& text : *side) {
                if (seen.insert(text).second) texts.push_back(text);
            }
        }
    };
    collect(sourceEquations, candidate.equations);
    collect(inventory.assumptions, candidate.assumptions);
    collect(inventory.constraints, candidate.constraints);

    EmbeddingTable table;
    if (texts.empty()) return table;

    if (!m_embeddings) {
        throw domain::EmbeddingError("No embedding service configured.");
    }
    auto vectors = m_embeddings->embedBatch(texts, m_timeout);
    if (vectors.size() != texts.size()) {
        throw domain::EmbeddingError("Embedding provider returned " + std::to_string(vectors.size()) +
                                     " vectors for " + std::to_string(texts.size()) + " texts.");
    }
    for (size_t i = 0; i < texts.size(); ++i) {
        table.emplace(texts[i], std::move(vectors[i]));
    }
    return table;
}

FidelityScorer::CategoryResult FidelityScorer::scoreEquations(const std::vector<std::string>& source,
                                                              const std::vector<std::string>& candidate,
                                                              const EmbeddingTable& table) const {
    CategoryResult result;
    if (source.empty() && candidate.empty()) {
        result.score = 1.0;
        return result;
    }
    if (source.empty()) {
        // Nothing in the source supports any of the candidate equations.
        result.score = EquationFallbackScore;
        for (const auto& eq : candidate) result.extra.push_back("Equation: " + eq);
        return result;
    }
    if (candidate.empty()) {
        result.score = EquationFallbackScore;
        return result;
    }

    size_t matchedSource = 0;
    for (const auto& eq : source) {
        if (bestSimilarity(eq, candidate, table) > EquationMatchThreshold) {
            ++matchedSource;
        } else {
            result.missing.push_back("Equation: " + eq);
        }
    }

    size_t matchedCandidate = 0;
    for (const auto& eq : candidate) {
        if (bestSimilarity(eq, source, table) > EquationMatchThreshold) {
            ++matchedCandidate;
        } else {
            result.extra.push_back("Equation: " + eq);
        }
    }

    const double precision = static_cast<double>(matchedCandidate) / static_cast<double>(candidate.size());
    const double recall = static_cast<double>(matchedSource) / static_cast<double>(source.size());
    result.score = (precision + recall) / 2.0;
    return result;
}

FidelityScorer::CategoryResult FidelityScorer::scoreParameters(const std::vector<std::string>& source,
                                                               const std::vector<std::string>& candidate,
                                                               const std::string& sourceText) const {
    CategoryResult result;
    const std::vector<std::string> sourceLower = NormalizeAll(source);
    const std::vector<std::string> candidateLower = NormalizeAll(candidate);
    const std::string textLower = Normalize(sourceText);

    for (size_t i = 0; i < source.size(); ++i) {
        const std::string& param = sourceLower[i];
        if (Contains(candidateLower, param)) continue;
        const bool partOfLongerName = std::any_of(candidateLower.begin(), candidateLower.end(),
            [&param](const std::string& c) { return c.find(param) != std::string::npos; });
        if (!partOfLongerName) {
            result.missing.push_back("Parameter: " + source[i]);
        }
    }

    // Looser than for equations: parameter names often appear inline without
    // satisfying the extraction heuristics.
    for (size_t i = 0; i < candidate.size(); ++i) {
        const std::string& param = candidateLower[i];
        if (Contains(sourceLower, param)) continue;
        if (textLower.find(param) == std::string::npos) {
            result.extra.push_back("Parameter: " + candidate[i]);
        }
    }

    if (source.empty()) {
        result.score = candidate.empty() ? 1.0 : ParameterOnlyInCandidateScore;
    } else {
        const auto matched = std::count_if(sourceLower.begin(), sourceLower.end(),
            [&candidateLower](const std::string& p) { return Contains(candidateLower, p); });
        result.score = static_cast<double>(matched) / static_cast<double>(source.size());
    }

    if (!result.extra.empty()) {
        result.score *= ExtraParameterPenalty;
    }
    return result;
}

FidelityScorer::CategoryResult FidelityScorer::scoreStatements(const std::vector<std::string>& source,
                                                               const std::vector<std::string>& candidate,
                                                               const EmbeddingTable& table,
                                                               const StatementPolicy& policy) const {
    CategoryResult result;
    if (source.empty()) {
        result.score = 1.0;
        return result;
    }
    if (candidate.empty()) {
        result.score = policy.emptyCandidateScore;
        for (const auto& s : source) result.missing.push_back(std::string(policy.label) + ": " + s);
        return result;
    }

    size_t matched = 0;
    for (const auto& s : source) {
        if (bestSimilarity(s, candidate, table) > policy.threshold) {
            ++matched;
        } else {
            result.missing.push_back(std::string(policy.label) + ": " + s);
        }
    }
    result.score = static_cast<double>(matched) / static_cast<double>(source.size());
    return result;
}

double FidelityScorer::bestSimilarity(const std::string& text,
                                      const std::vector<std::string>& others,
                                      const EmbeddingTable& table) const {
    const auto self = table.find(text);
    if (self == table.end()) return 0.0;
    double best = 0.0;
    for (const auto& other : others) {
        const auto it = table.find(other);
        if (it == table.end()) continue;
        best = std::max(best, cosineSimilarity(self->second, it->second));
    }
    return best;
}

double FidelityScorer::cosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += static_cast<double>(v1[i]) * v2[i];
        n1 += static_cast<double>(v1[i]) * v1[i];
        n2 += static_cast<double>(v2[i]) * v2[i];
    }
    const double norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0;
}

} // namespace ssdverifier::application::fidelity
