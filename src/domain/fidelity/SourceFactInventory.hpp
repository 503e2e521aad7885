/**
 * @file SourceFactInventory.hpp
 * @brief Facts extracted from an unstructured source document.
 */

#pragma once
#include <set>
#include <string>
#include <vector>

namespace ssdverifier::domain::fidelity {

/**
 * @struct SourceFactInventory
 * @brief Normalized inventory of candidate facts found in a source text.
 *
 * Derived purely from the source text. Assumptions and constraints are
 * disjoint: a sentence classified as an assumption never appears in constraints.
 */
struct SourceFactInventory {
    std::set<std::string> equations;            ///< Deduplicated equation-like strings.
    std::set<std::string> parameters;           ///< Bare identifiers naming parameters.
    std::vector<std::string> assumptions;       ///< Assumption sentences, in source order.
    std::vector<std::string> constraints;       ///< Constraint sentences, in source order.
    std::vector<std::string> domainKeywords;    ///< Vocabulary hits, in vocabulary order.
    double confidence = 0.5;                    ///< Heuristic extraction quality in [0, 1].
};

} // namespace ssdverifier::domain::fidelity
