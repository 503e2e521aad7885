/**
 * @file ExtractionVocabulary.hpp
 * @brief Pattern and keyword lists consumed by the fact extractor.
 */

#pragma once

#include <string>
#include <vector>

namespace ssdverifier::domain::fidelity {

/**
 * @struct ExtractionVocabulary
 * @brief Immutable configuration data for rule-based fact extraction.
 *
 * Every list is plain data so that domains and languages can be extended from
 * configuration without touching the matching logic. Keywords are matched
 * against lowercased text and must therefore be lowercase themselves, except
 * domain keywords, which are lowered at match time.
 */
struct ExtractionVocabulary {
    /**
     * @brief Equation patterns, applied in order. Capture groups are joined with a space.
     *
     * A pattern ending in `\s*(.+)` or `\s*([^=]+)` has that tail matched by a
     * linear scan (rest of line, or up to the next '='); only the head is a regex.
     */
    std::vector<std::string> equationPatterns;

    /** @brief Inline arithmetic expression pattern (no equals sign required). */
    std::string expressionPattern;

    /** @brief Parameter pattern. The first non-empty capture group names the parameter. */
    std::string parameterPattern;

    std::vector<std::string> assumptionKeywords;
    std::vector<std::string> constraintKeywords;

    /** @brief Markers that indicate the text was written with explicit structure. */
    std::vector<std::string> structuralMarkers;

    /** @brief Controlled vocabulary spanning physics, electrical, biology and mechanical domains. */
    std::vector<std::string> domainKeywords;

    static ExtractionVocabulary Defaults() {
        ExtractionVocabulary v;
        v.equationPatterns = {
            R"(([a-zA-Z_]\w*)\(([^)]*)\)\s*=\s*(.+))",   // f(x) = ...
            R"(([a-zA-Z_]\w*)\s*=\s*([^=]+))",            // x = ...
            R"(d([a-zA-Z])/d([a-zA-Z])\s*=\s*(.+))",      // dx/dt = ...
            "\xE2\x88\x82([a-zA-Z])/\xE2\x88\x82([a-zA-Z])\\s*=\\s*(.+)" // ∂x/∂t = ...
        };
        v.expressionPattern = R"([a-zA-Z_]\w*\s*[\+\-\*/\^]\s*[a-zA-Z_0-9()\.]+)";
        v.parameterPattern =
            R"(\b([a-zA-Z_][a-zA-Z_0-9]*)\s*[=:]?\s*\d+|\b([a-zA-Z_][a-zA-Z_0-9]*)\s+\([\w\s/\^]+\))";

        v.assumptionKeywords = {
            "assume", "assuming", "assumption", "ignore", "negligible",
            "ideal", "constant", "uniform", "steady", "homogeneous",
            "consider", "treat as", "approximate", "neglect"
        };
        v.constraintKeywords = {
            "must", "should", "assume", "given", "where", "such that",
            "constraint", "condition", "requirement", "limit", "range",
            "greater than", "less than", "between", "when", "if"
        };
        v.structuralMarkers = {"equation", "formula", "where", "given"};

        v.domainKeywords = {
            // physics
            "velocity", "acceleration", "force", "mass", "energy", "momentum",
            "friction", "gravity", "projectile", "pendulum", "wave", "motion",
            // electrical
            "voltage", "current", "resistance", "capacitor", "inductor",
            "circuit", "RC", "RL", "power", "frequency", "impedance",
            // biology
            "population", "growth", "species", "carrying capacity", "epidemic",
            "infection", "susceptible", "recovery", "SIR", "logistic",
            // mechanical / thermal
            "stress", "strain", "heat", "temperature", "thermal", "conduction",
            "pressure", "fluid", "flow", "deformation"
        };
        return v;
    }
};

} // namespace ssdverifier::domain::fidelity
