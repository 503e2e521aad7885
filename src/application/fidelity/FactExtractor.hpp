/**
 * @file FactExtractor.hpp
 * @brief Rule-based extraction of equations, parameters, assumptions and constraints.
 */

#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

#include "domain/fidelity/ExtractionVocabulary.hpp"
#include "domain/fidelity/SourceFactInventory.hpp"

namespace ssdverifier::application::fidelity {

/**
 * @class FactExtractor
 * @brief Deterministic, explainable extraction of facts from unstructured text.
 *
 * No learned model is involved. The extractor never fails on input text: an
 * empty or unstructured text yields empty collections and a confidence close
 * to the 0.5 baseline.
 *
 * Regex searches run over bounded windows of the text and equation tails are
 * scanned by hand, so matching depth does not grow with line length. A single
 * regex match longer than half a window (1024 characters) is not reported.
 */
class FactExtractor {
public:
    /**
     * @brief Compiles the vocabulary patterns once.
     * @param vocabulary Patterns and keyword lists.
     * @throws std::invalid_argument if any pattern does not compile.
     */
    explicit FactExtractor(domain::fidelity::ExtractionVocabulary vocabulary =
                               domain::fidelity::ExtractionVocabulary::Defaults());

    /**
     * @brief Builds the fact inventory of a source text.
     * @param sourceText UTF-8 text of arbitrary length (may be empty).
     * @return Inventory derived only from @p sourceText.
     */
    domain::fidelity::SourceFactInventory extract(const std::string& sourceText) const;

    const domain::fidelity::ExtractionVocabulary& vocabulary() const { return m_vocabulary; }

private:
    /** @brief How the text after an equation head is consumed. */
    enum class EquationTail {
        None,        ///< The regex matches the whole equation.
        RestOfLine,  ///< `\s*(.+)`: rest of the line after the head.
        UntilEquals  ///< `\s*([^=]+)`: everything up to the next '='.
    };

    struct EquationRule {
        std::regex head;
        EquationTail tail = EquationTail::None;
    };

    std::set<std::string> extractEquations(const std::string& text) const;
    std::set<std::string> extractParameters(const std::string& text) const;
    void extractStatements(const std::string& text, domain::fidelity::SourceFactInventory& inventory) const;
    std::vector<std::string> extractDomainKeywords(const std::string& loweredText) const;
    double estimateConfidence(const std::string& loweredText,
                              const domain::fidelity::SourceFactInventory& inventory) const;

    domain::fidelity::ExtractionVocabulary m_vocabulary;
    std::vector<EquationRule> m_equationRules;
    std::regex m_expressionRegex;
    std::regex m_parameterRegex;
};

} // namespace ssdverifier::application::fidelity
