/**
 * @file FactExtractor.cpp
 * @brief Implementation of FactExtractor.
 */

#include "application/fidelity/FactExtractor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace ssdverifier::application::fidelity {

namespace {

constexpr double kBaselineConfidence = 0.5;
constexpr double kEquationBoost = 0.2;
constexpr double kParameterBoost = 0.15;
constexpr double kStructureBoost = 0.15;

std::string Normalize(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string Trim(const std::string& input) {
    size_t a = 0;
    size_t b = input.size();
    while (a < b && std::isspace(static_cast<unsigned char>(input[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(input[b - 1]))) --b;
    return input.substr(a, b - a);
}

bool ContainsAny(const std::string& loweredHaystack, const std::vector<std::string>& needles) {
    for (const auto& needle : needles) {
        if (loweredHaystack.find(needle) != std::string::npos) return true;
    }
    return false;
}

std::regex Compile(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid extraction pattern '" + pattern + "': " + e.what());
    }
}

constexpr size_t kScanWindow = 2048;

constexpr const char* kRestOfLineTail = R"(\s*(.+))";
constexpr const char* kUntilEqualsTail = R"(\s*([^=]+))";

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool IsLineTerminator(char c) {
    return c == '\n' || c == '\r';
}

// Leftmost match of `re` at or after `from`. Each attempt sees at most
// kScanWindow characters; only matches starting in the first half of a window
// are accepted, so any match of up to half a window is found exactly where an
// unbounded search would find it.
bool SearchBounded(const std::string& text, size_t from, const std::regex& re, std::smatch& match) {
    size_t pos = from;
    while (pos < text.size()) {
        const size_t end = std::min(text.size(), pos + kScanWindow);
        const size_t half = (end == text.size()) ? end : pos + kScanWindow / 2;
        auto flags = std::regex_constants::match_default;
        if (pos > 0) flags |= std::regex_constants::match_prev_avail;

        std::smatch m;
        if (std::regex_search(text.cbegin() + pos, text.cbegin() + end, m, re, flags)) {
            const size_t start = static_cast<size_t>(m[0].first - text.cbegin());
            const size_t stop = static_cast<size_t>(m[0].second - text.cbegin());
            if (start < half) {
                if (stop < end || end == text.size()) {
                    match = std::move(m);
                    return true;
                }
                // Runs into the window edge: longer than a window allows.
                pos = start + 1;
                continue;
            }
        }
        if (end == text.size()) return false;
        pos = half;
    }
    return false;
}

// Text consumed after an equation head ending at `headEnd`, following the
// regex semantics of `\s*(.+)` and `\s*([^=]+)`. Returns false when the tail
// cannot match; `tailEnd` is where scanning resumes.
bool ScanTail(const std::string& text, size_t headEnd, bool untilEquals, std::string& tail, size_t& tailEnd) {
    size_t q = headEnd;
    while (q < text.size() && std::isspace(static_cast<unsigned char>(text[q]))) ++q;

    if (untilEquals) {
        if (q < text.size() && text[q] != '=') {
            tailEnd = text.find('=', q);
            if (tailEnd == std::string::npos) tailEnd = text.size();
            tail = text.substr(q, tailEnd - q);
            return true;
        }
        // Backtrack: the last skipped whitespace character is the whole tail.
        if (q == headEnd) return false;
        tail = text.substr(q - 1, 1);
        tailEnd = q;
        return true;
    }

    if (q < text.size()) {
        tailEnd = q;
        while (tailEnd < text.size() && !IsLineTerminator(text[tailEnd])) ++tailEnd;
        tail = text.substr(q, tailEnd - q);
        return true;
    }
    // Only whitespace up to the end: `.+` takes the last non-terminator.
    for (size_t r = q; r > headEnd; --r) {
        if (!IsLineTerminator(text[r - 1])) {
            tail = text.substr(r - 1, 1);
            tailEnd = r;
            return true;
        }
    }
    return false;
}

// Joins every capture group with a single space; a pattern without groups
// contributes its whole match.
std::string JoinGroups(const std::smatch& match) {
    if (match.size() <= 1) return match.str(0);
    std::string joined;
    for (size_t i = 1; i < match.size(); ++i) {
        if (i > 1) joined.push_back(' ');
        joined += match.str(i);
    }
    return joined;
}

} // namespace

FactExtractor::FactExtractor(domain::fidelity::ExtractionVocabulary vocabulary)
    : m_vocabulary(std::move(vocabulary)) {
    m_equationRules.reserve(m_vocabulary.equationPatterns.size());
    for (const auto& pattern : m_vocabulary.equationPatterns) {
        EquationRule rule;
        std::string head = pattern;
        if (EndsWith(pattern, kRestOfLineTail)) {
            head.resize(pattern.size() - std::string(kRestOfLineTail).size());
            rule.tail = EquationTail::RestOfLine;
        } else if (EndsWith(pattern, kUntilEqualsTail)) {
            head.resize(pattern.size() - std::string(kUntilEqualsTail).size());
            rule.tail = EquationTail::UntilEquals;
        }
        if (head.empty()) {
            throw std::invalid_argument("Equation pattern '" + pattern + "' has no head before its tail.");
        }
        rule.head = Compile(head);
        m_equationRules.push_back(std::move(rule));
    }
    m_expressionRegex = Compile(m_vocabulary.expressionPattern);
    m_parameterRegex = Compile(m_vocabulary.parameterPattern);
}

domain::fidelity::SourceFactInventory FactExtractor::extract(const std::string& sourceText) const {
    domain::fidelity::SourceFactInventory inventory;
    const std::string lowered = Normalize(sourceText);

    inventory.equations = extractEquations(sourceText);
    inventory.parameters = extractParameters(sourceText);
    extractStatements(sourceText, inventory);
    inventory.domainKeywords = extractDomainKeywords(lowered);
    inventory.confidence = estimateConfidence(lowered, inventory);
    return inventory;
}

std::set<std::string> FactExtractor::extractEquations(const std::string& text) const {
    std::set<std::string> equations;
    try {
        for (const auto& rule : m_equationRules) {
            std::smatch m;
            size_t pos = 0;
            while (pos < text.size() && SearchBounded(text, pos, rule.head, m)) {
                const size_t start = static_cast<size_t>(m[0].first - text.cbegin());
                const size_t headEnd = static_cast<size_t>(m[0].second - text.cbegin());
                if (rule.tail == EquationTail::None) {
                    equations.insert(JoinGroups(m));
                    pos = std::max(headEnd, start + 1);
                    continue;
                }

                std::string tail;
                size_t tailEnd = 0;
                if (!ScanTail(text, headEnd, rule.tail == EquationTail::UntilEquals, tail, tailEnd)) {
                    pos = start + 1;
                    continue;
                }
                std::string joined;
                for (size_t i = 1; i < m.size(); ++i) {
                    joined += m.str(i);
                    joined.push_back(' ');
                }
                equations.insert(joined + tail);
                pos = tailEnd;
            }
        }
        // Inline formulas written without an equals sign.
        std::smatch m;
        size_t pos = 0;
        while (pos < text.size() && SearchBounded(text, pos, m_expressionRegex, m)) {
            equations.insert(m.str(0));
            const size_t start = static_cast<size_t>(m[0].first - text.cbegin());
            pos = std::max(static_cast<size_t>(m[0].second - text.cbegin()), start + 1);
        }
    } catch (const std::regex_error& e) {
        std::cerr << "[FactExtractor] Equation scan aborted: " << e.what() << std::endl;
    }
    return equations;
}

std::set<std::string> FactExtractor::extractParameters(const std::string& text) const {
    std::set<std::string> parameters;
    try {
        std::smatch match;
        size_t pos = 0;
        while (pos < text.size() && SearchBounded(text, pos, m_parameterRegex, match)) {
            for (size_t i = 1; i < match.size(); ++i) {
                if (match[i].matched && match[i].length() > 0) {
                    parameters.insert(match.str(i));
                    break;
                }
            }
            const size_t start = static_cast<size_t>(match[0].first - text.cbegin());
            pos = std::max(static_cast<size_t>(match[0].second - text.cbegin()), start + 1);
        }
    } catch (const std::regex_error& e) {
        std::cerr << "[FactExtractor] Parameter scan aborted: " << e.what() << std::endl;
    }
    return parameters;
}

void FactExtractor::extractStatements(const std::string& text,
                                      domain::fidelity::SourceFactInventory& inventory) const {
    std::vector<std::string> sentences;
    size_t start = 0;
    while (true) {
        const size_t dot = text.find('.', start);
        const std::string sentence = Trim(text.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (!sentence.empty()) sentences.push_back(sentence);
        if (dot == std::string::npos) break;
        start = dot + 1;
    }

    for (const auto& sentence : sentences) {
        if (ContainsAny(Normalize(sentence), m_vocabulary.assumptionKeywords)) {
            inventory.assumptions.push_back(sentence);
        }
    }

    // Assumption-first precedence: a sentence already taken as an assumption
    // is never reported again as a constraint.
    for (const auto& sentence : sentences) {
        if (!ContainsAny(Normalize(sentence), m_vocabulary.constraintKeywords)) continue;
        const bool isAssumption = std::find(inventory.assumptions.begin(), inventory.assumptions.end(),
                                            sentence) != inventory.assumptions.end();
        if (!isAssumption) {
            inventory.constraints.push_back(sentence);
        }
    }
}

std::vector<std::string> FactExtractor::extractDomainKeywords(const std::string& loweredText) const {
    std::vector<std::string> found;
    for (const auto& keyword : m_vocabulary.domainKeywords) {
        if (loweredText.find(Normalize(keyword)) != std::string::npos) {
            found.push_back(keyword);
        }
    }
    return found;
}

double FactExtractor::estimateConfidence(const std::string& loweredText,
                                         const domain::fidelity::SourceFactInventory& inventory) const {
    double score = kBaselineConfidence;
    if (!inventory.equations.empty()) score += kEquationBoost;
    if (!inventory.parameters.empty()) score += kParameterBoost;
    if (ContainsAny(loweredText, m_vocabulary.structuralMarkers)) score += kStructureBoost;
    return std::min(score, 1.0);
}

} // namespace ssdverifier::application::fidelity
