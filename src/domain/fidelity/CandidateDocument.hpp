/**
 * @file CandidateDocument.hpp
 * @brief Normalized view of a generated Simulation Specification Document (SSD).
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace ssdverifier::domain::fidelity {

/**
 * @struct CandidateDocument
 * @brief The parts of an SSD the fidelity scorer compares against the source.
 *
 * Built once at the boundary (see infrastructure::CandidateDocumentReader).
 * Absent or malformed fields are already empty here, so scoring code never
 * re-checks for missing keys.
 */
struct CandidateDocument {
    std::optional<std::string> simulationName;
    std::vector<std::string> equations;     ///< `equations[].expression`
    std::vector<std::string> parameters;    ///< `parameters[].symbol`
    std::vector<std::string> assumptions;
    std::vector<std::string> constraints;
};

} // namespace ssdverifier::domain::fidelity
