/**
 * @file CandidateDocumentReader.hpp
 * @brief Boundary validation of loosely-typed SSD JSON into a CandidateDocument.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/fidelity/CandidateDocument.hpp"

namespace ssdverifier::infrastructure {

class CandidateDocumentReader {
public:
    /**
     * @brief Normalizes an SSD JSON value.
     *
     * Expected shape: `equations[].expression`, `parameters[].symbol`,
     * `assumptions[]`, `constraints[]` (strings), optional `simulation_name`.
     * Missing keys, wrong types and malformed items are dropped; unknown keys
     * are ignored. Never throws.
     */
    static domain::fidelity::CandidateDocument FromJson(const nlohmann::json& ssd);
};

} // namespace ssdverifier::infrastructure
