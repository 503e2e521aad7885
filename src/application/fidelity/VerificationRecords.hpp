/**
 * @file VerificationRecords.hpp
 * @brief JSONL input/output of batch verification runs.
 */

#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/fidelity/VerificationService.hpp"

namespace ssdverifier::application::fidelity {

/**
 * @class VerificationRecords
 * @brief Maps JSONL lines to requests and outcomes to flat JSON records.
 *
 * Input lines: `{"source_document": "...", "ssd_document": {...}}`, with
 * `ssd_output` accepted in place of `ssd_document`. Blank lines are skipped;
 * every other line becomes exactly one request and later one output record.
 */
class VerificationRecords {
public:
    static nlohmann::json VerdictToJson(const domain::fidelity::VerificationVerdict& verdict);
    static nlohmann::json InventoryToJson(const domain::fidelity::SourceFactInventory& inventory);
    static nlohmann::json ToRecord(const VerificationRequest& request, const VerificationOutcome& outcome);

    /** @brief Parses one input line. Unparseable lines yield a request carrying inputError. */
    static VerificationRequest RequestFromLine(const std::string& line);

    static bool ReadRequests(const std::string& path, std::vector<VerificationRequest>& requests, std::string& error);

    /** @brief Writes one record per outcome, in outcome index order, atomically. */
    static bool WriteOutcomes(const std::string& path,
                              const std::vector<VerificationRequest>& requests,
                              const std::vector<VerificationOutcome>& outcomes,
                              std::string& error);
};

} // namespace ssdverifier::application::fidelity
