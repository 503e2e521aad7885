/**
 * @file VerificationRecords.cpp
 * @brief Implementation of VerificationRecords.
 */

#include "application/fidelity/VerificationRecords.hpp"

#include <fstream>
#include <sstream>

#include "infrastructure/AtomicFileWriter.hpp"
#include "infrastructure/CandidateDocumentReader.hpp"

namespace ssdverifier::application::fidelity {

namespace {

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

nlohmann::json VerificationRecords::VerdictToJson(const domain::fidelity::VerificationVerdict& verdict) {
    return {
        {"equation_accuracy", verdict.equationAccuracy},
        {"parameter_completeness", verdict.parameterCompleteness},
        {"assumption_completeness", verdict.assumptionCompleteness},
        {"constraint_accuracy", verdict.constraintAccuracy},
        {"overall_fidelity", verdict.overallFidelity},
        {"missing_elements", verdict.missingElements},
        {"extra_elements", verdict.extraElements}
    };
}

nlohmann::json VerificationRecords::InventoryToJson(const domain::fidelity::SourceFactInventory& inventory) {
    return {
        {"equations", inventory.equations},
        {"parameters", inventory.parameters},
        {"assumptions", inventory.assumptions},
        {"constraints", inventory.constraints},
        {"domain_keywords", inventory.domainKeywords},
        {"confidence", inventory.confidence}
    };
}

nlohmann::json VerificationRecords::ToRecord(const VerificationRequest& request, const VerificationOutcome& outcome) {
    nlohmann::json record = {
        {"index", outcome.index},
        {"simulation_name", request.candidate.simulationName.value_or("Unknown")},
        {"source_document", request.sourceDocument},
        {"ssd_document", request.rawCandidate},
        {"source_analysis", nullptr},
        {"fidelity_verification", nullptr},
        {"overall_status", domain::fidelity::StatusToString(outcome.status)}
    };
    if (outcome.inventory) {
        record["source_analysis"] = InventoryToJson(*outcome.inventory);
    }
    if (outcome.verdict) {
        record["fidelity_verification"] = VerdictToJson(*outcome.verdict);
    } else {
        record["error"] = outcome.error;
        record["retry"] = outcome.retryRecommended;
    }
    return record;
}

VerificationRequest VerificationRecords::RequestFromLine(const std::string& line) {
    VerificationRequest request;
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(line);
    } catch (const std::exception& e) {
        request.inputError = std::string("Invalid JSON: ") + e.what();
        return request;
    }
    if (!data.is_object()) {
        request.inputError = "Input line is not a JSON object.";
        return request;
    }

    if (data.contains("source_document")) {
        if (!data["source_document"].is_string()) {
            request.inputError = "source_document is not a string.";
            return request;
        }
        request.sourceDocument = data["source_document"].get<std::string>();
    }

    if (data.contains("ssd_document")) {
        request.rawCandidate = data["ssd_document"];
    } else if (data.contains("ssd_output")) {
        request.rawCandidate = data["ssd_output"];
    }
    request.candidate = infrastructure::CandidateDocumentReader::FromJson(request.rawCandidate);
    return request;
}

bool VerificationRecords::ReadRequests(const std::string& path,
                                       std::vector<VerificationRequest>& requests,
                                       std::string& error) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error = "Could not open input file: " + path;
        return false;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (IsBlank(line)) continue;
        requests.push_back(RequestFromLine(line));
    }
    if (in.bad()) {
        error = "Read error on input file: " + path;
        return false;
    }
    return true;
}

bool VerificationRecords::WriteOutcomes(const std::string& path,
                                        const std::vector<VerificationRequest>& requests,
                                        const std::vector<VerificationOutcome>& outcomes,
                                        std::string& error) {
    if (requests.size() != outcomes.size()) {
        error = "Outcome count " + std::to_string(outcomes.size()) +
                " does not match request count " + std::to_string(requests.size()) + ".";
        return false;
    }
    std::ostringstream out;
    for (const auto& outcome : outcomes) {
        out << ToRecord(requests.at(outcome.index), outcome).dump() << '\n';
    }
    return infrastructure::AtomicFileWriter::Write(path, out.str(), error);
}

} // namespace ssdverifier::application::fidelity
