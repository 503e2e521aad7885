/**
 * @file CandidateDocumentReader.cpp
 * @brief Implementation of CandidateDocumentReader.
 */

#include "infrastructure/CandidateDocumentReader.hpp"

namespace ssdverifier::infrastructure {

namespace {

std::vector<std::string> ReadFieldOfObjects(const nlohmann::json& ssd, const char* key, const char* field) {
    std::vector<std::string> values;
    if (!ssd.contains(key) || !ssd[key].is_array()) return values;
    for (const auto& item : ssd[key]) {
        if (item.is_object() && item.contains(field) && item[field].is_string()) {
            values.push_back(item[field].get<std::string>());
        }
    }
    return values;
}

std::vector<std::string> ReadStrings(const nlohmann::json& ssd, const char* key) {
    std::vector<std::string> values;
    if (!ssd.contains(key) || !ssd[key].is_array()) return values;
    for (const auto& item : ssd[key]) {
        if (item.is_string()) values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace

domain::fidelity::CandidateDocument CandidateDocumentReader::FromJson(const nlohmann::json& ssd) {
    domain::fidelity::CandidateDocument doc;
    if (!ssd.is_object()) return doc;

    if (ssd.contains("simulation_name") && ssd["simulation_name"].is_string()) {
        doc.simulationName = ssd["simulation_name"].get<std::string>();
    }
    doc.equations = ReadFieldOfObjects(ssd, "equations", "expression");
    doc.parameters = ReadFieldOfObjects(ssd, "parameters", "symbol");
    doc.assumptions = ReadStrings(ssd, "assumptions");
    doc.constraints = ReadStrings(ssd, "constraints");
    return doc;
}

} // namespace ssdverifier::infrastructure
