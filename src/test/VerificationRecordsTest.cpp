#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/fidelity/VerificationRecords.hpp"
#include "TestEmbeddingService.hpp"

using namespace ssdverifier::application::fidelity;
using namespace ssdverifier::domain::fidelity;

int main() {
    std::cout << "[Test] Starting VerificationRecords Test..." << std::endl;

    std::string testRoot = "test_verification_records";
    std::filesystem::create_directories(testRoot);
    const std::string inputFile = testRoot + "/input.jsonl";
    const std::string outputFile = testRoot + "/out/results.jsonl";

    // Line parsing
    {
        auto ok = VerificationRecords::RequestFromLine(
            R"({"source_document": "x = 5", "ssd_document": {"simulation_name": "A", "equations": [{"expression": "x = 5"}]}})");
        assert(!ok.inputError);
        assert(ok.sourceDocument == "x = 5");
        assert(ok.candidate.equations.size() == 1);
        assert(ok.rawCandidate["simulation_name"] == "A");

        auto legacy = VerificationRecords::RequestFromLine(
            R"({"source_document": "y = 2", "ssd_output": {"simulation_name": "B"}})");
        assert(!legacy.inputError);
        assert(legacy.candidate.simulationName && *legacy.candidate.simulationName == "B");

        assert(VerificationRecords::RequestFromLine("{broken").inputError);
        assert(VerificationRecords::RequestFromLine("[1, 2]").inputError);
        assert(VerificationRecords::RequestFromLine(R"({"source_document": 12})").inputError);

        auto bare = VerificationRecords::RequestFromLine("{}");
        assert(!bare.inputError && bare.sourceDocument.empty());
        std::cout << "[PASS] Line parsing." << std::endl;
    }

    // Read, verify, write: one record per non-blank input line, in order.
    {
        std::ofstream(inputFile)
            << R"({"source_document": "Assume no drag. y = a*t", "ssd_document": {"simulation_name": "Drop", "equations": [{"expression": "y = a*t"}], "assumptions": ["No drag"]}})" << "\n"
            << "\n"
            << "not json at all\n"
            << R"({"source_document": "", "ssd_document": {}})" << "\n";

        std::vector<VerificationRequest> requests;
        std::string error;
        assert(VerificationRecords::ReadRequests(inputFile, requests, error));
        assert(requests.size() == 3 && "Blank lines are skipped.");

        auto embeddings = std::make_shared<TestEmbeddingService>();
        VerificationService service(std::make_shared<const FactExtractor>(),
                                    std::make_shared<const FidelityScorer>(embeddings, std::chrono::milliseconds(1000)));
        auto outcomes = service.verifyBatch(requests, 2);

        assert(VerificationRecords::WriteOutcomes(outputFile, requests, outcomes, error));

        std::ifstream in(outputFile);
        std::vector<nlohmann::json> records;
        std::string line;
        while (std::getline(in, line)) records.push_back(nlohmann::json::parse(line));
        assert(records.size() == 3);

        assert(records[0]["index"] == 0);
        assert(records[0]["simulation_name"] == "Drop");
        assert(records[0]["fidelity_verification"].is_object());
        assert(records[0]["fidelity_verification"]["equation_accuracy"].get<double>() >= 0.9);
        assert(records[0]["source_analysis"]["equations"].is_array());
        assert(records[0]["overall_status"] == StatusToString(outcomes[0].status));
        assert(!records[0].contains("error"));

        assert(records[1]["overall_status"] == "invalid_input");
        assert(records[1]["fidelity_verification"].is_null());
        assert(records[1]["retry"] == false);
        assert(records[1]["error"].get<std::string>().find("Invalid JSON") == 0);

        // Empty source and empty candidate: all categories vacuously complete.
        assert(records[2]["fidelity_verification"]["overall_fidelity"].get<double>() > 0.999);
        assert(records[2]["overall_status"] == "high_fidelity");
        assert(records[2]["simulation_name"] == "Unknown");
        std::cout << "[PASS] Batch records." << std::endl;
    }

    // I/O errors
    {
        std::vector<VerificationRequest> requests;
        std::string error;
        assert(!VerificationRecords::ReadRequests(testRoot + "/absent.jsonl", requests, error));
        assert(!error.empty());

        std::vector<VerificationOutcome> outcomes(1);
        error.clear();
        assert(!VerificationRecords::WriteOutcomes(outputFile, requests, outcomes, error));
        assert(!error.empty());
    }

    std::filesystem::remove_all(testRoot);
    std::cout << "[PASS] VerificationRecords Test." << std::endl;
    return 0;
}
