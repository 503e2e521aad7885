/**
 * @file VerificationVerdict.hpp
 * @brief Result of comparing a candidate SSD against its source inventory.
 */

#pragma once
#include <string>
#include <vector>

namespace ssdverifier::domain::fidelity {

/**
 * @enum FidelityStatus
 * @brief Discrete label attached to a verification outcome.
 */
enum class FidelityStatus {
    HighFidelity,
    Acceptable,
    NeedsReview,
    ScoringFailed,  ///< Could not score (embedding provider failure). Not a 0.0 verdict.
    InvalidInput
};

/**
 * @struct VerificationVerdict
 * @brief Per-category scores, traceability lists and the weighted aggregate.
 */
struct VerificationVerdict {
    static constexpr double EquationWeight = 0.4;
    static constexpr double ParameterWeight = 0.3;
    static constexpr double AssumptionWeight = 0.2;
    static constexpr double ConstraintWeight = 0.1;

    double equationAccuracy = 0.0;
    double parameterCompleteness = 0.0;
    double assumptionCompleteness = 0.0;
    double constraintAccuracy = 0.0;

    std::vector<std::string> missingElements;  ///< Source elements absent from the candidate.
    std::vector<std::string> extraElements;    ///< Candidate equations/parameters not traceable to the source.

    double overallFidelity = 0.0;

    static double WeightedFidelity(double equations, double parameters, double assumptions, double constraints) {
        return equations * EquationWeight + parameters * ParameterWeight +
               assumptions * AssumptionWeight + constraints * ConstraintWeight;
    }

    bool operator==(const VerificationVerdict& other) const {
        return equationAccuracy == other.equationAccuracy &&
               parameterCompleteness == other.parameterCompleteness &&
               assumptionCompleteness == other.assumptionCompleteness &&
               constraintAccuracy == other.constraintAccuracy &&
               missingElements == other.missingElements &&
               extraElements == other.extraElements &&
               overallFidelity == other.overallFidelity;
    }
    bool operator!=(const VerificationVerdict& other) const { return !(*this == other); }
};

/** @brief Maps an aggregate fidelity to its status label. */
inline FidelityStatus DeriveStatus(double overallFidelity) {
    if (overallFidelity >= 0.9) return FidelityStatus::HighFidelity;
    if (overallFidelity >= 0.7) return FidelityStatus::Acceptable;
    return FidelityStatus::NeedsReview;
}

inline std::string StatusToString(FidelityStatus status) {
    switch (status) {
        case FidelityStatus::HighFidelity: return "high_fidelity";
        case FidelityStatus::Acceptable: return "acceptable";
        case FidelityStatus::NeedsReview: return "needs_review";
        case FidelityStatus::ScoringFailed: return "scoring_failed";
        case FidelityStatus::InvalidInput: return "invalid_input";
    }
    return "needs_review";
}

} // namespace ssdverifier::domain::fidelity
