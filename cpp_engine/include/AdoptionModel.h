#pragma once

#include <optional>
#include <string>
#include <vector>

namespace evtoll {

// Logistic EV adoption as a function of the toll charged to ICE vehicles.
//
//   share(t) = baseline + (max - baseline) * sigmoid(k * (t - midpoint))
//
// The result is clamped to [0,1].
struct AdoptionParameters {
    double baseline_share = 0.15;  // asymptote for t -> -inf
    double max_share = 0.90;       // saturation for t -> +inf
    double midpoint_eur = 2.5;     // toll where share is halfway
    double steepness = 0.5;        // k, 1/EUR
};

struct ParameterCheck {
    bool ok = true;
    std::string message;
};

// Adoption curve plus the zero-toll policy switch.
// When zero_toll_override is set, a toll of exactly 0 returns that share
// instead of evaluating the curve.
struct AdoptionModel {
    AdoptionParameters params{};
    std::optional<double> zero_toll_override{};

    double share(double toll_eur) const;
};

double sigmoid(double x);

// Pure curve evaluation (no zero-toll policy).
double adoptionShare(double toll_eur, const AdoptionParameters& params);

// d(share)/d(toll) at the midpoint: k/4 * (max - baseline).
double transitionSlopeAtMidpoint(const AdoptionParameters& params);

std::vector<double> adoptionCurve(const AdoptionModel& model, const std::vector<double>& tolls_eur);

ParameterCheck validateAdoptionParameters(const AdoptionParameters& params);
ParameterCheck validateAdoptionModel(const AdoptionModel& model);

} // namespace evtoll
