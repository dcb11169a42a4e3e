#include "AdoptionModel.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace evtoll {

namespace {
bool isShare(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}
} // namespace

double sigmoid(double x) {
    if (std::isnan(x)) return 0.5;
    // Split on sign so exp() never overflows.
    if (x >= 0.0) {
        const double z = std::exp(-x);
        return 1.0 / (1.0 + z);
    }
    const double z = std::exp(x);
    return z / (1.0 + z);
}

double adoptionShare(double toll_eur, const AdoptionParameters& params) {
    // Curve limits: +inf -> max_share, -inf and NaN -> baseline.
    if (!std::isfinite(toll_eur)) {
        const double limit = (toll_eur > 0.0) ? params.max_share : params.baseline_share;
        return std::clamp(limit, 0.0, 1.0);
    }
    const double s = sigmoid(params.steepness * (toll_eur - params.midpoint_eur));
    const double share = params.baseline_share + (params.max_share - params.baseline_share) * s;
    if (!std::isfinite(share)) return 0.0;
    return std::clamp(share, 0.0, 1.0);
}

double AdoptionModel::share(double toll_eur) const {
    if (zero_toll_override && toll_eur == 0.0) {
        return std::clamp(*zero_toll_override, 0.0, 1.0);
    }
    return adoptionShare(toll_eur, params);
}

double transitionSlopeAtMidpoint(const AdoptionParameters& params) {
    return params.steepness / 4.0 * (params.max_share - params.baseline_share);
}

std::vector<double> adoptionCurve(const AdoptionModel& model, const std::vector<double>& tolls_eur) {
    std::vector<double> out;
    out.reserve(tolls_eur.size());
    for (double t : tolls_eur) {
        out.push_back(model.share(t));
    }
    return out;
}

ParameterCheck validateAdoptionParameters(const AdoptionParameters& params) {
    ParameterCheck check;
    std::ostringstream msg;
    if (!isShare(params.baseline_share)) {
        msg << "baseline_share must be in [0,1] (got " << params.baseline_share << ")";
    } else if (!isShare(params.max_share)) {
        msg << "max_share must be in [0,1] (got " << params.max_share << ")";
    } else if (params.baseline_share > params.max_share) {
        msg << "baseline_share (" << params.baseline_share
            << ") exceeds max_share (" << params.max_share << ")";
    } else if (!std::isfinite(params.midpoint_eur) || params.midpoint_eur < 0.0) {
        msg << "midpoint must be a nonnegative toll (got " << params.midpoint_eur << ")";
    } else if (!std::isfinite(params.steepness) || params.steepness <= 0.0) {
        msg << "steepness must be > 0 (got " << params.steepness << ")";
    } else {
        return check;
    }
    check.ok = false;
    check.message = msg.str();
    return check;
}

ParameterCheck validateAdoptionModel(const AdoptionModel& model) {
    ParameterCheck check = validateAdoptionParameters(model.params);
    if (check.ok && model.zero_toll_override && !isShare(*model.zero_toll_override)) {
        std::ostringstream msg;
        msg << "zero_toll_override must be in [0,1] (got " << *model.zero_toll_override << ")";
        check.ok = false;
        check.message = msg.str();
    }
    return check;
}

} // namespace evtoll
