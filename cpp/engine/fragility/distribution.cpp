// ============================================================================
// Fragility: Distribution Evaluator
// File: cpp/engine/fragility/distribution.cpp
// ============================================================================

#include "engine/fragility/distribution.hpp"

#include "engine/core/numeric.hpp"

#include <cmath>
#include <utility>

namespace clirisk::fragility {

namespace {

double param_or(const hbom::ParamMap& p, const char* key, double fallback) {
    auto it = p.find(key);
    return (it == p.end()) ? fallback : it->second;
}

bool has_param(const hbom::ParamMap& p, const char* key) {
    return p.find(key) != p.end();
}

} // namespace

FragilityModel parse_fragility_model(std::string_view name) noexcept {
    if (name == "lognormal") return FragilityModel::Lognormal;
    if (name == "weibull") return FragilityModel::Weibull;
    if (name == "logistic") return FragilityModel::Logistic;
    if (name == "inherit") return FragilityModel::Inherit;
    return FragilityModel::Unknown;
}

const char* to_string(FragilityModel m) noexcept {
    switch (m) {
        case FragilityModel::Lognormal: return "lognormal";
        case FragilityModel::Weibull:   return "weibull";
        case FragilityModel::Logistic:  return "logistic";
        case FragilityModel::Inherit:   return "inherit";
        default:                        return "unknown";
    }
}

double standard_normal_cdf(double z) noexcept {
    // erfc keeps full relative precision in the lower tail.
    return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

double lognormal_cdf(double x, double mu, double sigma, double eps) noexcept {
    const double z = (std::log(x + eps) - mu) / sigma;
    return standard_normal_cdf(z);
}

double weibull_cdf(double x, double shape, double scale) noexcept {
    if (!is_finite(shape) || !is_finite(scale) || shape <= 0.0 || scale <= 0.0) return kNaN;
    if (std::isnan(x)) return kNaN;
    if (x <= 0.0) return 0.0;
    // (x/scale)^shape may overflow to +inf; -expm1(-inf) == 1.
    const double t = std::pow(x / scale, shape);
    return -std::expm1(-t);
}

double logistic_cdf(double x, double mid_point, double slope) noexcept {
    const double z = slope * (x - mid_point);
    if (std::isnan(z)) return kNaN;
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

DistributionEvaluator::DistributionEvaluator(FragilityDefaults defaults) : d_(std::move(defaults)) {
    d_.validate_or_throw();
}

std::vector<double> DistributionEvaluator::evaluate(std::string_view model,
                                                    const hbom::ParamMap& params,
                                                    const std::vector<double>& series,
                                                    EvalDiagnostics* diag) const {
    std::vector<double> out(series.size(), 0.0);
    if (diag) diag->evaluations++;
    if (series.empty()) return out;

    const FragilityModel m = parse_fragility_model(model);
    if (m == FragilityModel::Inherit) return out;
    if (m == FragilityModel::Unknown) {
        if (diag) diag->unknown_model++;
        return out;
    }

    // Resolve parameters once per series.
    double a = 0.0;
    double b = 0.0;
    switch (m) {
        case FragilityModel::Lognormal:
            if (has_param(params, "mu") && has_param(params, "sigma")) {
                a = params.at("mu");
                b = params.at("sigma");
            } else {
                a = std::log(param_or(params, "median", d_.lognormal_median));
                b = param_or(params, "dispersion", d_.lognormal_dispersion);
            }
            break;
        case FragilityModel::Weibull:
            a = param_or(params, "shape", d_.weibull_shape);
            b = param_or(params, "scale", d_.weibull_scale);
            break;
        case FragilityModel::Logistic:
            a = param_or(params, "mid_point", d_.logistic_mid_point);
            b = param_or(params, "slope", d_.logistic_slope);
            break;
        default:
            break;
    }

    for (std::size_t i = 0; i < series.size(); ++i) {
        const double x = series[i];
        if (std::isnan(x)) {
            if (diag) diag->missing_points++;
            continue;
        }

        double p = kNaN;
        switch (m) {
            case FragilityModel::Lognormal: p = lognormal_cdf(x, a, b, d_.log_epsilon); break;
            case FragilityModel::Weibull:   p = weibull_cdf(x, a, b); break;
            case FragilityModel::Logistic:  p = logistic_cdf(x, a, b); break;
            default: break;
        }

        if (std::isnan(p)) {
            if (diag) diag->nonfinite_coerced++;
            continue;
        }
        out[i] = clamp01(p);
    }
    return out;
}

} // namespace clirisk::fragility
