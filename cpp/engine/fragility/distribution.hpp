// ============================================================================
// Fragility: Distribution Evaluator (Lognormal / Weibull / Logistic)
// File: cpp/engine/fragility/distribution.hpp
// ============================================================================
//
// Purpose:
// - Map (fragility model, parameters, intensity series) -> PoF series.
// - Pure and total: never throws on numeric input.
//
// Models:
// - lognormal: Phi((ln(x + eps) - mu) / sigma) when both mu and sigma are
//   given, else Phi((ln(x + eps) - ln(median)) / dispersion)
// - weibull:   1 - exp(-(x/scale)^shape), evaluated as -expm1(-t)
// - logistic:  1 / (1 + exp(-slope * (x - mid_point)))
// - inherit:   sentinel; the orchestrator never evaluates it
//
// Fault policy:
// - Unknown model -> zero series of matching length, counted in diagnostics.
// - Missing input point (NaN) -> 0.0, counted as missing.
// - Any other non-finite result (bad parameters) -> 0.0, counted as coerced.
// - Every output value is clamped into [0,1].
//
// ============================================================================

#pragma once

#include "engine/core/settings.hpp"
#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clirisk::fragility {

enum class FragilityModel : std::uint8_t {
    Lognormal = 0,
    Weibull = 1,
    Logistic = 2,
    Inherit = 3,
    Unknown = 255
};

FragilityModel parse_fragility_model(std::string_view name) noexcept;
const char* to_string(FragilityModel m) noexcept;

struct EvalDiagnostics final {
    std::size_t evaluations = 0;
    std::size_t unknown_model = 0;      // evaluations with an unrecognized model
    std::size_t missing_points = 0;     // NaN inputs mapped to 0.0
    std::size_t nonfinite_coerced = 0;  // NaN/Inf results mapped to 0.0

    bool has_warnings() const noexcept { return unknown_model > 0 || nonfinite_coerced > 0; }

    void merge(const EvalDiagnostics& o) noexcept {
        evaluations += o.evaluations;
        unknown_model += o.unknown_model;
        missing_points += o.missing_points;
        nonfinite_coerced += o.nonfinite_coerced;
    }
};

// Phi(z). Exact at +-inf, NaN in -> NaN out.
double standard_normal_cdf(double z) noexcept;

// Pointwise kernels. May return NaN for invalid parameters; callers sanitize.
double lognormal_cdf(double x, double mu, double sigma, double eps) noexcept;
double weibull_cdf(double x, double shape, double scale) noexcept;
double logistic_cdf(double x, double mid_point, double slope) noexcept;

// Evaluator seam consumed by FragilityComputer.
class IDistributionEvaluator {
public:
    virtual ~IDistributionEvaluator() = default;

    // Empty series -> empty result. `diag` is optional.
    virtual std::vector<double> evaluate(std::string_view model,
                                         const hbom::ParamMap& params,
                                         const std::vector<double>& series,
                                         EvalDiagnostics* diag = nullptr) const = 0;
};

class DistributionEvaluator final : public IDistributionEvaluator {
public:
    DistributionEvaluator() = default;
    explicit DistributionEvaluator(FragilityDefaults defaults);

    std::vector<double> evaluate(std::string_view model,
                                 const hbom::ParamMap& params,
                                 const std::vector<double>& series,
                                 EvalDiagnostics* diag = nullptr) const override;

    const FragilityDefaults& defaults() const noexcept { return d_; }

private:
    FragilityDefaults d_{};
};

} // namespace clirisk::fragility
