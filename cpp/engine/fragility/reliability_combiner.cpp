// ============================================================================
// Fragility: Component Reliability Combiner
// File: cpp/engine/fragility/reliability_combiner.cpp
// ============================================================================

#include "engine/fragility/reliability_combiner.hpp"

#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

namespace clirisk::fragility {

namespace {

double sanitize(double p, CombineDiagnostics* diag) noexcept {
    if (std::isnan(p)) {
        if (diag) diag->nonfinite_coerced++;
        return 0.0;
    }
    if (!is_probability(p)) {
        if (diag) diag->clamped++;
        return clamp01(p);
    }
    return p;
}

double lookup(const hbom::PofByVar& m, const std::string& var, CombineDiagnostics* diag) {
    auto it = m.find(var);
    return (it == m.end()) ? 0.0 : sanitize(it->second, diag);
}

} // namespace

double series_failure(const std::vector<double>& pofs) noexcept {
    double survival = 1.0;
    double worst = 0.0;
    for (double p : pofs) {
        const double q = clamp01(p);
        survival *= (1.0 - q);
        worst = std::max(worst, q);
    }
    return std::max(clamp01(1.0 - survival), worst);
}

CombinedPof SeriesReliabilityCombiner::combine(const hbom::PofByVar& own,
                                               const std::vector<hbom::PofByVar>& children,
                                               CombineDiagnostics* diag) const {
    std::set<std::string> vars;
    for (const auto& kv : own) vars.insert(kv.first);
    for (const auto& c : children) {
        for (const auto& kv : c) vars.insert(kv.first);
    }

    CombinedPof out;
    std::vector<double> child_pofs;
    child_pofs.reserve(children.size());

    for (const auto& var : vars) {
        child_pofs.clear();
        for (const auto& c : children) child_pofs.push_back(lookup(c, var, diag));

        const double child_combined = series_failure(child_pofs);
        const double own_pof = lookup(own, var, diag);
        // max() absorbs round-off so combining never reports less than a part.
        const double combined = std::max({clamp01(1.0 - (1.0 - own_pof) * (1.0 - child_combined)),
                                          own_pof, child_combined});

        out.pof_by_var[var] = combined;
        out.pof = std::max(out.pof, combined);
    }
    return out;
}

} // namespace clirisk::fragility
