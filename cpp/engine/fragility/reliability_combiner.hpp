// ============================================================================
// Fragility: Component Reliability Combiner (series system model)
// File: cpp/engine/fragility/reliability_combiner.hpp
// ============================================================================
//
// For each variable v in own ∪ children:
//   child(v)    = 1 - prod_c (1 - child_c(v))       children in series
//   combined(v) = 1 - (1 - own(v)) * (1 - child(v))  node in series with them
// pof = max_v combined(v), or 0 when no variable is present.
//
// Absent values default to 0.0. Non-finite inputs are coerced to 0.0 and
// counted; out-of-range inputs are clamped into [0,1].
// ============================================================================

#pragma once

#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <vector>

namespace clirisk::fragility {

struct CombineDiagnostics final {
    std::size_t nonfinite_coerced = 0;
    std::size_t clamped = 0;

    void merge(const CombineDiagnostics& o) noexcept {
        nonfinite_coerced += o.nonfinite_coerced;
        clamped += o.clamped;
    }
};

struct CombinedPof final {
    hbom::PofByVar pof_by_var;
    double pof = 0.0;
};

// 1 - prod(1 - p_i). Empty -> 0.
double series_failure(const std::vector<double>& pofs) noexcept;

class IReliabilityCombiner {
public:
    virtual ~IReliabilityCombiner() = default;

    virtual CombinedPof combine(const hbom::PofByVar& own,
                                const std::vector<hbom::PofByVar>& children,
                                CombineDiagnostics* diag = nullptr) const = 0;
};

class SeriesReliabilityCombiner final : public IReliabilityCombiner {
public:
    CombinedPof combine(const hbom::PofByVar& own,
                        const std::vector<hbom::PofByVar>& children,
                        CombineDiagnostics* diag = nullptr) const override;
};

} // namespace clirisk::fragility
