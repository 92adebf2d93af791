// ============================================================================
// Fragility: Grid Reducer (per-cell curves -> one representative value)
// File: cpp/engine/fragility/grid_reducer.hpp
// ============================================================================
//
// Weakest link across space: the worst grid cell dominates.
// - reduce_final_pof: max final_pof over cells (snapshot view)
// - reduce_per_timestep: at each t, max fc_values[t] over cells; a cell
//   shorter than the time axis contributes 0.0 beyond its length
//
// Non-finite values count as 0.0 (no-failure).
// ============================================================================

#pragma once

#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <vector>

namespace clirisk::fragility {

class IGridReducer {
public:
    virtual ~IGridReducer() = default;

    // Empty map -> 0.0
    virtual double reduce_final_pof(const hbom::GridCurveMap& curves) const = 0;

    // Result has exactly n_times entries.
    virtual std::vector<double> reduce_per_timestep(const hbom::GridCurveMap& curves,
                                                    std::size_t n_times) const = 0;
};

class MaxGridReducer final : public IGridReducer {
public:
    double reduce_final_pof(const hbom::GridCurveMap& curves) const override;
    std::vector<double> reduce_per_timestep(const hbom::GridCurveMap& curves,
                                            std::size_t n_times) const override;
};

} // namespace clirisk::fragility
