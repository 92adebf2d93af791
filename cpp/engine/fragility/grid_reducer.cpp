// ============================================================================
// Fragility: Grid Reducer
// File: cpp/engine/fragility/grid_reducer.cpp
// ============================================================================

#include "engine/fragility/grid_reducer.hpp"

#include "engine/core/numeric.hpp"

#include <algorithm>

namespace clirisk::fragility {

double MaxGridReducer::reduce_final_pof(const hbom::GridCurveMap& curves) const {
    double best = 0.0;
    for (const auto& kv : curves) {
        best = std::max(best, clamp01(kv.second.final_pof));
    }
    return best;
}

std::vector<double> MaxGridReducer::reduce_per_timestep(const hbom::GridCurveMap& curves,
                                                        std::size_t n_times) const {
    std::vector<double> out(n_times, 0.0);
    for (const auto& kv : curves) {
        const auto& fc = kv.second.fc_values;
        const std::size_t n = std::min(n_times, fc.size());
        for (std::size_t t = 0; t < n; ++t) {
            out[t] = std::max(out[t], clamp01(fc[t]));
        }
    }
    return out;
}

} // namespace clirisk::fragility
