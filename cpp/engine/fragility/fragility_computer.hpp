// ============================================================================
// Fragility: Fragility Computer (orchestrator)
// File: cpp/engine/fragility/fragility_computer.hpp
// ============================================================================
//
// Purpose:
// - Walk an HBOM tree post-order and, per node:
//     1) evaluate the node's own curve for every targeted variable and every
//        grid cell (IDistributionEvaluator)
//     2) reduce cells to one PoF per variable (IGridReducer)
//     3) combine own PoF with the already-combined children (IReliabilityCombiner)
// - Produce either the curve-annotated tree or the flattened PoF time series.
//
// Contract:
// - The input tree is never modified; results are written into a copy that is
//   returned. Each node is written exactly once, after all of its children.
// - Traversal is iterative (explicit stack), so depth is bounded only by
//   TreeSettings::max_depth, enforced at reconstruction.
// - The three collaborators are injected; FragilityComputer owns none of them
//   and they must outlive it.
// - No shared mutable state: concurrent calls on distinct trees are safe.
//
// Fault policy (never aborts the traversal):
// - unknown model            -> zero curves, one WARN per node
// - empty / absent series    -> x_values = fc_values = [0.0], final_pof = 0
// - NaN from bad parameters  -> 0.0, one WARN per node
// - hazard absent everywhere -> all-zero tree, empty time series
//
// ============================================================================

#pragma once

#include "engine/climate/climate_types.hpp"
#include "engine/fragility/distribution.hpp"
#include "engine/fragility/grid_reducer.hpp"
#include "engine/fragility/reliability_combiner.hpp"
#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace clirisk::fragility {

// uuid -> variable -> PoF per time step (aligned with dataset times)
using PofTimeSeries = std::map<std::string, std::map<std::string, std::vector<double>>>;

struct ComputeStats final {
    std::size_t nodes_visited = 0;
    std::size_t nodes_with_curves = 0;
    std::size_t inherit_nodes = 0;
    std::size_t grid_curves = 0;
    std::size_t empty_series = 0;
    std::size_t warned_nodes = 0;

    EvalDiagnostics eval;
    CombineDiagnostics combine;
};

class FragilityComputer final {
public:
    FragilityComputer(const IDistributionEvaluator& evaluator,
                      const IGridReducer& reducer,
                      const IReliabilityCombiner& combiner);

    // Returns a copy of `tree` with pof, pof_by_var and
    // hazards[hazard].fragility_curves populated on every node.
    hbom::HbomTree compute_for_tree(const hbom::HbomTree& tree,
                                    const std::string& hazard,
                                    const climate::PreparedClimateDataset& data,
                                    ComputeStats* stats = nullptr) const;

    // Runs compute_for_tree, then extracts per-timestep max-over-cells series
    // for every node carrying curves for `hazard`. Nodes without curves are
    // omitted (no model), not zero-filled.
    PofTimeSeries compute_timeseries(const hbom::HbomTree& tree,
                                     const std::string& hazard,
                                     const climate::PreparedClimateDataset& data,
                                     ComputeStats* stats = nullptr) const;

    // Extraction step alone, for a tree already returned by compute_for_tree.
    PofTimeSeries extract_timeseries(const hbom::HbomTree& computed,
                                     const std::string& hazard,
                                     std::size_t n_times) const;

private:
    // Own-curve evaluation for one node; returns the node's own PoF per variable.
    hbom::PofByVar evaluate_own_(hbom::ComponentNode& node,
                                 const std::string& hazard,
                                 const climate::PreparedClimateDataset& data,
                                 ComputeStats& stats) const;

    const IDistributionEvaluator& evaluator_;
    const IGridReducer& reducer_;
    const IReliabilityCombiner& combiner_;
};

} // namespace clirisk::fragility
