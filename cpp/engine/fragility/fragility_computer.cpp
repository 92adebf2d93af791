// ============================================================================
// Fragility: Fragility Computer
// File: cpp/engine/fragility/fragility_computer.cpp
// ============================================================================

#include "engine/fragility/fragility_computer.hpp"

#include "engine/core/logging.hpp"

#include <sstream>
#include <utility>

namespace clirisk::fragility {

namespace {

struct Frame final {
    hbom::ComponentNode* node = nullptr;
    std::size_t next_child = 0;
};

hbom::GridCurve zero_curve() {
    hbom::GridCurve c;
    c.x_values = {0.0};
    c.fc_values = {0.0};
    c.final_pof = 0.0;
    return c;
}

} // namespace

FragilityComputer::FragilityComputer(const IDistributionEvaluator& evaluator,
                                     const IGridReducer& reducer,
                                     const IReliabilityCombiner& combiner)
    : evaluator_(evaluator), reducer_(reducer), combiner_(combiner) {}

hbom::PofByVar FragilityComputer::evaluate_own_(hbom::ComponentNode& node,
                                                const std::string& hazard,
                                                const climate::PreparedClimateDataset& data,
                                                ComputeStats& stats) const {
    hbom::PofByVar own;

    auto hit = node.hazards.find(hazard);
    if (hit == node.hazards.end()) return own;

    hbom::HazardBinding& binding = hit->second;
    binding.fragility_curves.clear();
    if (binding.fragility_model.empty()) return own;

    const FragilityModel model = parse_fragility_model(binding.fragility_model);
    if (model == FragilityModel::Inherit) {
        stats.inherit_nodes++;
        return own;
    }

    EvalDiagnostics diag;
    for (const auto& var : data.variables) {
        if (binding.climate_variable && var != *binding.climate_variable) continue;

        // Keyed by position in data.cells: every cell gets its own curve even
        // when input grid_index values repeat.
        hbom::GridCurveMap& grids = binding.fragility_curves[var];
        for (std::size_t pos = 0; pos < data.cells.size(); ++pos) {
            const climate::Series* series = data.cells[pos].series(var);

            hbom::GridCurve curve;
            if (!series || series->empty()) {
                curve = zero_curve();
                stats.empty_series++;
            } else {
                curve.x_values = *series;
                curve.fc_values = evaluator_.evaluate(binding.fragility_model,
                                                      binding.fragility_params,
                                                      *series, &diag);
                if (curve.fc_values.empty()) curve.fc_values.push_back(0.0);
                curve.final_pof = curve.fc_values.back();
            }
            grids[static_cast<int>(pos)] = std::move(curve);
            stats.grid_curves++;
        }
        own[var] = reducer_.reduce_final_pof(grids);
    }

    if (!binding.fragility_curves.empty()) stats.nodes_with_curves++;

    if (diag.has_warnings()) {
        stats.warned_nodes++;
        std::ostringstream oss;
        oss << "fragility: component " << node.uuid << " hazard='" << hazard << "'";
        if (diag.unknown_model > 0) {
            oss << " unknown model '" << binding.fragility_model << "' ("
                << diag.unknown_model << " series zero-filled)";
        }
        if (diag.nonfinite_coerced > 0) {
            oss << " " << diag.nonfinite_coerced << " non-finite PoF values coerced to 0";
        }
        log(LogLevel::WARN, oss.str());
    }
    stats.eval.merge(diag);
    return own;
}

hbom::HbomTree FragilityComputer::compute_for_tree(const hbom::HbomTree& tree,
                                                   const std::string& hazard,
                                                   const climate::PreparedClimateDataset& data,
                                                   ComputeStats* stats_out) const {
    {
        std::ostringstream oss;
        oss << "fragility: computing hazard='" << hazard << "' over "
            << data.variables.size() << " variables, " << data.cells.size() << " grid cells, "
            << tree.components.size() << " roots";
        log(LogLevel::INFO, oss.str());
    }

    hbom::HbomTree out = tree;
    ComputeStats stats;

    // Children vectors are never resized during the walk, so node pointers stay valid.
    std::vector<Frame> stack;
    for (auto& root : out.components) {
        stack.push_back(Frame{&root, 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            hbom::ComponentNode* node = top.node;

            if (top.next_child < node->subcomponents.size()) {
                hbom::ComponentNode* child = &node->subcomponents[top.next_child];
                top.next_child++;
                stack.push_back(Frame{child, 0});
                continue;
            }

            // All children combined: own curves, then combine.
            stats.nodes_visited++;
            const hbom::PofByVar own = evaluate_own_(*node, hazard, data, stats);

            std::vector<hbom::PofByVar> child_pofs;
            child_pofs.reserve(node->subcomponents.size());
            for (const auto& c : node->subcomponents) child_pofs.push_back(c.pof_by_var);

            CombineDiagnostics cdiag;
            CombinedPof combined = combiner_.combine(own, child_pofs, &cdiag);
            if (cdiag.nonfinite_coerced > 0) {
                std::ostringstream oss;
                oss << "fragility: component " << node->uuid << " "
                    << cdiag.nonfinite_coerced << " non-finite PoF inputs coerced to 0 while combining";
                log(LogLevel::WARN, oss.str());
            }
            stats.combine.merge(cdiag);

            node->pof_by_var = std::move(combined.pof_by_var);
            node->pof = combined.pof;

            stack.pop_back();
        }
    }

    {
        std::ostringstream oss;
        oss << "fragility: visited " << stats.nodes_visited << " nodes, "
            << stats.nodes_with_curves << " with curves, " << stats.grid_curves << " grid curves";
        log(LogLevel::INFO, oss.str());
    }

    if (stats_out) *stats_out = stats;
    return out;
}

PofTimeSeries FragilityComputer::extract_timeseries(const hbom::HbomTree& computed,
                                                    const std::string& hazard,
                                                    std::size_t n_times) const {
    PofTimeSeries out;

    std::vector<const hbom::ComponentNode*> pending;
    for (auto it = computed.components.rbegin(); it != computed.components.rend(); ++it) {
        pending.push_back(&*it);
    }

    while (!pending.empty()) {
        const hbom::ComponentNode* node = pending.back();
        pending.pop_back();

        auto hit = node->hazards.find(hazard);
        if (hit != node->hazards.end() && !hit->second.fragility_curves.empty()) {
            auto& series = out[node->uuid];
            for (const auto& kv : hit->second.fragility_curves) {
                series[kv.first] = reducer_.reduce_per_timestep(kv.second, n_times);
            }
        }

        for (auto it = node->subcomponents.rbegin(); it != node->subcomponents.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
    return out;
}

PofTimeSeries FragilityComputer::compute_timeseries(const hbom::HbomTree& tree,
                                                    const std::string& hazard,
                                                    const climate::PreparedClimateDataset& data,
                                                    ComputeStats* stats) const {
    const hbom::HbomTree computed = compute_for_tree(tree, hazard, data, stats);
    PofTimeSeries ts = extract_timeseries(computed, hazard, data.times.size());

    std::ostringstream oss;
    oss << "fragility: extracted time series for " << ts.size() << " components";
    log(LogLevel::INFO, oss.str());
    return ts;
}

} // namespace clirisk::fragility
