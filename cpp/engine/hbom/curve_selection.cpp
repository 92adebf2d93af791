// ============================================================================
// HBOM: Fragility Curve Selection Strategies
// File: cpp/engine/hbom/curve_selection.cpp
// ============================================================================

#include "engine/hbom/curve_selection.hpp"

namespace clirisk::hbom {

bool conditions_match(const StringMap& conditions, const StringMap& metadata) noexcept {
    for (const auto& kv : conditions) {
        auto it = metadata.find(kv.first);
        if (it == metadata.end() || it->second != kv.second) return false;
    }
    return true;
}

std::size_t FirstCurveWins::select(const FlatHbomRecord& /*component*/,
                                   const std::vector<const FragilityCurveDoc*>& /*candidates*/) const {
    return 0;
}

std::size_t HighestPriorityWins::select(const FlatHbomRecord& /*component*/,
                                        const std::vector<const FragilityCurveDoc*>& candidates) const {
    std::size_t best = 0;
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        if (candidates[i]->priority > candidates[best]->priority) best = i;
    }
    return best;
}

std::size_t ConditionMatchWins::select(const FlatHbomRecord& component,
                                       const std::vector<const FragilityCurveDoc*>& candidates) const {
    std::size_t best = 0;
    bool best_match = conditions_match(candidates[0]->conditions, component.metadata);
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        const bool m = conditions_match(candidates[i]->conditions, component.metadata);
        if (m && !best_match) {
            best = i;
            best_match = true;
        } else if (m == best_match && candidates[i]->priority > candidates[best]->priority) {
            best = i;
        }
    }
    return best;
}

std::unique_ptr<ICurveSelector> make_curve_selector(CurveSelection s) {
    switch (s) {
        case CurveSelection::kPriority:   return std::make_unique<HighestPriorityWins>();
        case CurveSelection::kConditions: return std::make_unique<ConditionMatchWins>();
        case CurveSelection::kFirst:
        default:                          return std::make_unique<FirstCurveWins>();
    }
}

} // namespace clirisk::hbom
