/*
===============================================================================
HBOM: Fragility Curve Selection Strategies
File: cpp/engine/hbom/curve_selection.hpp
===============================================================================

When several curve documents target the same (component, hazard) exactly one
is attached. The strategy is pluggable:

  - FirstCurveWins       document order (default)
  - HighestPriorityWins  largest `priority`; ties keep document order
  - ConditionMatchWins   documents whose every `conditions` entry equals the
                         component's metadata value rank first, then priority,
                         then document order
===============================================================================
*/

#pragma once

#include "engine/core/settings.hpp"
#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace clirisk::hbom {

class ICurveSelector {
public:
    virtual ~ICurveSelector() = default;

    // `candidates` is non-empty and in document order. Returns an index into it.
    virtual std::size_t select(const FlatHbomRecord& component,
                               const std::vector<const FragilityCurveDoc*>& candidates) const = 0;
};

class FirstCurveWins final : public ICurveSelector {
public:
    std::size_t select(const FlatHbomRecord& component,
                       const std::vector<const FragilityCurveDoc*>& candidates) const override;
};

class HighestPriorityWins final : public ICurveSelector {
public:
    std::size_t select(const FlatHbomRecord& component,
                       const std::vector<const FragilityCurveDoc*>& candidates) const override;
};

class ConditionMatchWins final : public ICurveSelector {
public:
    std::size_t select(const FlatHbomRecord& component,
                       const std::vector<const FragilityCurveDoc*>& candidates) const override;
};

// True when every condition key exists in `metadata` with an equal value.
// Empty conditions match any component.
bool conditions_match(const StringMap& conditions, const StringMap& metadata) noexcept;

std::unique_ptr<ICurveSelector> make_curve_selector(CurveSelection s);

} // namespace clirisk::hbom
