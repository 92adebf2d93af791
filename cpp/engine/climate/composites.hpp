/*
===============================================================================
Climate: Composite Variable Registry
File: cpp/engine/climate/composites.hpp
===============================================================================

A composite variable is derived pointwise from base variables already present
in a prepared dataset (heat index from tas + hurs). The registry is an
explicit object built once at startup and passed by reference.

Missing inputs (absent series or NaN points) yield NaN output points.
===============================================================================
*/

#pragma once

#include "engine/climate/climate_types.hpp"
#include "engine/climate/hazard_catalog.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace clirisk::climate {

// Inputs arrive in the order of CompositeSpec::inputs.
using CompositeFn = std::function<double(const std::vector<double>& inputs)>;

struct CompositeSpec final {
    std::vector<std::string> inputs;
    CompositeFn fn;
    std::string units;
    std::string long_name;
};

class CompositeRegistry final {
public:
    // Replaces any previous registration under `name`.
    void register_composite(const std::string& name, CompositeSpec spec);

    bool has(const std::string& name) const noexcept;
    std::vector<std::string> names() const;

    // Throws Error{kInvalidArgument} for an unknown name.
    const CompositeSpec& get(const std::string& name) const;

    // Derived series for one cell. Empty when any input series is absent.
    Series compute(const std::string& name, const GridCell& cell) const;

    // Adds `name` to dataset.variables (if absent) and to every cell.
    void apply(const std::string& name, PreparedClimateDataset& dataset) const;

private:
    std::map<std::string, CompositeSpec> specs_;
};

// Rothfusz heat index. tas in K, hurs in %, result in degrees F.
double heat_index_f(double tas_k, double hurs_pct) noexcept;

// Applies each of the hazard's composite variables whose inputs are all listed
// in dataset.variables. Returns the names applied.
std::vector<std::string> apply_hazard_composites(const CompositeRegistry& registry,
                                                 const HazardDefinition& hazard,
                                                 PreparedClimateDataset& dataset);

// Registry with every built-in composite ("hi").
CompositeRegistry make_default_composite_registry();

} // namespace clirisk::climate
