/*
===============================================================================
HBOM: Data Model (flat records, curve documents, component tree)
File: cpp/engine/hbom/hbom_types.hpp
===============================================================================

Two shapes live here:

  1) Persistence-shaped inputs
     - FlatHbomRecord: one component with parent_uuid / children_uuids links.
     - FragilityCurveDoc: one fragility parameterization for (component, hazard).

  2) The in-memory tree the fragility engine operates on
     - ComponentNode owns its subcomponents by value (no shared ownership,
       no cycles: reconstruction rejects them).
     - HazardBinding carries the selected curve and, after computation, the
       per-variable / per-grid-cell curves.

Results (`pof_by_var`, `pof`, `fragility_curves`) are filled in on a copy of
the tree by FragilityComputer; the reconstructed tree is never mutated.
===============================================================================
*/

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clirisk::hbom {

using ParamMap = std::map<std::string, double>;
using StringMap = std::map<std::string, std::string>;
using PofByVar = std::map<std::string, double>;

// -----------------------------
// Persistence-shaped inputs
// -----------------------------
struct FlatHbomRecord final {
    std::string uuid;
    std::string label;
    std::string asset_type;
    std::optional<std::string> canonical_component_type;
    std::optional<int> level;
    std::string node_path;
    std::optional<std::string> parent_uuid;   // nullopt => root
    std::vector<std::string> children_uuids;
    StringMap metadata;
};

struct FragilityCurveDoc final {
    std::string component_uuid;
    std::string hazard = "Unknown";
    std::string model;
    ParamMap parameters;
    std::optional<std::string> climate_variable;
    StringMap conditions;
    int priority = 0;
    std::string source = "Unknown";   // provenance.source
};

// -----------------------------
// Engine results
// -----------------------------
// One (component, hazard, variable, grid cell) curve.
struct GridCurve final {
    std::vector<double> x_values;   // raw climate intensity (NaN = missing point)
    std::vector<double> fc_values;  // PoF per time step, each in [0,1]
    double final_pof = 0.0;         // fc_values.back()
};

// cell position in the prepared dataset -> curve
using GridCurveMap = std::map<int, GridCurve>;

// variable -> cell position -> curve
using CurvesByVar = std::map<std::string, GridCurveMap>;

struct HazardBinding final {
    std::string fragility_model;     // lognormal | weibull | logistic | inherit
    ParamMap fragility_params;
    std::optional<std::string> climate_variable;  // nullopt => every dataset variable
    StringMap conditions;
    int priority = 0;
    std::string source = "Unknown";

    CurvesByVar fragility_curves;
};

struct ComponentNode final {
    std::string uuid;
    std::string label;
    std::string component_type = "unknown";
    std::optional<std::string> canonical_component_type;
    std::optional<int> level;
    std::string node_path;
    StringMap metadata;

    std::vector<ComponentNode> subcomponents;
    std::map<std::string, HazardBinding> hazards;

    PofByVar pof_by_var;
    double pof = 0.0;
};

struct HbomTree final {
    std::string sector;
    std::vector<ComponentNode> components;  // roots
};

// Flattened form of a forest (inverse of reconstruction).
struct FlatHbom final {
    std::vector<FlatHbomRecord> records;
    std::vector<FragilityCurveDoc> curves;
};

} // namespace clirisk::hbom
