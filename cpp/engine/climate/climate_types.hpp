/*
===============================================================================
Climate: Prepared Climate Dataset
File: cpp/engine/climate/climate_types.hpp
===============================================================================

The fetch/subset/aggregate pipeline hands the engine one prepared dataset per
request:
  - `variables`: ordered variable codes (tas, hurs, sfcWind, ...)
  - `times`: ISO-8601 timestamps shared by every grid cell and variable
  - `cells`: one entry per grid cell, each with a time-aligned series per
    variable.

Missing points are NaN ("NaN-as-unset"; JSON null on the wire). A variable
that is null for a whole cell is simply absent from that cell's `climate` map.
===============================================================================
*/

#pragma once

#include "engine/core/numeric.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace clirisk::climate {

using Series = std::vector<double>;

struct GridBounds final {
    double min_lat = kNaN;
    double max_lat = kNaN;
    double min_lon = kNaN;
    double max_lon = kNaN;
};

struct GridCell final {
    int grid_index = 0;  // input identifier; computed curves are keyed by position in `cells`
    GridBounds bounds;
    std::map<std::string, Series> climate;

    // nullptr when the variable is absent for this cell.
    const Series* series(const std::string& var) const noexcept {
        auto it = climate.find(var);
        return (it == climate.end()) ? nullptr : &it->second;
    }
};

struct PreparedClimateDataset final {
    std::vector<std::string> variables;
    std::vector<std::string> times;
    std::vector<GridCell> cells;

    bool has_variable(const std::string& var) const noexcept {
        for (const auto& v : variables) {
            if (v == var) return true;
        }
        return false;
    }

    // Number of per-cell series whose length differs from `times`.
    std::size_t misaligned_series() const noexcept {
        std::size_t n = 0;
        for (const auto& c : cells) {
            for (const auto& kv : c.climate) {
                if (kv.second.size() != times.size()) ++n;
            }
        }
        return n;
    }
};

} // namespace clirisk::climate
