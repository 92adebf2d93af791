// ============================================================================
// Climate: Composite Variable Registry
// File: cpp/engine/climate/composites.cpp
// ============================================================================

#include "engine/climate/composites.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace clirisk::climate {

void CompositeRegistry::register_composite(const std::string& name, CompositeSpec spec) {
    CLIRISK_ENSURE(!name.empty(), ErrorCode::kInvalidArgument, "composite name empty");
    CLIRISK_ENSURE(static_cast<bool>(spec.fn), ErrorCode::kInvalidArgument,
                   "composite '" + name + "' has no transform");
    specs_[name] = std::move(spec);
}

bool CompositeRegistry::has(const std::string& name) const noexcept {
    return specs_.find(name) != specs_.end();
}

std::vector<std::string> CompositeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto& kv : specs_) out.push_back(kv.first);
    return out;
}

const CompositeSpec& CompositeRegistry::get(const std::string& name) const {
    auto it = specs_.find(name);
    if (it == specs_.end()) CLIRISK_THROW(ErrorCode::kInvalidArgument, "Unknown composite variable: " + name);
    return it->second;
}

Series CompositeRegistry::compute(const std::string& name, const GridCell& cell) const {
    const CompositeSpec& spec = get(name);

    std::vector<const Series*> in;
    in.reserve(spec.inputs.size());
    std::size_t n = 0;
    for (const auto& v : spec.inputs) {
        const Series* s = cell.series(v);
        if (!s || s->empty()) return {};
        n = in.empty() ? s->size() : std::min(n, s->size());
        in.push_back(s);
    }

    Series out(n, kNaN);
    std::vector<double> args(in.size());
    for (std::size_t t = 0; t < n; ++t) {
        bool missing = false;
        for (std::size_t k = 0; k < in.size(); ++k) {
            args[k] = (*in[k])[t];
            if (std::isnan(args[k])) missing = true;
        }
        if (!missing) out[t] = spec.fn(args);
    }
    return out;
}

void CompositeRegistry::apply(const std::string& name, PreparedClimateDataset& dataset) const {
    (void)get(name);

    std::size_t missing_cells = 0;
    for (auto& cell : dataset.cells) {
        Series s = compute(name, cell);
        if (s.empty()) {
            ++missing_cells;
            cell.climate.erase(name);
            continue;
        }
        cell.climate[name] = std::move(s);
    }
    if (!dataset.has_variable(name)) dataset.variables.push_back(name);

    if (missing_cells > 0) {
        log(LogLevel::WARN, "composites: '" + name + "' missing inputs in " +
                                std::to_string(missing_cells) + " grid cells");
    }
}

std::vector<std::string> apply_hazard_composites(const CompositeRegistry& registry,
                                                 const HazardDefinition& hazard,
                                                 PreparedClimateDataset& dataset) {
    std::vector<std::string> applied;
    for (const auto& name : hazard.composite_variables) {
        if (!registry.has(name)) {
            log(LogLevel::WARN, "composites: hazard '" + hazard.name + "' names unregistered composite '" + name + "'");
            continue;
        }
        bool inputs_present = true;
        for (const auto& in : registry.get(name).inputs) {
            if (!dataset.has_variable(in)) inputs_present = false;
        }
        if (!inputs_present) {
            log(LogLevel::DEBUG, "composites: skipping '" + name + "', inputs not in dataset");
            continue;
        }
        registry.apply(name, dataset);
        applied.push_back(name);
    }
    return applied;
}

double heat_index_f(double tas_k, double hurs_pct) noexcept {
    const double T = (tas_k - 273.15) * 9.0 / 5.0 + 32.0;
    const double RH = hurs_pct;
    if (!(T >= 80.0 && RH >= 40.0)) return T;

    return -42.379
           + 2.04901523 * T
           + 10.14333127 * RH
           - 0.22475541 * T * RH
           - 0.00683783 * T * T
           - 0.05481717 * RH * RH
           + 0.00122874 * T * T * RH
           + 0.00085282 * T * RH * RH
           - 0.00000199 * T * T * RH * RH;
}

CompositeRegistry make_default_composite_registry() {
    CompositeRegistry r;

    CompositeSpec hi;
    hi.inputs = {"tas", "hurs"};
    hi.fn = [](const std::vector<double>& a) { return heat_index_f(a[0], a[1]); };
    hi.units = "degF";
    hi.long_name = "Heat Index";
    r.register_composite("hi", std::move(hi));

    return r;
}

} // namespace clirisk::climate
