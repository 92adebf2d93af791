// ============================================================================
// Climate: Hazard Catalog
// File: cpp/engine/climate/hazard_catalog.cpp
// ============================================================================

#include "engine/climate/hazard_catalog.hpp"

#include "engine/core/error.hpp"

#include <utility>

namespace clirisk::climate {

void HazardCatalog::add(HazardDefinition def) {
    CLIRISK_ENSURE(!def.name.empty(), ErrorCode::kInvalidArgument, "hazard name empty");
    for (auto& d : defs_) {
        if (d.name == def.name) {
            d = std::move(def);
            return;
        }
    }
    defs_.push_back(std::move(def));
}

const HazardDefinition* HazardCatalog::find(const std::string& name) const noexcept {
    for (const auto& d : defs_) {
        if (d.name == name) return &d;
    }
    return nullptr;
}

const HazardDefinition& HazardCatalog::get(const std::string& name) const {
    const HazardDefinition* d = find(name);
    if (!d) {
        std::string known;
        for (const auto& x : defs_) {
            if (!known.empty()) known += ", ";
            known += x.name;
        }
        CLIRISK_THROW(ErrorCode::kInvalidArgument, "Unknown hazard: " + name + ". Available: " + known);
    }
    return *d;
}

std::vector<std::string> HazardCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(defs_.size());
    for (const auto& d : defs_) out.push_back(d.name);
    return out;
}

HazardCatalog make_default_hazard_catalog() {
    HazardCatalog c;
    c.add({"Heat Stress", "Heat Stress", {"tas", "hurs"}, {"hi"},
           "Temperature and humidity-based heat stress"});
    c.add({"Drought", "Drought", {"pr", "rsds", "sfcWind"}, {},
           "Precipitation deficit and evapotranspiration"});
    c.add({"Wind", "Extreme Wind", {"sfcWind"}, {},
           "Surface wind speed"});
    return c;
}

} // namespace clirisk::climate
