/*
===============================================================================
Climate: Hazard Catalog
File: cpp/engine/climate/hazard_catalog.hpp
===============================================================================

Which climate variables each hazard draws on. Base variables come from the
climate data source; composite variables are derived locally through
CompositeRegistry.
===============================================================================
*/

#pragma once

#include <string>
#include <vector>

namespace clirisk::climate {

struct HazardDefinition final {
    std::string name;
    std::string display_name;
    std::vector<std::string> base_variables;
    std::vector<std::string> composite_variables;
    std::string description;

    std::vector<std::string> all_variables() const {
        std::vector<std::string> v = base_variables;
        v.insert(v.end(), composite_variables.begin(), composite_variables.end());
        return v;
    }
};

class HazardCatalog final {
public:
    void add(HazardDefinition def);

    // nullptr when `name` is not cataloged.
    const HazardDefinition* find(const std::string& name) const noexcept;

    // Throws Error{kInvalidArgument} listing the known hazards.
    const HazardDefinition& get(const std::string& name) const;

    std::vector<std::string> names() const;
    const std::vector<HazardDefinition>& all() const noexcept { return defs_; }

private:
    std::vector<HazardDefinition> defs_;
};

// Heat Stress, Drought, Wind.
HazardCatalog make_default_hazard_catalog();

} // namespace clirisk::climate
