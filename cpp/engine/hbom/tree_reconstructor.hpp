/*
===============================================================================
HBOM: Tree Reconstructor
File: cpp/engine/hbom/tree_reconstructor.hpp
===============================================================================

Turns flat, persistence-shaped component records into the nested forest the
fragility engine walks, attaching one fragility curve per (component, hazard).

Structural rules:
  - duplicate uuid          -> first record kept, later ones dropped
  - parent_uuid == null     -> root; never linked as anyone's child
  - dangling child uuid     -> dropped
  - child listed by several parents -> attached under its own parent_uuid when
    that parent lists it, else under the first claimant
  - non-root without an accepted parent -> orphan, dropped
  - cycle in parent links   -> Error{kInvariant}
  - nesting > max_depth     -> Error{kOutOfRange}

Drops are counted in ReconstructReport and logged once per batch.
===============================================================================
*/

#pragma once

#include "engine/hbom/curve_selection.hpp"
#include "engine/hbom/hbom_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace clirisk::hbom {

struct ReconstructOptions final {
    std::size_t max_depth = 512;
};

struct ReconstructReport final {
    std::size_t flat_nodes = 0;
    std::size_t roots = 0;
    std::size_t linked_children = 0;

    std::size_t duplicate_uuids = 0;
    std::size_t dangling_children = 0;
    std::size_t rejected_links = 0;   // child is a root, or attached elsewhere
    std::size_t orphaned_nodes = 0;

    std::size_t curves_attached = 0;
    std::size_t curves_unmatched = 0; // component_uuid missing or unknown
    std::size_t curves_shadowed = 0;  // lost the selection for their (component, hazard)
    std::size_t components_with_curves = 0;

    std::size_t dropped_references() const noexcept {
        return duplicate_uuids + dangling_children + rejected_links + orphaned_nodes;
    }
};

std::vector<ComponentNode> reconstruct_tree(const std::vector<FlatHbomRecord>& flat_nodes,
                                            const std::vector<FragilityCurveDoc>& fragility_curves,
                                            const ICurveSelector& selector,
                                            const ReconstructOptions& opt = {},
                                            ReconstructReport* report = nullptr);

// First-curve-wins convenience overload.
std::vector<ComponentNode> reconstruct_tree(const std::vector<FlatHbomRecord>& flat_nodes,
                                            const std::vector<FragilityCurveDoc>& fragility_curves = {});

// Keeps only `hazard` in every node's hazard map. Tree shape is untouched.
void filter_hazard(std::vector<ComponentNode>& roots, const std::string& hazard);

// reconstruct_tree scoped to one hazard: the returned tree carries only
// `hazard` bindings on every node. An empty `hazard` keeps all of them.
HbomTree build_hbom_tree(const std::string& sector,
                         const std::vector<FlatHbomRecord>& flat_nodes,
                         const std::vector<FragilityCurveDoc>& fragility_curves,
                         const std::string& hazard,
                         const ICurveSelector& selector,
                         const ReconstructOptions& opt = {},
                         ReconstructReport* report = nullptr);

// Inverse of reconstruct_tree for uncomputed trees:
// reconstruct_tree(flatten(t).records, flatten(t).curves) == t
FlatHbom flatten(const std::vector<ComponentNode>& roots);

// Depth-first lookup; nullptr when absent.
const ComponentNode* find_component(const std::vector<ComponentNode>& roots,
                                    const std::string& uuid);

std::size_t count_nodes(const std::vector<ComponentNode>& roots) noexcept;

} // namespace clirisk::hbom
