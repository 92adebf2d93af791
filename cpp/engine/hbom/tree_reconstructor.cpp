/*
===============================================================================
HBOM: Tree Reconstructor
File: cpp/engine/hbom/tree_reconstructor.cpp
===============================================================================
*/

#include "engine/hbom/tree_reconstructor.hpp"

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace clirisk::hbom {

namespace {

using CurvesByHazard = std::map<std::string, std::vector<const FragilityCurveDoc*>>;

struct Builder final {
    const std::vector<FlatHbomRecord>& flat;
    const ICurveSelector& selector;
    const ReconstructOptions& opt;
    ReconstructReport& rep;

    std::unordered_map<std::string, std::size_t> index;            // uuid -> record
    std::unordered_map<std::string, std::string> parent_of;        // accepted links
    std::unordered_map<std::string, std::vector<std::string>> children_of;
    std::unordered_map<std::string, CurvesByHazard> curves;

    const FlatHbomRecord& rec(const std::string& uuid) const { return flat[index.at(uuid)]; }

    void index_records(std::vector<std::size_t>& kept) {
        for (std::size_t i = 0; i < flat.size(); ++i) {
            if (!index.emplace(flat[i].uuid, i).second) {
                rep.duplicate_uuids++;
                continue;
            }
            kept.push_back(i);
        }
    }

    void link(const std::vector<std::size_t>& kept) {
        std::unordered_map<std::string, std::vector<std::string>> claims;
        std::vector<std::string> claimed_order;

        for (std::size_t i : kept) {
            const FlatHbomRecord& p = flat[i];
            for (const auto& c : p.children_uuids) {
                auto it = index.find(c);
                if (it == index.end()) {
                    rep.dangling_children++;
                    continue;
                }
                CLIRISK_ENSURE(c != p.uuid, ErrorCode::kInvariant,
                               "HBOM component lists itself as a child: " + c);
                if (!flat[it->second].parent_uuid) {
                    rep.rejected_links++;
                    continue;
                }
                auto& cl = claims[c];
                if (std::find(cl.begin(), cl.end(), p.uuid) != cl.end()) {
                    rep.rejected_links++;
                    continue;
                }
                if (cl.empty()) claimed_order.push_back(c);
                cl.push_back(p.uuid);
            }
        }

        for (const auto& c : claimed_order) {
            const auto& cl = claims[c];
            const std::string& declared = *rec(c).parent_uuid;
            auto own = std::find(cl.begin(), cl.end(), declared);
            parent_of[c] = (own != cl.end()) ? *own : cl.front();
            rep.rejected_links += cl.size() - 1;
        }

        // Accepted children keep the parent's listing order.
        for (std::size_t i : kept) {
            const FlatHbomRecord& p = flat[i];
            for (const auto& c : p.children_uuids) {
                auto it = parent_of.find(c);
                if (it == parent_of.end() || it->second != p.uuid) continue;
                auto& kids = children_of[p.uuid];
                if (std::find(kids.begin(), kids.end(), c) == kids.end()) {
                    kids.push_back(c);
                    rep.linked_children++;
                }
            }
        }

        for (std::size_t i : kept) {
            const FlatHbomRecord& r = flat[i];
            if (r.parent_uuid && parent_of.find(r.uuid) == parent_of.end()) rep.orphaned_nodes++;
        }
    }

    void reject_cycles() const {
        // 0 = unvisited, 1 = on current walk, 2 = known acyclic
        std::unordered_map<std::string, int> state;
        std::vector<std::string> path;

        for (const auto& kv : parent_of) {
            path.clear();
            std::string cur = kv.first;
            while (true) {
                int& st = state[cur];
                if (st == 2) break;
                CLIRISK_ENSURE(st != 1, ErrorCode::kInvariant,
                               "cyclic parent/child reference in HBOM at component " + cur);
                st = 1;
                path.push_back(cur);
                auto p = parent_of.find(cur);
                if (p == parent_of.end()) break;
                cur = p->second;
            }
            for (const auto& u : path) state[u] = 2;
        }
    }

    void group_curves(const std::vector<FragilityCurveDoc>& docs) {
        for (const auto& d : docs) {
            if (d.component_uuid.empty() || index.find(d.component_uuid) == index.end()) {
                rep.curves_unmatched++;
                continue;
            }
            curves[d.component_uuid][d.hazard].push_back(&d);
        }
    }

    void attach_curves(const FlatHbomRecord& r, ComponentNode& node) {
        auto it = curves.find(r.uuid);
        if (it == curves.end()) return;

        for (const auto& hz : it->second) {
            const auto& cands = hz.second;
            std::size_t k = selector.select(r, cands);
            if (k >= cands.size()) k = 0;
            const FragilityCurveDoc& d = *cands[k];

            HazardBinding b;
            b.fragility_model = d.model;
            b.fragility_params = d.parameters;
            b.climate_variable = d.climate_variable;
            b.conditions = d.conditions;
            b.priority = d.priority;
            b.source = d.source;
            node.hazards[hz.first] = std::move(b);

            rep.curves_attached++;
            rep.curves_shadowed += cands.size() - 1;
        }
        if (!node.hazards.empty()) rep.components_with_curves++;
    }

    ComponentNode materialize(const std::string& uuid, std::size_t depth) {
        CLIRISK_ENSURE(depth <= opt.max_depth, ErrorCode::kOutOfRange,
                       "HBOM nesting exceeds max_depth at component " + uuid);

        const FlatHbomRecord& r = rec(uuid);
        ComponentNode node;
        node.uuid = r.uuid;
        node.label = r.label;
        node.component_type = r.asset_type.empty() ? std::string("unknown") : r.asset_type;
        node.canonical_component_type = r.canonical_component_type;
        node.level = r.level;
        node.node_path = r.node_path;
        node.metadata = r.metadata;
        attach_curves(r, node);

        auto kids = children_of.find(uuid);
        if (kids != children_of.end()) {
            node.subcomponents.reserve(kids->second.size());
            for (const auto& c : kids->second) {
                node.subcomponents.push_back(materialize(c, depth + 1));
            }
        }
        return node;
    }
};

void flatten_node(const ComponentNode& n, const std::string* parent, FlatHbom& out) {
    FlatHbomRecord r;
    r.uuid = n.uuid;
    r.label = n.label;
    r.asset_type = n.component_type;
    r.canonical_component_type = n.canonical_component_type;
    r.level = n.level;
    r.node_path = n.node_path;
    if (parent) r.parent_uuid = *parent;
    r.metadata = n.metadata;
    for (const auto& c : n.subcomponents) r.children_uuids.push_back(c.uuid);
    out.records.push_back(std::move(r));

    for (const auto& hz : n.hazards) {
        FragilityCurveDoc d;
        d.component_uuid = n.uuid;
        d.hazard = hz.first;
        d.model = hz.second.fragility_model;
        d.parameters = hz.second.fragility_params;
        d.climate_variable = hz.second.climate_variable;
        d.conditions = hz.second.conditions;
        d.priority = hz.second.priority;
        d.source = hz.second.source;
        out.curves.push_back(std::move(d));
    }

    for (const auto& c : n.subcomponents) flatten_node(c, &n.uuid, out);
}

} // namespace

std::vector<ComponentNode> reconstruct_tree(const std::vector<FlatHbomRecord>& flat_nodes,
                                            const std::vector<FragilityCurveDoc>& fragility_curves,
                                            const ICurveSelector& selector,
                                            const ReconstructOptions& opt,
                                            ReconstructReport* report) {
    ReconstructReport rep;
    rep.flat_nodes = flat_nodes.size();

    std::vector<ComponentNode> roots;
    if (flat_nodes.empty()) {
        if (report) *report = rep;
        return roots;
    }

    Builder b{flat_nodes, selector, opt, rep, {}, {}, {}, {}};

    std::vector<std::size_t> kept;
    b.index_records(kept);
    b.link(kept);
    b.reject_cycles();
    b.group_curves(fragility_curves);

    for (std::size_t i : kept) {
        if (!flat_nodes[i].parent_uuid) roots.push_back(b.materialize(flat_nodes[i].uuid, 0));
    }
    rep.roots = roots.size();

    {
        std::ostringstream oss;
        oss << "hbom: reconstructed " << rep.roots << " root trees from " << rep.flat_nodes
            << " flat nodes; merged fragilities for " << rep.components_with_curves << " components";
        log(LogLevel::INFO, oss.str());
    }
    if (rep.dropped_references() > 0 || rep.curves_unmatched > 0) {
        std::ostringstream oss;
        oss << "hbom: dropped " << rep.duplicate_uuids << " duplicate uuids, "
            << rep.dangling_children << " dangling child refs, "
            << rep.rejected_links << " conflicting links, "
            << rep.orphaned_nodes << " orphaned nodes, "
            << rep.curves_unmatched << " unmatched curve documents";
        log(LogLevel::WARN, oss.str());
    }

    if (report) *report = rep;
    return roots;
}

std::vector<ComponentNode> reconstruct_tree(const std::vector<FlatHbomRecord>& flat_nodes,
                                            const std::vector<FragilityCurveDoc>& fragility_curves) {
    const FirstCurveWins first;
    return reconstruct_tree(flat_nodes, fragility_curves, first);
}

void filter_hazard(std::vector<ComponentNode>& roots, const std::string& hazard) {
    std::vector<ComponentNode*> pending;
    for (auto& r : roots) pending.push_back(&r);

    while (!pending.empty()) {
        ComponentNode* n = pending.back();
        pending.pop_back();

        for (auto it = n->hazards.begin(); it != n->hazards.end();) {
            if (it->first == hazard) ++it;
            else it = n->hazards.erase(it);
        }
        for (auto& c : n->subcomponents) pending.push_back(&c);
    }
}

HbomTree build_hbom_tree(const std::string& sector,
                         const std::vector<FlatHbomRecord>& flat_nodes,
                         const std::vector<FragilityCurveDoc>& fragility_curves,
                         const std::string& hazard,
                         const ICurveSelector& selector,
                         const ReconstructOptions& opt,
                         ReconstructReport* report) {
    HbomTree tree{sector, reconstruct_tree(flat_nodes, fragility_curves, selector, opt, report)};
    if (!hazard.empty()) filter_hazard(tree.components, hazard);
    return tree;
}

FlatHbom flatten(const std::vector<ComponentNode>& roots) {
    FlatHbom out;
    for (const auto& r : roots) flatten_node(r, nullptr, out);
    return out;
}

const ComponentNode* find_component(const std::vector<ComponentNode>& roots,
                                    const std::string& uuid) {
    std::vector<const ComponentNode*> pending;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) pending.push_back(&*it);
    while (!pending.empty()) {
        const ComponentNode* n = pending.back();
        pending.pop_back();
        if (n->uuid == uuid) return n;
        for (auto it = n->subcomponents.rbegin(); it != n->subcomponents.rend(); ++it) {
            pending.push_back(&*it);
        }
    }
    return nullptr;
}

std::size_t count_nodes(const std::vector<ComponentNode>& roots) noexcept {
    std::size_t n = 0;
    for (const auto& r : roots) n += 1 + count_nodes(r.subcomponents);
    return n;
}

} // namespace clirisk::hbom
