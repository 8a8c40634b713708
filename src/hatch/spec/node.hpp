#pragma once

#include "./arch.hpp"
#include "./deptype.hpp"
#include "./flags.hpp"

#include <hatch/util/fs/path.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace hatch {

class package_recipe;
class compiler_adapter;

enum class traversal_order {
    pre,
    post,
};

struct traverse_options {
    /// Which edges to follow
    dep_type deptypes = dep_type::all;
    traversal_order order = traversal_order::pre;
    /// Whether the starting node is part of the result
    bool root = true;
};

/**
 * @brief A concrete node of a resolved dependency DAG.
 *
 * Nodes are produced by the resolver and are not modified once the DAG is concrete. Edges point at
 * nodes owned by the same spec_dag.
 */
class spec_node {
public:
    struct edge {
        const spec_node* node;
        dep_type         types;
    };

    std::string name;
    std::string version;
    std::string hash;

    fs::path  prefix;
    arch_spec arch;

    /// Compiler name and version, e.g. "gcc@9.3.0"
    std::string compiler_spec;
    flag_map    compiler_flags;

    /// Modules to load when this node is part of a build (externally-provided packages)
    std::vector<std::string> external_modules;

    std::shared_ptr<const compiler_adapter> compiler;
    std::shared_ptr<const package_recipe>   recipe;

    void add_dependency(const spec_node& dep, dep_type types);

    const std::vector<edge>& edges() const noexcept { return _edges; }

    /**
     * @brief The direct dependencies reached through an edge of any of the given types, ordered by
     * name.
     */
    [[nodiscard]] std::vector<const spec_node*> dependencies(dep_type types = dep_type::all) const;

    /**
     * @brief Walk the DAG from this node. Each node is visited once, children in name order.
     */
    [[nodiscard]] std::vector<const spec_node*> traverse(traverse_options opts = {}) const;

    /**
     * @brief The dependency with the given name anywhere below this node, or nullptr.
     */
    [[nodiscard]] const spec_node* find(std::string_view name) const noexcept;

    /**
     * @brief A short human-readable identity: "name@version%compiler arch=... /hash7"
     */
    [[nodiscard]] std::string short_spec() const;

    /**
     * @brief "name-hash7", used to correlate debug logs.
     */
    [[nodiscard]] std::string log_id() const;

    /**
     * @brief The node's recipe. Throws if the node has none.
     */
    const package_recipe& package() const;

    const compiler_adapter& toolchain() const;

    /// Populated through add_dependency(). Public only so that nodes remain aggregates.
    std::vector<edge> _edges = {};
};

/**
 * @brief Owning storage for the nodes of one resolved DAG.
 */
class spec_dag {
    std::deque<spec_node> _nodes;

public:
    spec_node& add(spec_node node) { return _nodes.emplace_back(std::move(node)); }

    auto begin() const noexcept { return _nodes.begin(); }
    auto end() const noexcept { return _nodes.end(); }
};

}  // namespace hatch
