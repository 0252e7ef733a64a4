#pragma once

#include "keel/rule.hpp"
#include "keel/target.hpp"
#include "keel/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace keel {

/**
 * @brief The dependency graph of build rules.
 *
 * Owns the rules (an arena indexed by target). Nodes are only ever added;
 * once resolution is done the graph is treated as read-only and handed out
 * by const reference.
 */
class DependencyGraph {
public:
    struct Node {
        std::unique_ptr<BuildRule> rule;
        std::vector<size_t> dep_edges; ///< Indices of the rule's dependencies, declared order.
        std::vector<size_t> out_edges; ///< Indices of rules that depend on this node.
    };

    using StopPredicate = std::function<bool(const BuildRule &)>;

    DependencyGraph() = default;
    DependencyGraph(DependencyGraph &&) = default;
    DependencyGraph &operator=(DependencyGraph &&) = default;

    /**
     * @brief Registers a rule.
     *
     * Every dependency must already be a node of this graph. Fails with
     * DuplicateTarget, NotFound (dangling dependency) or Cycle (the rule lists
     * itself); the graph is left unchanged on failure.
     */
    Result<const BuildRule *> add_rule(std::unique_ptr<BuildRule> rule);

    Result<const BuildRule *> find(const BuildTarget &target) const;
    bool contains(const BuildTarget &target) const {
        return index_.contains(target);
    }
    std::optional<size_t> index_of(const BuildTarget &target) const;

    /**
     * @brief Rules reachable from `roots`, roots included.
     *
     * A rule for which `stop` returns true is part of the result, but its own
     * dependencies are not followed. Sorted by target.
     */
    Result<std::vector<const BuildRule *>> transitive_closure(const std::vector<BuildTarget> &roots,
                                                              const StopPredicate &stop = {}) const;

    /**
     * @brief All rules, dependencies first.
     *
     * Among rules that are ready at the same time the smallest target comes
     * first, so the order is identical across runs.
     */
    std::vector<const BuildRule *> topological_order() const;

    std::vector<const BuildRule *> dependents(const BuildRule &rule) const;

    const std::vector<Node> &nodes() const {
        return nodes_;
    }
    size_t size() const {
        return nodes_.size();
    }

    /** @brief Graphviz dump; `fill` picks each rule's fill colour. */
    void write_dot(std::ostream &out, const std::function<std::string(const BuildRule &)> &fill) const;

private:
    std::vector<Node> nodes_;
    std::map<BuildTarget, size_t> index_;
};

/**
 * @brief Output paths of the library rules reachable from `roots`.
 *
 * Rules whose target is in `exclude` contribute nothing (their dependencies
 * are still visited). Installable rules other than the roots are packaged on
 * their own, so the walk does not cross into them.
 */
Result<std::set<std::filesystem::path>> collect_library_outputs(const DependencyGraph &graph,
                                                                const std::vector<BuildTarget> &roots,
                                                                const std::set<BuildTarget> &exclude = {});

} // namespace keel
