#include "keel/graph.hpp"

#include "keel/utility.hpp"

#include <algorithm>
#include <functional>
#include <ostream>
#include <queue>

namespace keel {

Result<const BuildRule *> DependencyGraph::add_rule(std::unique_ptr<BuildRule> rule) {
    if (!rule) {
        return fail(ErrorKind::InvalidState, "Cannot add a null rule to the build graph");
    }

    const BuildTarget target = rule->target();
    if (index_.contains(target)) {
        return fail(ErrorKind::DuplicateTarget, "Duplicate build target: " + target.full_name());
    }

    std::vector<size_t> dep_edges;
    dep_edges.reserve(rule->deps().size());
    for (const BuildRule *dep : rule->deps()) {
        // Dependencies must already be nodes, so the only cycle a new node can
        // close is through itself.
        if (dep == rule.get() || dep->target() == target) {
            return fail(ErrorKind::Cycle, "Cycle detected in the build graph: " + target.full_name() + " -> " +
                                              target.full_name());
        }
        auto it = index_.find(dep->target());
        if (it == index_.end() || nodes_[it->second].rule.get() != dep) {
            return fail(ErrorKind::NotFound,
                        target.full_name() + " depends on " + dep->full_name() + ", which is not in the build graph");
        }
        if (std::find(dep_edges.begin(), dep_edges.end(), it->second) == dep_edges.end()) {
            dep_edges.push_back(it->second);
        }
    }

    size_t id = nodes_.size();
    for (size_t dep_id : dep_edges) {
        nodes_[dep_id].out_edges.push_back(id);
    }
    const BuildRule *added = rule.get();
    nodes_.push_back({std::move(rule), std::move(dep_edges), {}});
    index_.emplace(target, id);
    return added;
}

Result<const BuildRule *> DependencyGraph::find(const BuildTarget &target) const {
    if (auto it = index_.find(target); it != index_.end()) {
        return nodes_[it->second].rule.get();
    }
    return fail(ErrorKind::NotFound, "No rule for target: " + target.full_name());
}

std::optional<size_t> DependencyGraph::index_of(const BuildTarget &target) const {
    if (auto it = index_.find(target); it != index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

Result<std::vector<const BuildRule *>> DependencyGraph::transitive_closure(const std::vector<BuildTarget> &roots,
                                                                           const StopPredicate &stop) const {
    std::vector<bool> visited(nodes_.size(), false);
    std::vector<size_t> stack;

    for (const auto &root : roots) {
        auto id = index_of(root);
        if (!id) {
            return fail(ErrorKind::NotFound, "No rule for target: " + root.full_name());
        }
        if (!visited[*id]) {
            visited[*id] = true;
            stack.push_back(*id);
        }
    }

    std::vector<size_t> reached;
    while (!stack.empty()) {
        size_t u = stack.back();
        stack.pop_back();
        reached.push_back(u);

        if (stop && stop(*nodes_[u].rule))
            continue;

        for (size_t v : nodes_[u].dep_edges) {
            if (!visited[v]) {
                visited[v] = true;
                stack.push_back(v);
            }
        }
    }

    std::vector<const BuildRule *> result;
    result.reserve(reached.size());
    for (size_t id : reached) {
        result.push_back(nodes_[id].rule.get());
    }
    std::sort(result.begin(), result.end(),
              [](const BuildRule *a, const BuildRule *b) { return a->target() < b->target(); });
    return result;
}

std::vector<const BuildRule *> DependencyGraph::topological_order() const {
    std::vector<size_t> in_degrees(nodes_.size(), 0);
    for (size_t i = 0; i < nodes_.size(); ++i) {
        in_degrees[i] = nodes_[i].dep_edges.size();
    }

    auto later = [this](size_t a, size_t b) { return nodes_[b].rule->target() < nodes_[a].rule->target(); };
    std::priority_queue<size_t, std::vector<size_t>, decltype(later)> ready(later);

    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (in_degrees[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<const BuildRule *> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t u = ready.top();
        ready.pop();
        order.push_back(nodes_[u].rule.get());
        for (size_t v : nodes_[u].out_edges) {
            if (--in_degrees[v] == 0) {
                ready.push(v);
            }
        }
    }
    return order;
}

std::vector<const BuildRule *> DependencyGraph::dependents(const BuildRule &rule) const {
    std::vector<const BuildRule *> result;
    auto id = index_of(rule.target());
    if (!id)
        return result;

    for (size_t v : nodes_[*id].out_edges) {
        result.push_back(nodes_[v].rule.get());
    }
    std::sort(result.begin(), result.end(),
              [](const BuildRule *a, const BuildRule *b) { return a->target() < b->target(); });
    return result;
}

void DependencyGraph::write_dot(std::ostream &out, const std::function<std::string(const BuildRule &)> &fill) const {
    out << "digraph keel_build {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i = 0; i < nodes_.size(); ++i) {
        const BuildRule &rule = *nodes_[i].rule;
        out << "  n" << i << " [label=\"" << rule.full_name() << "\\n" << rule.type() << "\", fillcolor=\""
            << fill(rule) << "\"];\n";

        // Edges point from a dependency to the rule that consumes it.
        for (size_t dependent : nodes_[i].out_edges) {
            out << "  n" << i << " -> n" << dependent << ";\n";
        }
    }
    out << "}\n";
}

Result<std::set<std::filesystem::path>> collect_library_outputs(const DependencyGraph &graph,
                                                                const std::vector<BuildTarget> &roots,
                                                                const std::set<BuildTarget> &exclude) {
    std::set<BuildTarget> root_set(roots.begin(), roots.end());
    auto closure = graph.transitive_closure(roots, [&](const BuildRule &rule) {
        return !root_set.contains(rule.target()) && rule.installable().has_value();
    });
    if (!closure)
        return std::unexpected(closure.error());

    std::set<std::filesystem::path> outputs;
    for (const BuildRule *rule : *closure) {
        if (!rule->is_library() || exclude.contains(rule->target()))
            continue;
        // A separately packaged sub-app is a boundary: neither it nor its deps are collected.
        if (!root_set.contains(rule->target()) && rule->installable())
            continue;
        for (auto &out : rule->outputs()) {
            outputs.insert(std::move(out));
        }
    }
    return outputs;
}

} // namespace keel
