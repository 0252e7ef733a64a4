#include "keel/resolver.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>

namespace keel {

Result<void> BuildRuleResolver::add(std::unique_ptr<RuleBuilder> builder) {
    if (!builder) {
        return fail(ErrorKind::InvalidState, "Cannot add a null rule builder");
    }
    if (resolved_) {
        return fail(ErrorKind::InvalidState, "Cannot add " + builder->target().full_name() +
                                                 ": resolution already ran");
    }
    const BuildTarget &target = builder->target();
    if (index_.contains(target)) {
        return fail(ErrorKind::DuplicateTarget, "Duplicate build target: " + target.full_name());
    }
    index_.emplace(target, builders_.size());
    builders_.push_back(std::move(builder));
    return {};
}

const BuildRule *BuildRuleResolver::get(const BuildTarget &target) const {
    auto rule = graph_.find(target);
    return rule ? *rule : nullptr;
}

Result<BuildRuleParams> BuildRuleResolver::make_params(const RuleBuilder &builder) const {
    BuildRuleParams params;
    params.target = builder.target();
    params.inputs = builder.spec().inputs;
    params.deps.reserve(builder.declared_deps().size());

    for (const auto &dep_target : builder.declared_deps()) {
        const BuildRule *dep = get(dep_target);
        if (!dep) {
            return fail(ErrorKind::UnresolvedDependency, builder.target().full_name() + " depends on " +
                                                             dep_target.full_name() + ", which was not resolved");
        }
        if (std::find(params.deps.begin(), params.deps.end(), dep) == params.deps.end()) {
            params.deps.push_back(dep);
        }
    }
    return params;
}

Result<std::vector<size_t>> BuildRuleResolver::dependency_order() const {
    for (const auto &builder : builders_) {
        for (const auto &dep : builder->declared_deps()) {
            if (!index_.contains(dep)) {
                return fail(ErrorKind::UnresolvedDependency, builder->target().full_name() + " depends on " +
                                                                 dep.full_name() + ", which is not defined");
            }
        }
    }

    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::vector<STATUS> status(builders_.size(), STATUS::UNSTARTED);
    std::vector<size_t> order;
    std::vector<size_t> path;
    order.reserve(builders_.size());

    std::function<Result<void>(size_t)> dfs = [&](size_t u) -> Result<void> {
        status[u] = STATUS::WORKING;
        path.push_back(u);
        for (const auto &dep : builders_[u]->declared_deps()) {
            size_t v = index_.at(dep);
            if (status[v] == STATUS::UNSTARTED) {
                if (auto res = dfs(v); !res)
                    return res;
            } else if (status[v] == STATUS::WORKING) {
                std::string cycle;
                auto start = std::find(path.begin(), path.end(), v);
                for (auto it = start; it != path.end(); ++it) {
                    cycle += builders_[*it]->target().full_name() + " -> ";
                }
                cycle += builders_[v]->target().full_name();
                return fail(ErrorKind::Cycle, "Cycle detected in the build graph: " + cycle);
            }
        }
        path.pop_back();
        status[u] = STATUS::FINISHED;
        order.push_back(u); // dependencies finish first
        return {};
    };

    for (size_t i = 0; i < builders_.size(); ++i) {
        if (status[i] == STATUS::UNSTARTED) {
            if (auto res = dfs(i); !res)
                return std::unexpected(res.error());
        }
    }
    return order;
}

Result<DependencyGraph> BuildRuleResolver::resolve() {
    if (resolved_) {
        return fail(ErrorKind::InvalidState, "Build rules were already resolved");
    }
    resolved_ = true;

    auto order = dependency_order();
    if (!order)
        return std::unexpected(order.error());

    for (size_t id : *order) {
        const RuleBuilder &builder = *builders_[id];
        auto rule = builder.build(*this);
        if (!rule) {
            return std::unexpected(rule.error());
        }
        if (!*rule || (*rule)->target() != builder.target()) {
            return fail(ErrorKind::TypeConstraint,
                        "Builder for " + builder.target().full_name() + " produced a rule for a different target");
        }
        if (auto added = graph_.add_rule(std::move(*rule)); !added) {
            return std::unexpected(added.error());
        }
    }

    return std::move(graph_);
}

Result<std::unique_ptr<RuleBuilder>> RuleKindRegistry::create(RuleSpec spec) const {
    auto it = factories_.find(spec.type);
    if (it == factories_.end()) {
        return fail(ErrorKind::Parse, "Unknown rule type '" + spec.type + "' for " + spec.target.full_name());
    }
    return it->second(std::move(spec));
}

} // namespace keel
