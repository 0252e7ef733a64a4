#pragma once

#include "keel/domain.hpp"
#include "keel/graph.hpp"
#include "keel/rule.hpp"
#include "keel/target.hpp"
#include "keel/utility.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace keel {

class BuildRuleResolver;

/**
 * @brief Produces one rule once its dependencies are resolved.
 *
 * `build` runs after every declared dependency has been constructed, so it
 * can inspect them through the resolver, e.g. to require a capability.
 */
class RuleBuilder {
public:
    explicit RuleBuilder(RuleSpec spec) : spec_(std::move(spec)) {
    }
    virtual ~RuleBuilder() = default;

    const RuleSpec &spec() const {
        return spec_;
    }
    const BuildTarget &target() const {
        return spec_.target;
    }
    const std::vector<BuildTarget> &declared_deps() const {
        return spec_.deps;
    }

    virtual Result<std::unique_ptr<BuildRule>> build(const BuildRuleResolver &resolver) const = 0;

private:
    RuleSpec spec_;
};

/**
 * @brief Turns a set of rule builders into a dependency graph.
 *
 * Validation (dangling references, cycles) happens before any rule is built,
 * so a failed resolution constructs nothing. Resolution is one-shot.
 */
class BuildRuleResolver {
public:
    explicit BuildRuleResolver(std::filesystem::path out_dir = "keel-out") : out_dir_(std::move(out_dir)) {
    }

    Result<void> add(std::unique_ptr<RuleBuilder> builder);

    Result<DependencyGraph> resolve();

    /** @brief The already built rule for `target`, or nullptr. */
    const BuildRule *get(const BuildTarget &target) const;

    /** @brief Params for `builder`: its target, resolved deps (declared order, deduplicated) and inputs. */
    Result<BuildRuleParams> make_params(const RuleBuilder &builder) const;

    const std::filesystem::path &out_dir() const {
        return out_dir_;
    }
    size_t size() const {
        return builders_.size();
    }

private:
    Result<std::vector<size_t>> dependency_order() const;

    std::vector<std::unique_ptr<RuleBuilder>> builders_;
    std::unordered_map<BuildTarget, size_t> index_;
    DependencyGraph graph_;
    std::filesystem::path out_dir_;
    bool resolved_ = false;
};

using BuilderFactory = std::function<Result<std::unique_ptr<RuleBuilder>>(RuleSpec)>;

/** @brief Maps rule-type tags from the manifest to builder factories. */
class RuleKindRegistry {
public:
    void add(std::string type, BuilderFactory factory) {
        factories_.insert_or_assign(std::move(type), std::move(factory));
    }

    bool contains(std::string_view type) const {
        return factories_.find(type) != factories_.end();
    }

    Result<std::unique_ptr<RuleBuilder>> create(RuleSpec spec) const;

    /** @brief genrule, package, package_genrule and prebuilt. */
    static RuleKindRegistry with_builtin_kinds();

private:
    std::map<std::string, BuilderFactory, std::less<>> factories_;
};

} // namespace keel
