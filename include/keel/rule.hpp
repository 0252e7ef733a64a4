#pragma once

#include "keel/hash.hpp"
#include "keel/rule_key.hpp"
#include "keel/step.hpp"
#include "keel/target.hpp"
#include "keel/utility.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

class BuildRule;

struct BuildRuleParams {
    BuildTarget target;
    std::vector<const BuildRule *> deps; ///< Unique by target, declaration order.
    std::vector<std::filesystem::path> inputs;
};

/** @brief What a rule kind needs from the engine while producing its steps. */
struct BuildContext {
    std::filesystem::path out_dir;
};

/** @brief A deployable package and the manifest embedded in it. */
struct InstallableArtifact {
    std::filesystem::path package_path;
    std::filesystem::path manifest_path;
};

/** @brief Reads the manifest text of an installable artifact. */
Result<std::string> read_manifest(const InstallableArtifact &artifact);

/**
 * @brief A node of the build graph.
 *
 * Identity is the target. What the rule does is supplied by the rule kind
 * through the capability hooks below; the engine never looks past them.
 * Rules are immutable once constructed, except for the memoized rule key
 * which is computed at most once for the lifetime of the rule.
 */
class BuildRule {
public:
    explicit BuildRule(BuildRuleParams params) : params_(std::move(params)) {
    }
    virtual ~BuildRule() = default;

    BuildRule(const BuildRule &) = delete;
    BuildRule &operator=(const BuildRule &) = delete;

    const BuildTarget &target() const {
        return params_.target;
    }
    std::string full_name() const {
        return params_.target.full_name();
    }
    const std::vector<const BuildRule *> &deps() const {
        return params_.deps;
    }
    const std::vector<std::filesystem::path> &inputs() const {
        return params_.inputs;
    }

    /** @brief Rule-type tag, e.g. "genrule". First contribution to the rule key. */
    virtual std::string_view type() const = 0;

    /** @brief Contributes the kind's fields, always in the same order. */
    virtual void append_to_rule_key(RuleKeyBuilder &builder) const = 0;

    /** @brief Steps that produce `outputs()`, run in order. */
    virtual Result<std::vector<std::unique_ptr<Step>>> build_steps(const BuildContext &context) const = 0;

    virtual std::vector<std::filesystem::path> outputs() const = 0;

    virtual std::optional<InstallableArtifact> installable() const {
        return std::nullopt;
    }
    virtual bool is_library() const {
        return false;
    }

    /**
     * @brief Key over type, fields, output paths, input contents and dependency keys.
     *
     * The first call computes and memoizes; later calls (from any thread)
     * return the same value. Dependency keys are computed on demand, so
     * calling this on a rule whose dependencies were never keyed is fine.
     */
    const Result<RuleKey> &rule_key(FileHashCache &hashes) const;

private:
    BuildRuleParams params_;

    mutable std::once_flag key_once_;
    mutable std::optional<Result<RuleKey>> key_;
};

} // namespace keel
