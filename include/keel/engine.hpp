#pragma once

#include "keel/artifact_cache.hpp"
#include "keel/graph.hpp"
#include "keel/hash.hpp"
#include "keel/rule_key.hpp"
#include "keel/target.hpp"
#include "keel/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

struct EngineConfig {
    size_t jobs = 0; // 0 means auto-detect
    bool keep_going = true;
    bool dry_run = false;
    bool verbose = false;
    std::filesystem::path out_dir = "keel-out";
    std::filesystem::path cache_dir = ".keel-cache";
    std::filesystem::path build_file = "keel.build";
    std::ostream *out = &std::cout;
    std::ostream *err = &std::cerr;
};

/**
 * @brief Where a rule ended up in one engine run.
 *
 * Pending and Building only exist while the run is in progress. Blocked
 * rules were never attempted because a dependency failed; Cancelled rules
 * were never attempted because the run stopped early.
 */
enum class RuleState : unsigned char { Pending, Building, Built, Reused, Failed, Blocked, Cancelled };

constexpr std::string_view rule_state_name(RuleState state) {
    switch (state) {
    case RuleState::Pending:
        return "PENDING";
    case RuleState::Building:
        return "BUILDING";
    case RuleState::Built:
        return "BUILT";
    case RuleState::Reused:
        return "REUSED";
    case RuleState::Failed:
        return "FAILED";
    case RuleState::Blocked:
        return "BLOCKED";
    case RuleState::Cancelled:
        return "CANCELLED";
    }
    return "UNKNOWN";
}

struct RuleOutcome {
    BuildTarget target;
    RuleState state = RuleState::Pending;
    std::optional<RuleKey> rule_key;
    std::optional<Sha1HashCode> output_key;
    size_t steps_executed = 0;
    std::optional<Error> error;            ///< Set for Failed and Blocked.
    std::optional<BuildTarget> blocked_by; ///< The failed rule a Blocked rule was waiting on.
};

class BuildReport {
public:
    const std::vector<RuleOutcome> &outcomes() const {
        return outcomes_;
    }
    const RuleOutcome *find(const BuildTarget &target) const;

    /** @brief Targets in the order workers picked them up. */
    const std::vector<BuildTarget> &dispatch_order() const {
        return dispatch_order_;
    }

    size_t count(RuleState state) const;
    size_t steps_executed() const;
    bool success() const;
    int exit_code() const {
        return success() ? 0 : 1;
    }

private:
    friend class BuildEngine;

    std::vector<RuleOutcome> outcomes_; // sorted by target
    std::vector<BuildTarget> dispatch_order_;
};

/**
 * @brief Dependency-ordered, parallel, cache-aware execution of a graph.
 *
 * A rule is dispatched once every dependency is Built or Reused. Its key
 * is computed from the finalized dependency keys; a cached record with
 * intact outputs makes it Reused, otherwise its steps run and the result
 * is recorded. A failure marks every transitive dependent Blocked and
 * leaves unrelated subtrees running (unless keep_going is off).
 */
class BuildEngine {
public:
    BuildEngine(const DependencyGraph &graph, ArtifactCache &cache, EngineConfig config = {});

    /** @brief Builds `targets` and everything they depend on. NotFound for unknown targets. */
    Result<BuildReport> build(const std::vector<BuildTarget> &targets);
    BuildReport build_all();

    /** @brief Removes every generated output of the graph. */
    Result<void> clean();

    /** @brief Graphviz dump; rules that would rebuild are green, reusable ones white. */
    Result<void> emit_graph(std::ostream &out);

private:
    BuildReport run(const std::vector<size_t> &selected);
    RuleState process_rule(size_t node_idx, RuleOutcome &outcome, size_t position, size_t total);
    bool is_reusable(const BuildRule &rule, const RuleKey &key, RuleOutcome &outcome);

    const DependencyGraph &graph;
    ArtifactCache &cache;
    EngineConfig config;
    FileHashCache hashes;
    std::mutex out_mtx;
};

} // namespace keel
