#pragma once

#include "keel/domain.hpp"
#include "keel/engine.hpp"
#include "keel/resolver.hpp"
#include "keel/utility.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace keel {

/**
 * @brief A parsed build file.
 *
 * Format, one entry per line:
 *
 *     # comment
 *     DEF|jobs|4
 *     ALIAS|app|//java/com/example:app
 *     <type>|<target>|<dep,dep,...>|<input,input,...>|<name>=<value>|...
 *
 * A `cmd=` field takes the rest of the line, pipes included, so it must be
 * the last one.
 */
struct Manifest {
    std::vector<RuleSpec> rules;
    Definitions definitions;
    Definitions aliases; ///< Name and value, in declaration order.
};

Result<Manifest> parse_manifest(std::string_view content);
Result<Manifest> parse_manifest_file(const std::filesystem::path &path);

/** @brief Applies `DEF|` lines (jobs, keep_going, verbose, cache_dir, out_dir) to `config`. */
Result<void> apply_definitions(const Definitions &definitions, EngineConfig &config);

/** @brief Creates one builder per rule spec and adds it to `resolver`. */
Result<void> add_rules(const Manifest &manifest, const RuleKindRegistry &registry, BuildRuleResolver &resolver);

} // namespace keel
