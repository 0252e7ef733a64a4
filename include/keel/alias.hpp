#pragma once

#include "keel/manifest.hpp"
#include "keel/target.hpp"
#include "keel/utility.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keel {

/**
 * @brief Short names for build targets, declared with `ALIAS|<name>|<value>`.
 *
 * The value is either a fully qualified target or an alias declared on an
 * earlier line. Every alias must name a target the manifest declares.
 */
class AliasTable {
public:
    using Entry = std::pair<std::string, BuildTarget>;

    AliasTable() = default;

    /**
     * @brief Validates and resolves the aliases of `manifest`, in declaration order.
     * @return The table, a Parse error for a bad name, a duplicate or a malformed
     *         value, or NotFound for a target the manifest does not declare.
     */
    static Result<AliasTable> create(const Manifest &manifest);

    /** @brief Fails unless `name` matches `[A-Za-z_][A-Za-z0-9_]*`. */
    static Result<void> validate_name(std::string_view name);

    /** @brief The target behind `name`; nullopt for unknown names, target strings included. */
    std::optional<BuildTarget> target_for(std::string_view name) const;

    /** @brief The first alias declared for a target under `base_path`, or null. */
    const std::string *alias_for_base_path(std::string_view base_path) const;

    /** @brief A command line argument as a target: an alias, else a `//` target name. */
    Result<BuildTarget> resolve(std::string_view arg) const;

    const std::vector<Entry> &entries() const {
        return entries_;
    }
    bool empty() const {
        return entries_.empty();
    }

private:
    std::vector<Entry> entries_;
    std::vector<std::pair<std::string, std::string>> base_paths_; ///< First alias per base path.
};

} // namespace keel
