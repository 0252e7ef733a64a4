#include "keel/alias.hpp"

#include <algorithm>

namespace keel {

namespace {

bool is_alias_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_alias_char(char c) {
    return is_alias_start(c) || (c >= '0' && c <= '9');
}

Result<void> check_declared(const Manifest &manifest, const std::string &alias, const BuildTarget &target) {
    bool base_path_known = false;
    for (const auto &spec : manifest.rules) {
        if (spec.target == target)
            return {};
        if (spec.target.base_path() == target.base_path())
            base_path_known = true;
    }
    if (!base_path_known) {
        return fail(ErrorKind::NotFound, "No directory " + target.base_path() + " when resolving target " +
                                             target.full_name() + " for alias " + alias);
    }
    return fail(ErrorKind::NotFound, "No rule " + target.full_name() + " when resolving alias " + alias);
}

} // namespace

Result<void> AliasTable::validate_name(std::string_view name) {
    if (name.empty()) {
        return fail(ErrorKind::Parse, "Alias cannot be the empty string.");
    }
    if (!is_alias_start(name.front()) || !std::all_of(name.begin(), name.end(), is_alias_char)) {
        return fail(ErrorKind::Parse, "Not a valid alias: " + std::string(name) + ".");
    }
    return {};
}

Result<AliasTable> AliasTable::create(const Manifest &manifest) {
    AliasTable table;
    for (const auto &[name, value] : manifest.aliases) {
        if (auto res = validate_name(name); !res)
            return std::unexpected(res.error());
        if (table.target_for(name)) {
            return fail(ErrorKind::Parse, "Duplicate definition for " + name + " in aliases.");
        }

        BuildTarget target;
        if (validate_name(value)) {
            // Refers to an alias declared earlier.
            auto referenced = table.target_for(value);
            if (!referenced) {
                return fail(ErrorKind::Parse, "No alias for: " + value + ".");
            }
            target = std::move(*referenced);
        } else {
            auto parsed = BuildTarget::parse(value);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (auto res = check_declared(manifest, name, *parsed); !res)
                return std::unexpected(res.error());
            target = std::move(*parsed);
        }

        if (!table.alias_for_base_path(target.base_path())) {
            table.base_paths_.emplace_back(target.base_path(), name);
        }
        table.entries_.emplace_back(name, std::move(target));
    }
    return table;
}

std::optional<BuildTarget> AliasTable::target_for(std::string_view name) const {
    for (const auto &[alias, target] : entries_) {
        if (alias == name)
            return target;
    }
    return std::nullopt;
}

const std::string *AliasTable::alias_for_base_path(std::string_view base_path) const {
    for (const auto &[path, alias] : base_paths_) {
        if (path == base_path)
            return &alias;
    }
    return nullptr;
}

Result<BuildTarget> AliasTable::resolve(std::string_view arg) const {
    if (auto target = target_for(arg))
        return std::move(*target);
    if (arg.starts_with("//"))
        return BuildTarget::parse(arg);
    return fail(ErrorKind::NotFound, "Not a target or alias: " + std::string(arg));
}

} // namespace keel
