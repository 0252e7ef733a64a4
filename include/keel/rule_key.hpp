#pragma once

#include "keel/hash.hpp"
#include "keel/utility.hpp"

#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

class BuildRule;

/** @brief Content- and dependency-derived key deciding whether a cached output is reusable. */
class RuleKey {
public:
    RuleKey() = default;
    explicit RuleKey(Sha1HashCode hash) : hash_(hash) {
    }

    static Result<RuleKey> from_string(std::string_view hex) {
        auto hash = Sha1HashCode::from_hex(hex);
        if (!hash)
            return std::unexpected(hash.error());
        return RuleKey(*hash);
    }

    std::string to_string() const {
        return hash_.to_hex();
    }
    const Sha1HashCode &hash() const {
        return hash_;
    }

    bool operator==(const RuleKey &) const = default;
    std::strong_ordering operator<=>(const RuleKey &) const = default;

private:
    Sha1HashCode hash_;
};

/**
 * @brief Order-sensitive accumulator for a rule key.
 *
 * Every contribution is framed as (tag, name, value) with length prefixes, so
 * `set("a", "bc")` and `set("ab", "c")` feed different bytes. The order of
 * calls is part of the key: rule kinds must contribute fields in a fixed order.
 *
 * Errors (an unreadable path, a dependency whose key failed) are remembered
 * and reported by `build()`; the first one wins.
 */
class RuleKeyBuilder {
public:
    explicit RuleKeyBuilder(FileHashCache &hashes) : hashes_(hashes) {
    }

    RuleKeyBuilder &set(std::string_view name, std::string_view value);
    RuleKeyBuilder &set(std::string_view name, const std::string &value) {
        return set(name, std::string_view(value));
    }
    RuleKeyBuilder &set(std::string_view name, const char *value) {
        return set(name, std::string_view(value));
    }
    RuleKeyBuilder &set(std::string_view name, bool value);
    RuleKeyBuilder &set(std::string_view name, std::int64_t value);
    RuleKeyBuilder &set(std::string_view name, int value) {
        return set(name, static_cast<std::int64_t>(value));
    }
    RuleKeyBuilder &set(std::string_view name, const std::optional<std::string> &value);
    RuleKeyBuilder &set(std::string_view name, const std::vector<std::string> &values);

    /** @brief Contributes the key of a rule referenced by a field (not a plain dependency). */
    RuleKeyBuilder &set(std::string_view name, const BuildRule &rule);

    /** @brief Contributes the path and the SHA-1 of its current content. */
    RuleKeyBuilder &set_path(std::string_view name, const std::filesystem::path &path);

    /** @brief Appends each dependency's finalized key, in the given order. */
    RuleKeyBuilder &add_dependency_rule_keys(const std::vector<const BuildRule *> &deps);

    /** @brief Returns the digest of everything contributed so far. Idempotent. */
    Result<RuleKey> build() const;

private:
    void frame(char tag, std::string_view name, std::string_view value);
    void record_error(Error err);

    Sha1Hasher hasher_;
    FileHashCache &hashes_;
    std::optional<Error> error_;
};

} // namespace keel
