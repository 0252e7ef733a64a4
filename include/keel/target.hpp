#pragma once

#include "keel/utility.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace keel {

/**
 * @brief Immutable name of one node in the build graph.
 *
 * The textual form is `//base/path:name` with an optional `#flavor` suffix.
 * Targets compare lexically by (base path, short name, flavor), which is the
 * tie-break order used wherever the engine needs a deterministic sequence.
 */
class BuildTarget {
public:
    BuildTarget() = default;
    BuildTarget(std::string base_path, std::string short_name, std::string flavor = {})
        : base_path_(std::move(base_path)), short_name_(std::move(short_name)), flavor_(std::move(flavor)) {
    }

    /**
     * @brief Parses a fully qualified target name.
     * @param text e.g. `//java/com/example:app#debug`.
     * @return The target, or a Parse error describing the malformed part.
     */
    static Result<BuildTarget> parse(std::string_view text);

    const std::string &base_path() const {
        return base_path_;
    }
    const std::string &short_name() const {
        return short_name_;
    }
    const std::string &flavor() const {
        return flavor_;
    }
    bool has_flavor() const {
        return !flavor_.empty();
    }

    std::string full_name() const;

    BuildTarget with_flavor(std::string flavor) const {
        return {base_path_, short_name_, std::move(flavor)};
    }

    bool operator==(const BuildTarget &) const = default;
    std::strong_ordering operator<=>(const BuildTarget &) const = default;

private:
    std::string base_path_;
    std::string short_name_;
    std::string flavor_;
};

} // namespace keel

template <> struct std::hash<keel::BuildTarget> {
    size_t operator()(const keel::BuildTarget &target) const noexcept {
        size_t h = std::hash<std::string>{}(target.base_path());
        h ^= std::hash<std::string>{}(target.short_name()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= std::hash<std::string>{}(target.flavor()) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
