#pragma once

#include "keel/target.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keel {

/** @brief One rule as declared by the front end, before resolution. */
struct RuleSpec {
    BuildTarget target;
    std::string type;
    std::vector<BuildTarget> deps;
    std::vector<std::filesystem::path> inputs;
    std::vector<std::pair<std::string, std::string>> fields; ///< Declaration order.

    const std::string *field(std::string_view name) const {
        for (const auto &[key, value] : fields) {
            if (key == name)
                return &value;
        }
        return nullptr;
    }
};

using Definitions = std::vector<std::pair<std::string, std::string>>;

} // namespace keel
