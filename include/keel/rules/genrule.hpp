#pragma once

#include "keel/resolver.hpp"
#include "keel/rule.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

/**
 * @brief Runs a shell command that turns its srcs into one output file.
 *
 * The same class backs three rule types:
 *  - `genrule`: plain generated file;
 *  - `package`: the output is a deployable package described by `manifest`;
 *  - `package_genrule`: post-processes another installable rule (`package`),
 *    and is installable itself with the wrapped rule's manifest.
 *
 * The command sees `SRCS` (space separated inputs), `OUT`, `SRCDIR` and, for
 * package_genrule, `PACKAGE` in its environment.
 */
class Genrule : public BuildRule {
public:
    struct Options {
        std::string type = "genrule";
        std::string cmd;
        std::string out;
        std::filesystem::path out_dir;
        std::optional<std::filesystem::path> manifest;
        const BuildRule *package = nullptr;
    };

    Genrule(BuildRuleParams params, Options options);

    std::string_view type() const override {
        return options_.type;
    }
    void append_to_rule_key(RuleKeyBuilder &builder) const override;
    Result<std::vector<std::unique_ptr<Step>>> build_steps(const BuildContext &context) const override;
    std::vector<std::filesystem::path> outputs() const override {
        return {output_path_};
    }
    std::optional<InstallableArtifact> installable() const override;

    const std::filesystem::path &output_path() const {
        return output_path_;
    }

private:
    Options options_;
    std::filesystem::path output_path_;
};

class GenruleBuilder : public RuleBuilder {
public:
    using RuleBuilder::RuleBuilder;

    Result<std::unique_ptr<BuildRule>> build(const BuildRuleResolver &resolver) const override;
};

} // namespace keel
