#pragma once

#include "keel/resolver.hpp"
#include "keel/rule.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace keel {

/** @brief A library checked into the tree. Nothing to build; the output is the binary itself. */
class PrebuiltRule : public BuildRule {
public:
    struct Options {
        std::filesystem::path binary;
        std::optional<std::string> source;
        std::optional<std::string> docs_url;
    };

    PrebuiltRule(BuildRuleParams params, Options options) : BuildRule(std::move(params)), options_(std::move(options)) {
    }

    std::string_view type() const override {
        return "prebuilt";
    }
    void append_to_rule_key(RuleKeyBuilder &builder) const override;
    Result<std::vector<std::unique_ptr<Step>>> build_steps(const BuildContext &) const override {
        return std::vector<std::unique_ptr<Step>>{};
    }
    std::vector<std::filesystem::path> outputs() const override {
        return {options_.binary};
    }
    bool is_library() const override {
        return true;
    }

    const std::filesystem::path &binary() const {
        return options_.binary;
    }
    const std::optional<std::string> &source() const {
        return options_.source;
    }
    const std::optional<std::string> &docs_url() const {
        return options_.docs_url;
    }

    /** @brief This binary plus the outputs of every library below it. Computed once. */
    const std::set<std::filesystem::path> &transitive_library_outputs() const;

private:
    Options options_;

    mutable std::once_flag transitive_once_;
    mutable std::set<std::filesystem::path> transitive_;
};

class PrebuiltBuilder : public RuleBuilder {
public:
    using RuleBuilder::RuleBuilder;

    Result<std::unique_ptr<BuildRule>> build(const BuildRuleResolver &resolver) const override;
};

} // namespace keel
