#pragma once

#include "keel/graph.hpp"
#include "keel/resolver.hpp"
#include "keel/rule.hpp"
#include "keel/step.hpp"
#include "keel/target.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace keel::testing {

/** @brief A fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("keel_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const {
        return path_;
    }
    std::filesystem::path operator/(const std::string &name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

inline void create_file(const std::filesystem::path &path, const std::string &content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    f << content;
}

inline std::string read_file(const std::filesystem::path &path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline BuildTarget target(const std::string &text) {
    auto parsed = BuildTarget::parse(text);
    if (!parsed)
        throw std::runtime_error(parsed.error().message);
    return *parsed;
}

/**
 * @brief Rule kind for engine tests.
 *
 * Writes its output from the contents of its inputs and dependency outputs,
 * counts how many times its step ran, and can be told to fail.
 */
class FakeRule : public BuildRule {
public:
    struct Options {
        std::filesystem::path output;
        std::vector<std::pair<std::string, std::string>> fields;
        bool fail = false;
        bool library = false;
        std::atomic<int> *executions = nullptr;
    };

    FakeRule(BuildRuleParams params, Options options) : BuildRule(std::move(params)), options_(std::move(options)) {
    }

    std::string_view type() const override {
        return "fake";
    }

    void append_to_rule_key(RuleKeyBuilder &builder) const override {
        for (const auto &[name, value] : options_.fields)
            builder.set(name, value);
        builder.set("out", options_.output.generic_string());
    }

    Result<std::vector<std::unique_ptr<Step>>> build_steps(const BuildContext &) const override {
        std::vector<std::unique_ptr<Step>> steps;
        steps.push_back(std::make_unique<FunctionStep>("produce " + full_name(), [this](const StepContext &) {
            return produce();
        }));
        return steps;
    }

    std::vector<std::filesystem::path> outputs() const override {
        if (options_.output.empty())
            return {};
        return {options_.output};
    }

    bool is_library() const override {
        return options_.library;
    }

private:
    Result<void> produce() const {
        if (options_.executions)
            ++*options_.executions;
        if (options_.fail)
            return fail(ErrorKind::StepExecution, full_name() + " was told to fail");
        if (options_.output.empty())
            return {};

        std::string content = full_name() + "\n";
        for (const auto &input : inputs())
            content += read_file(input);
        for (const BuildRule *dep : deps()) {
            for (const auto &out : dep->outputs())
                content += read_file(out);
        }
        create_file(options_.output, content);
        return {};
    }

    Options options_;
};

class FakeBuilder : public RuleBuilder {
public:
    FakeBuilder(RuleSpec spec, FakeRule::Options options) : RuleBuilder(std::move(spec)), options_(std::move(options)) {
    }

    Result<std::unique_ptr<BuildRule>> build(const BuildRuleResolver &resolver) const override {
        auto params = resolver.make_params(*this);
        if (!params)
            return std::unexpected(params.error());
        return std::make_unique<FakeRule>(std::move(*params), options_);
    }

private:
    FakeRule::Options options_;
};

inline RuleSpec fake_spec(const std::string &name, const std::vector<std::string> &deps = {},
                          const std::vector<std::filesystem::path> &inputs = {}) {
    RuleSpec spec;
    spec.target = target(name);
    spec.type = "fake";
    for (const auto &dep : deps)
        spec.deps.push_back(target(dep));
    spec.inputs = inputs;
    return spec;
}

inline std::unique_ptr<RuleBuilder> fake_builder(const std::string &name, const std::vector<std::string> &deps = {},
                                                 FakeRule::Options options = {},
                                                 const std::vector<std::filesystem::path> &inputs = {}) {
    return std::make_unique<FakeBuilder>(fake_spec(name, deps, inputs), std::move(options));
}

/** @brief Adds rules straight to a graph; dependencies must come first. */
inline const BuildRule *add_fake(DependencyGraph &graph, const std::string &name,
                                 const std::vector<std::string> &deps = {}, FakeRule::Options options = {},
                                 const std::vector<std::filesystem::path> &inputs = {}) {
    BuildRuleParams params;
    params.target = target(name);
    params.inputs = inputs;
    for (const auto &dep : deps) {
        auto rule = graph.find(target(dep));
        if (!rule)
            throw std::runtime_error(rule.error().message);
        params.deps.push_back(*rule);
    }
    auto added = graph.add_rule(std::make_unique<FakeRule>(std::move(params), std::move(options)));
    if (!added)
        throw std::runtime_error(added.error().message);
    return *added;
}

} // namespace keel::testing
