#pragma once

#include "keel/utility.hpp"

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace keel {

struct StepContext {
    std::ostream &out;
    std::ostream &err;
    bool verbose = false;
};

/** @brief One unit of work a rule runs to produce its outputs. */
class Step {
public:
    virtual ~Step() = default;

    virtual std::string description() const = 0;
    virtual Result<void> execute(const StepContext &context) const = 0;
};

/** @brief Runs `/bin/sh -c <cmd>` with extra environment variables. */
class ShellStep : public Step {
public:
    ShellStep(std::string cmd, std::vector<std::pair<std::string, std::string>> env = {})
        : cmd_(std::move(cmd)), env_(std::move(env)) {
    }

    std::string description() const override {
        return cmd_;
    }
    Result<void> execute(const StepContext &context) const override;

private:
    std::string cmd_;
    std::vector<std::pair<std::string, std::string>> env_;
};

class MkdirStep : public Step {
public:
    explicit MkdirStep(std::filesystem::path dir) : dir_(std::move(dir)) {
    }

    std::string description() const override {
        return "mkdir -p " + dir_.string();
    }
    Result<void> execute(const StepContext &context) const override;

private:
    std::filesystem::path dir_;
};

/** @brief Step backed by a callable; used by rule kinds whose work is in-process. */
class FunctionStep : public Step {
public:
    FunctionStep(std::string description, std::function<Result<void>(const StepContext &)> fn)
        : description_(std::move(description)), fn_(std::move(fn)) {
    }

    std::string description() const override {
        return description_;
    }
    Result<void> execute(const StepContext &context) const override {
        return fn_(context);
    }

private:
    std::string description_;
    std::function<Result<void>(const StepContext &)> fn_;
};

} // namespace keel
