#include "keel/step.hpp"

#include "keel/process_exec.hpp"

#include <filesystem>
#include <ostream>
#include <system_error>

namespace keel {

Result<void> ShellStep::execute(const StepContext &context) const {
    if (context.verbose) {
        context.out << "  $ " << cmd_ << '\n';
    }

    auto res = process_exec({"/bin/sh", "-c", cmd_}, env_);
    if (!res) {
        return std::unexpected(res.error());
    }
    if (*res != 0) {
        return fail(ErrorKind::StepExecution, "`" + cmd_ + "` exited with code " + std::to_string(*res));
    }
    return {};
}

Result<void> MkdirStep::execute(const StepContext &) const {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return fail(ErrorKind::IO, "Failed to create " + dir_.string() + ": " + ec.message());
    }
    return {};
}

} // namespace keel
