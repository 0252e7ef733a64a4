#include "keel/process_exec.hpp"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <sys/wait.h>
#include <vector>

extern char **environ;

namespace keel {

namespace {

// Inherited environment with `overrides` replacing or extending it.
std::vector<std::string> merged_environment(const std::vector<std::pair<std::string, std::string>> &overrides) {
    std::vector<std::string> env;
    for (char **e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        bool replaced = false;
        for (const auto &[key, value] : overrides) {
            if (entry.size() > key.size() && entry.starts_with(key) && entry[key.size()] == '=') {
                replaced = true;
                break;
            }
        }
        if (!replaced)
            env.emplace_back(entry);
    }
    for (const auto &[key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace

Result<int> process_exec(const std::vector<std::string> &args,
                         const std::vector<std::pair<std::string, std::string>> &env) {
    if (args.empty()) {
        return fail(ErrorKind::IO, "Cannot execute empty command");
    }

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = merged_environment(env);
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &entry : env_strings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    pid_t pid = 0;
    int rc = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), envp.data());
    if (rc != 0) {
        return fail(ErrorKind::IO, "Failed to spawn " + args[0] + ": " + std::strerror(rc));
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return fail(ErrorKind::IO, "waitpid failed for " + args[0] + ": " + std::strerror(errno));
        }
    }

    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return 1;
}

} // namespace keel
