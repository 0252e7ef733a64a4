#pragma once

#include "keel/utility.hpp"

#include <string>
#include <utility>
#include <vector>

namespace keel {

/**
 * @brief Spawns `args[0]` (searched in PATH) and waits for it.
 *
 * @param args Program and arguments.
 * @param env Variables added to (or replacing entries of) the inherited environment.
 * @return The exit status, 128 + signal number if the child was killed, or an
 *         IO error if it could not be started.
 */
Result<int> process_exec(const std::vector<std::string> &args,
                         const std::vector<std::pair<std::string, std::string>> &env = {});

} // namespace keel
