#ifndef NCSETUP_CLI_HPP
#define NCSETUP_CLI_HPP

#include <string>
#include <vector>
#include <ostream>
#include <sys/types.h>

#include "executor.hpp"

// NCSETUP_VERSION is defined by the build from the project version.

namespace NetcapSetup {

/**
 * @brief Exit status for command-line usage errors.
 */
constexpr int EXIT_USAGE = 2;

struct Options
{
    std::string configSource; // empty = built-in plan
    bool dryRun      = false;
    bool verbose     = false;
    bool showHelp    = false;
    bool showVersion = false;
};

namespace Cli {

/**
 * @brief Parses the arguments that follow the program name.
 * @throws std::invalid_argument for unknown flags or a missing value.
 */
Options parseArguments(const std::vector<std::string>& args);

void printHelp(std::ostream& out);

/**
 * @brief Runs the whole tool for the given arguments.
 *
 * Usage errors and plan-loading failures are logged to stderr.
 *
 * @param args     Arguments following the program name.
 * @param euid     Effective user id of the caller.
 * @param out      Stream for help, version, the gate message and banners.
 * @param executor Runs step commands; if null a ProcessExecutor is used.
 * @return The process exit code: 0 on success, EXIT_USAGE for usage
 *         errors, 1 if not root or the plan cannot be loaded, otherwise
 *         the exit code of the first aborting step.
 */
int run(const std::vector<std::string>& args, uid_t euid,
        std::ostream& out, Executor* executor = nullptr);

} // namespace Cli
} // namespace NetcapSetup

#endif // NCSETUP_CLI_HPP
