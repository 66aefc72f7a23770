/*******************************************************
 * runner.cpp
 *
 * Runs a provisioning plan top to bottom. Every step
 * blocks until its command exits; an aborting step's
 * exit code becomes the exit code of the whole run.
 *******************************************************/

#include "runner.hpp"
#include "banner.hpp"
#include "privilege.hpp"

namespace NetcapSetup {

Runner::Runner(Executor& executor, std::ostream& out)
    : executor_(executor), out_(out)
{
}

int Runner::run(const Config& config, uid_t euid)
{
    // Nothing but the remediation line may be printed before this
    if (!Privilege::check(out_, euid)) {
        return Privilege::EXIT_NOT_ROOT;
    }

    Banner::printHeader(out_, config.title);

    for (const auto& step : config.steps) {
        Banner::printProgress(out_, step.description);
        out_.flush();

        int exitCode = executor_.execute(step);
        if (exitCode == 0) {
            continue;
        }

        if (step.policy == FailurePolicy::Tolerate) {
            continue;
        }

        // The tool has already reported its own error
        return exitCode;
    }

    Banner::printCompletion(out_, config.nextCommand);
    return 0;
}

int Runner::dryRun(const Config& config)
{
    Banner::printHeader(out_, config.title);
    config.print(out_);
    Banner::printCompletion(out_, config.nextCommand);
    return 0;
}

} // namespace NetcapSetup
