#ifndef NCSETUP_RUNNER_HPP
#define NCSETUP_RUNNER_HPP

#include <ostream>
#include <sys/types.h>

#include "config.hpp"
#include "executor.hpp"

namespace NetcapSetup {

/**
 * @class Runner
 * @brief Drives a provisioning plan: privilege gate, header, each step in
 *        order under its failure policy, then the completion banner.
 */
class Runner
{
public:
    /**
     * @param executor Runs each step's command.
     * @param out      Stream for the header, progress lines and banners.
     */
    Runner(Executor& executor, std::ostream& out);

    /**
     * @brief Executes the plan.
     *
     * Stops at the first step with FailurePolicy::Abort that exits non-zero.
     * Failures of FailurePolicy::Tolerate steps are ignored.
     *
     * @param config The plan to run.
     * @param euid   Effective user id of the caller.
     * @return 0 on success, Privilege::EXIT_NOT_ROOT if not root, otherwise
     *         the exit code of the first aborting step.
     */
    int run(const Config& config, uid_t euid);

    /**
     * @brief Prints what run() would do without checking privileges or
     *        executing anything.
     * @return Always 0.
     */
    int dryRun(const Config& config);

private:
    Executor& executor_;
    std::ostream& out_;
};

} // namespace NetcapSetup

#endif // NCSETUP_RUNNER_HPP
