#ifndef NCSETUP_EXECUTOR_HPP
#define NCSETUP_EXECUTOR_HPP

#include <string>
#include <vector>

#include "step.hpp"

namespace NetcapSetup {

/**
 * @brief Exit code reported when a program cannot be executed at all,
 *        matching what a POSIX shell reports for "command not found".
 */
constexpr int EXIT_COMMAND_NOT_FOUND = 127;

/**
 * @brief Base added to a signal number when a child is killed by it.
 */
constexpr int EXIT_SIGNAL_BASE = 128;

/**
 * @class Executor
 * @brief Runs the external command of a step and reports its exit code.
 */
class Executor
{
public:
    virtual ~Executor() = default;

    /**
     * @brief Runs the step's command to completion.
     *
     * @param step The step whose command should be executed.
     * @return The command's exit code (0 on success).
     */
    virtual int execute(const Step& step) = 0;
};

/**
 * @class ProcessExecutor
 * @brief Executor that forks, execs the command via PATH lookup and waits
 *        for it. The child inherits stdin, stdout and the environment.
 */
class ProcessExecutor : public Executor
{
public:
    /**
     * @param verbose If true, log every command line before running it.
     */
    explicit ProcessExecutor(bool verbose = false);

    /**
     * @brief Forks and execs step.command, blocking until it exits.
     *
     * @return The child's exit code; EXIT_SIGNAL_BASE + N if the child was
     *         killed by signal N; EXIT_COMMAND_NOT_FOUND if exec failed.
     * @throws std::system_error if fork or waitpid fail.
     * @throws std::invalid_argument if the command is empty.
     */
    int execute(const Step& step) override;

private:
    bool verbose_;
};

} // namespace NetcapSetup

#endif // NCSETUP_EXECUTOR_HPP
