#include "executor.hpp"
#include "utils.hpp"

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <system_error>
#include <cstdio>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, dup2, _exit
#include <fcntl.h>     // open
#include <errno.h>
#include <cstring>     // strerror

namespace NetcapSetup {

    namespace {

        // Runs in the child after fork; never returns.
        void execChild(const std::vector<char*>& argv, bool suppressStderr)
        {
            if (suppressStderr) {
                int devNull = open("/dev/null", O_WRONLY);
                if (devNull >= 0) {
                    dup2(devNull, STDERR_FILENO);
                    close(devNull);
                }
            }

            execvp(argv[0], argv.data());

            // If execvp returns, an error occurred
            int err = errno;
            std::fprintf(stderr, NCSETUP_COLOR_ERROR "[ERROR] " NCSETUP_COLOR_RESET
                         "Failed to execute %s: %s\n", argv[0], std::strerror(err));
            _exit(EXIT_COMMAND_NOT_FOUND);
        }

    } // namespace

    ProcessExecutor::ProcessExecutor(bool verbose)
        : verbose_(verbose)
    {
    }

    int ProcessExecutor::execute(const Step& step)
    {
        if (step.command.empty() || step.command.front().empty()) {
            throw std::invalid_argument("Invalid command for step: " + step.description);
        }

        if (verbose_) {
            log_message("Running: " + joinCommandLine(step.command));
        }

        // Prepare arguments for execvp before forking
        std::vector<char*> argv;
        for (const auto& arg : step.command) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr); // Null terminator

        // Keep banner output ahead of anything the child prints
        std::cout.flush();
        std::cerr.flush();
        std::fflush(nullptr);

        pid_t pid = fork();
        if (pid < 0) {
            throw std::system_error(errno, std::system_category(), "Fork failed");
        }

        // --- Child Process ---
        if (pid == 0) {
            execChild(argv, step.suppressStderr);
        }

        // --- Parent Process ---
        int status = 0;
        pid_t waitedPid;
        do {
            waitedPid = waitpid(pid, &status, 0);
        } while (waitedPid < 0 && errno == EINTR);

        if (waitedPid < 0) {
            throw std::system_error(errno, std::system_category(),
                                    "waitpid failed for " + step.command.front());
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            if (verbose_) {
                log_warning(step.command.front() + " terminated by signal " +
                            std::to_string(WTERMSIG(status)));
            }
            return EXIT_SIGNAL_BASE + WTERMSIG(status);
        }

        log_warning(step.command.front() + " finished with unknown status.");
        return 1;
    }

} // namespace NetcapSetup
