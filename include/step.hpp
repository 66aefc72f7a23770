#ifndef NCSETUP_STEP_HPP
#define NCSETUP_STEP_HPP

#include <string>
#include <vector>

namespace NetcapSetup {

/**
 * @brief What the runner does when a step's command exits non-zero.
 */
enum class FailurePolicy
{
    Abort,    // stop the run and propagate the exit code
    Tolerate  // ignore the failure and continue with the next step
};

/**
 * @brief One provisioning step: a progress banner and the external
 *        command that carries it out.
 */
struct Step
{
    std::string description;          // e.g. "Updating apt..."
    std::vector<std::string> command; // argv, command[0] is looked up on PATH
    FailurePolicy policy = FailurePolicy::Abort;
    bool suppressStderr = false;      // child stderr goes to /dev/null
};

/**
 * @brief Parses "abort" or "tolerate" (case-insensitive).
 * @throws std::runtime_error for any other value.
 */
FailurePolicy parseFailurePolicy(const std::string& value);

/**
 * @brief Lowercase name of a policy, as accepted by parseFailurePolicy().
 */
const char* failurePolicyName(FailurePolicy policy);

} // namespace NetcapSetup

#endif // NCSETUP_STEP_HPP
