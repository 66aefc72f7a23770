#ifndef NCSETUP_PRIVILEGE_HPP
#define NCSETUP_PRIVILEGE_HPP

#include <ostream>
#include <sys/types.h>

namespace NetcapSetup {
namespace Privilege {

/**
 * @brief Exit status used when the installer is not run as root.
 */
constexpr int EXIT_NOT_ROOT = 1;

/**
 * @brief True if the given effective user id is the superuser (0).
 */
bool isAdministrator(uid_t euid);

/**
 * @brief Checks the effective user id and, if it is not root, prints the
 *        remediation line to `out`.
 *
 * @param out  Stream receiving the "[!]" remediation message.
 * @param euid The effective user id to check.
 * @return True if the caller may proceed.
 */
bool check(std::ostream& out, uid_t euid);

} // namespace Privilege
} // namespace NetcapSetup

#endif // NCSETUP_PRIVILEGE_HPP
