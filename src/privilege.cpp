#include "privilege.hpp"

namespace NetcapSetup {
namespace Privilege {

    bool isAdministrator(uid_t euid)
    {
        return euid == 0;
    }

    bool check(std::ostream& out, uid_t euid)
    {
        if (isAdministrator(euid)) {
            return true;
        }

        out << "  [!] Please run as root: sudo netcap-setup" << std::endl;
        return false;
    }

} // namespace Privilege
} // namespace NetcapSetup
