#ifndef NCSETUP_BANNER_HPP
#define NCSETUP_BANNER_HPP

#include <ostream>
#include <string>

namespace NetcapSetup {

class Banner
{
public:
    /**
     * @brief Prints the boxed installer header, e.g.
     *
     *   ╔══════════════════════════════════════════╗
     *   ║     NetCapture Pro — Installer           ║
     *   ╚══════════════════════════════════════════╝
     *
     * The box widens to fit long titles.
     */
    static void printHeader(std::ostream& out, const std::string& title);

    /**
     * @brief Prints a "[*]" progress line for a step.
     */
    static void printProgress(std::ostream& out, const std::string& description);

    /**
     * @brief Prints the success banner followed by the command to run next.
     */
    static void printCompletion(std::ostream& out, const std::string& nextCommand);
};

} // namespace NetcapSetup

#endif // NCSETUP_BANNER_HPP
