#ifndef NCSETUP_CONFIG_HPP
#define NCSETUP_CONFIG_HPP

#include <string>
#include <vector>
#include <ostream>

#include "step.hpp"

namespace NetcapSetup {

/**
 * @brief The provisioning plan: header title, ordered steps and the
 *        follow-up command shown once everything has run.
 */
class Config
{
public:
    /**
     * @brief Text shown inside the installer header box.
     */
    std::string title;

    /**
     * @brief Steps executed in order.
     */
    std::vector<Step> steps;

    /**
     * @brief Command the operator should run next, printed by the
     *        completion banner.
     */
    std::string nextCommand;

    /**
     * @brief The built-in NetCapture Pro plan: refresh apt, install the
     *        capture packages (tolerated), install the Python packages.
     */
    static Config defaults();

    /**
     * @brief Parses a YAML plan.
     * @param yaml The YAML document text.
     * @param origin Name used in error messages (file path or URL).
     * @return A validated Config instance.
     * @throws std::runtime_error if the document is malformed or invalid.
     */
    static Config loadFromString(const std::string& yaml,
                                 const std::string& origin = "<string>");

    /**
     * @brief Loads a YAML plan from a file on disk.
     * @param path Path to the plan file.
     * @throws std::runtime_error if the file is missing or invalid.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Loads a YAML plan from a file path or an http(s) URL.
     * @param source File path or URL.
     */
    static Config loadFromSource(const std::string& source);

    /**
     * @brief Checks that every step has a non-empty command.
     * @throws std::runtime_error naming the offending step.
     */
    void validate() const;

    /**
     * @brief Prints the plan, one step per entry with its command line.
     */
    void print(std::ostream& out) const;
};

} // namespace NetcapSetup

#endif // NCSETUP_CONFIG_HPP
