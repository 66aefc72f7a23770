#ifndef NCSETUP_UTILS_HPP
#define NCSETUP_UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define NCSETUP_COLOR_RESET "\033[0m"
#define NCSETUP_COLOR_INFO  "\033[32m"
#define NCSETUP_COLOR_WARN  "\033[33m"
#define NCSETUP_COLOR_ERROR "\033[31m"

namespace NetcapSetup {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << NCSETUP_COLOR_INFO << "[INFO] " << NCSETUP_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << NCSETUP_COLOR_WARN << "[WARN] " << NCSETUP_COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << NCSETUP_COLOR_ERROR << "[ERROR] " << NCSETUP_COLOR_RESET << message << std::endl;
}

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Downloads a text document (such as a YAML plan) from a URL.
 *
 * @param url The http:// or https:// URL to fetch.
 * @return The response body.
 * @throws std::runtime_error on transport errors or HTTP status >= 400.
 */
std::string fetchRemoteText(const std::string& url);

/**
 * @brief True if the source string names an http:// or https:// URL.
 */
bool isRemoteSource(const std::string& source);

/**
 * @brief Joins argv-style arguments into a single printable command line.
 *
 * Arguments containing whitespace or quotes are single-quoted.
 */
std::string joinCommandLine(const std::vector<std::string>& args);

/**
 * @brief Number of terminal columns a UTF-8 string occupies, assuming every
 *        code point is one column wide.
 */
std::size_t displayWidth(const std::string& text);

} // namespace NetcapSetup

#endif // NCSETUP_UTILS_HPP
