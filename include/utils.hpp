#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <ostream>
#include <iostream>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"
#define COLOR_MATCH "\033[1;31m"

namespace Bulkpack {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
inline void log_warning(const std::string &message)
{
    std::cerr << COLOR_WARN << "[WARN] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
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
 * @brief Downloads a text document (e.g. a remote catalog) from a URL.
 *
 * @param url The http(s) URL to fetch.
 * @return The response body.
 * @throws std::runtime_error on transport errors or HTTP status >= 400.
 */
std::string fetchRemoteText(const std::string& url);

/**
 * @brief Returns true if the string looks like an http:// or https:// URL.
 */
bool isRemoteSource(const std::string& source);

/**
 * @brief Removes leading and trailing whitespace.
 */
std::string trim(const std::string& s);

/**
 * @brief Strips quote characters and surrounding whitespace from a tag
 *        returned by the dialog program.
 *
 * dialog/whiptail quote checklist output (e.g. `"vim" "git"`), so tags must
 * be unquoted before being matched against category ids or package names.
 */
std::string sanitizeTag(const std::string& tag);

/**
 * @brief Splits a string on whitespace, dropping empty tokens.
 */
std::vector<std::string> splitWords(const std::string& s);

/**
 * @brief Joins a list of words with the given separator.
 */
std::string join(const std::vector<std::string>& words, const std::string& separator = " ");

} // namespace Bulkpack

#endif // UTILS_HPP
