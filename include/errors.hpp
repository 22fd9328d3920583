#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Bulkpack {

/**
 * @brief Raised by every operation of the unsupported backend. Carries the
 *        configuration value that failed to resolve.
 */
class UnsupportedManagerError : public std::runtime_error
{
public:
    explicit UnsupportedManagerError(const std::string& raw)
        : std::runtime_error(raw.empty()
              ? "No package manager configured (set package_manager or PKG_MANAGER)"
              : "Unsupported package manager: '" + raw + "'"),
          raw_(raw)
    {
    }

    const std::string& raw() const { return raw_; }

private:
    std::string raw_;
};

/**
 * @brief Raised when the interactive dialog program cannot be found.
 */
class DialogUnavailableError : public std::runtime_error
{
public:
    explicit DialogUnavailableError(const std::string& program)
        : std::runtime_error("Dialog program not available: '" + program + "'")
    {
    }
};

/**
 * @brief Raised when the dialog program exits in an unexpected way.
 */
class DialogError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A backend command exited with a non-zero status.
 */
class CommandFailedError : public std::runtime_error
{
public:
    CommandFailedError(const std::string& command, int exitCode)
        : std::runtime_error("Command '" + command + "' failed with exit code " +
                             std::to_string(exitCode)),
          command_(command),
          exitCode_(exitCode)
    {
    }

    const std::string& command() const { return command_; }
    int exitCode() const { return exitCode_; }

private:
    std::string command_;
    int exitCode_;
};

/**
 * @brief One category's batched install failed. Recorded by the
 *        orchestrator; never aborts the remaining categories.
 */
class PartialInstallFailure : public std::runtime_error
{
public:
    PartialInstallFailure(const std::string& category, const std::string& reason)
        : std::runtime_error("Installing category '" + category + "' failed: " + reason),
          category_(category),
          reason_(reason)
    {
    }

    const std::string& category() const { return category_; }
    const std::string& reason() const { return reason_; }

private:
    std::string category_;
    std::string reason_;
};

class CatalogError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace Bulkpack

#endif // ERRORS_HPP
