#ifndef PACKAGE_MANAGER_HPP
#define PACKAGE_MANAGER_HPP

#include "process.hpp"

#include <functional>
#include <string>
#include <vector>

namespace Bulkpack {

/**
 * @class Highlighter
 * @brief Colors occurrences of a search query in backend output.
 *
 * When highlighting is unavailable the lines pass through untouched and a
 * single warning is logged for the lifetime of the object.
 */
class Highlighter
{
public:
    explicit Highlighter(bool available);

    /**
     * @brief Enabled when stdout is a terminal, TERM is not "dumb" and
     *        NO_COLOR is unset.
     */
    static Highlighter detect();

    bool available() const { return available_; }

    /**
     * @brief Wraps every case-insensitive occurrence of query in ANSI color.
     */
    std::string apply(const std::string& line, const std::string& query) const;

    bool warned() const { return warned_; }

private:
    bool available_;
    mutable bool warned_ = false;
};

/**
 * @class SearchResults
 * @brief Lazy, restartable sequence of search match lines.
 *
 * Nothing runs on construction. Each traversal re-runs the backend search.
 */
class SearchResults
{
public:
    SearchResults(CommandRunner& runner, Command command, std::string query,
                  const Highlighter& highlighter);

    /**
     * @brief Runs the search and invokes fn once per (highlighted) output line.
     * @throws CommandFailedError if the backend reports an error.
     */
    void forEach(const std::function<void(const std::string&)>& fn) const;

    /**
     * @brief Runs the search and returns all lines.
     */
    std::vector<std::string> collect() const;

    const Command& command() const { return command_; }

private:
    CommandRunner& runner_;
    Command command_;
    std::string query_;
    const Highlighter& highlighter_;
};

/**
 * @class PackageManager
 * @brief Backend adapter exposing the six package operations.
 *
 * Install and remove pass every identifier to one backend invocation.
 */
class PackageManager
{
public:
    virtual ~PackageManager() = default;

    /**
     * @brief Backend name, e.g. "apt-get".
     */
    virtual std::string name() const = 0;

    /**
     * @brief Installs all packages in one batched, privileged call.
     * @throws std::invalid_argument if packages is empty.
     * @throws CommandFailedError if the backend fails.
     */
    virtual void install(const std::vector<std::string>& packages) = 0;

    /**
     * @brief Removes all packages in one batched, privileged call.
     */
    virtual void remove(const std::vector<std::string>& packages) = 0;

    /**
     * @brief Returns a lazy sequence of lines matching query.
     */
    virtual SearchResults search(const std::string& query) = 0;

    /**
     * @brief Refreshes the backend's package index.
     */
    virtual void syncIndex() = 0;

    /**
     * @brief Upgrades every installed package.
     */
    virtual void upgradeAll() = 0;

    /**
     * @brief Removes packages no longer required by anything.
     *
     * Computes the orphan set first. Nothing is removed when it is empty.
     *
     * @return The removed packages, empty if there was nothing to do.
     */
    virtual std::vector<std::string> removeOrphans() = 0;
};

/**
 * @class CommandPackageManager
 * @brief Shared plumbing for backends driven by a command-line tool.
 */
class CommandPackageManager : public PackageManager
{
public:
    CommandPackageManager(CommandRunner& runner, const Highlighter& highlighter, bool assumeYes);

    void install(const std::vector<std::string>& packages) override;
    void remove(const std::vector<std::string>& packages) override;
    SearchResults search(const std::string& query) override;
    void syncIndex() override;
    void upgradeAll() override;
    std::vector<std::string> removeOrphans() override;

protected:
    virtual Command installCommand(const std::vector<std::string>& packages) const = 0;
    virtual Command removeCommand(const std::vector<std::string>& packages) const = 0;
    virtual Command searchCommand(const std::string& query) const = 0;
    virtual Command syncCommand() const = 0;
    virtual Command upgradeCommand() const = 0;
    virtual Command orphanRemovalCommand(const std::vector<std::string>& orphans) const = 0;

    /**
     * @brief Queries the backend for the current orphan set (unprivileged).
     */
    virtual std::vector<std::string> computeOrphans() = 0;

    /**
     * @brief Runs a command, throwing CommandFailedError on non-zero exit.
     */
    void runChecked(const Command& command);

    CommandRunner& runner_;
    const Highlighter& highlighter_;
    bool assumeYes_;
};

/**
 * @brief Debian/Ubuntu backend (apt-get, apt-cache).
 */
class AptGetManager : public CommandPackageManager
{
public:
    using CommandPackageManager::CommandPackageManager;

    std::string name() const override { return "apt-get"; }

protected:
    Command installCommand(const std::vector<std::string>& packages) const override;
    Command removeCommand(const std::vector<std::string>& packages) const override;
    Command searchCommand(const std::string& query) const override;
    Command syncCommand() const override;
    Command upgradeCommand() const override;
    Command orphanRemovalCommand(const std::vector<std::string>& orphans) const override;
    std::vector<std::string> computeOrphans() override;
};

/**
 * @brief Arch Linux backend (pacman).
 */
class PacmanManager : public CommandPackageManager
{
public:
    using CommandPackageManager::CommandPackageManager;

    std::string name() const override { return "pacman"; }

protected:
    Command installCommand(const std::vector<std::string>& packages) const override;
    Command removeCommand(const std::vector<std::string>& packages) const override;
    Command searchCommand(const std::string& query) const override;
    Command syncCommand() const override;
    Command upgradeCommand() const override;
    Command orphanRemovalCommand(const std::vector<std::string>& orphans) const override;
    std::vector<std::string> computeOrphans() override;
};

/**
 * @brief Stand-in for an unrecognized configuration value. Every operation
 *        throws UnsupportedManagerError without touching the system.
 */
class UnsupportedManager : public PackageManager
{
public:
    explicit UnsupportedManager(std::string raw);

    std::string name() const override { return "unsupported"; }

    void install(const std::vector<std::string>& packages) override;
    void remove(const std::vector<std::string>& packages) override;
    SearchResults search(const std::string& query) override;
    void syncIndex() override;
    void upgradeAll() override;
    std::vector<std::string> removeOrphans() override;

private:
    std::string raw_;
};

} // namespace Bulkpack

#endif // PACKAGE_MANAGER_HPP
