#include "package_manager.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace Bulkpack {

// ============================================================================
// Anonymous Namespace - Internal Helpers
// ============================================================================
namespace {

    std::string toLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    void requirePackages(const std::vector<std::string>& packages, const char* operation)
    {
        if (packages.empty()) {
            throw std::invalid_argument(std::string(operation) + ": no packages given");
        }
    }

    Command privileged(std::string program, std::vector<std::string> args)
    {
        Command command;
        command.program    = std::move(program);
        command.args       = std::move(args);
        command.privileged = true;
        return command;
    }

    Command unprivileged(std::string program, std::vector<std::string> args)
    {
        Command command;
        command.program = std::move(program);
        command.args    = std::move(args);
        return command;
    }

    std::vector<std::string> withPackages(std::vector<std::string> args,
                                          const std::vector<std::string>& packages)
    {
        args.insert(args.end(), packages.begin(), packages.end());
        return args;
    }

} // end anonymous namespace

// ============================================================================
// Highlighter
// ============================================================================

Highlighter::Highlighter(bool available)
    : available_(available)
{
}

Highlighter Highlighter::detect()
{
    const char* term    = std::getenv("TERM");
    const char* noColor = std::getenv("NO_COLOR");

    bool available = isatty(STDOUT_FILENO) &&
                     term && *term && std::string(term) != "dumb" &&
                     !(noColor && *noColor);
    return Highlighter(available);
}

std::string Highlighter::apply(const std::string& line, const std::string& query) const
{
    if (!available_) {
        if (!warned_) {
            log_warning("Terminal does not support color; search output is not highlighted");
            warned_ = true;
        }
        return line;
    }
    if (query.empty()) {
        return line;
    }

    const std::string lowerLine  = toLower(line);
    const std::string lowerQuery = toLower(query);

    std::string result;
    size_t pos = 0;
    size_t match;
    while ((match = lowerLine.find(lowerQuery, pos)) != std::string::npos) {
        result += line.substr(pos, match - pos);
        result += COLOR_MATCH;
        result += line.substr(match, query.size());
        result += COLOR_RESET;
        pos = match + query.size();
    }
    result += line.substr(pos);
    return result;
}

// ============================================================================
// SearchResults
// ============================================================================

SearchResults::SearchResults(CommandRunner& runner, Command command, std::string query,
                             const Highlighter& highlighter)
    : runner_(runner),
      command_(std::move(command)),
      query_(std::move(query)),
      highlighter_(highlighter)
{
}

void SearchResults::forEach(const std::function<void(const std::string&)>& fn) const
{
    CommandOutput result = runner_.capture(command_);

    // Exit status 1 with no output is how pacman reports "no matches".
    if (result.exitCode != 0 && !(result.exitCode == 1 && trim(result.output).empty())) {
        throw CommandFailedError(command_.str(), result.exitCode);
    }

    std::istringstream stream(result.output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        fn(highlighter_.apply(line, query_));
    }
}

std::vector<std::string> SearchResults::collect() const
{
    std::vector<std::string> lines;
    forEach([&lines](const std::string& line) { lines.push_back(line); });
    return lines;
}

// ============================================================================
// CommandPackageManager
// ============================================================================

CommandPackageManager::CommandPackageManager(CommandRunner& runner,
                                             const Highlighter& highlighter,
                                             bool assumeYes)
    : runner_(runner),
      highlighter_(highlighter),
      assumeYes_(assumeYes)
{
}

void CommandPackageManager::runChecked(const Command& command)
{
    log_message("Running: " + command.str());
    int exitCode = runner_.run(command);
    if (exitCode != 0) {
        throw CommandFailedError(command.str(), exitCode);
    }
}

void CommandPackageManager::install(const std::vector<std::string>& packages)
{
    requirePackages(packages, "install");
    runChecked(installCommand(packages));
}

void CommandPackageManager::remove(const std::vector<std::string>& packages)
{
    requirePackages(packages, "remove");
    runChecked(removeCommand(packages));
}

SearchResults CommandPackageManager::search(const std::string& query)
{
    if (trim(query).empty()) {
        throw std::invalid_argument("search: empty query");
    }
    return SearchResults(runner_, searchCommand(query), query, highlighter_);
}

void CommandPackageManager::syncIndex()
{
    runChecked(syncCommand());
}

void CommandPackageManager::upgradeAll()
{
    runChecked(upgradeCommand());
}

std::vector<std::string> CommandPackageManager::removeOrphans()
{
    std::vector<std::string> orphans = computeOrphans();
    if (orphans.empty()) {
        log_message("No orphaned packages, nothing to do");
        return orphans;
    }

    log_message("Removing " + std::to_string(orphans.size()) + " orphaned package(s): " +
                join(orphans));
    runChecked(orphanRemovalCommand(orphans));
    return orphans;
}

// ============================================================================
// AptGetManager
// ============================================================================

Command AptGetManager::installCommand(const std::vector<std::string>& packages) const
{
    std::vector<std::string> args{"install"};
    if (assumeYes_) {
        args.push_back("-y");
    }
    return privileged("apt-get", withPackages(args, packages));
}

Command AptGetManager::removeCommand(const std::vector<std::string>& packages) const
{
    std::vector<std::string> args{"remove"};
    if (assumeYes_) {
        args.push_back("-y");
    }
    return privileged("apt-get", withPackages(args, packages));
}

Command AptGetManager::searchCommand(const std::string& query) const
{
    return unprivileged("apt-cache", {"search", query});
}

Command AptGetManager::syncCommand() const
{
    return privileged("apt-get", {"update"});
}

Command AptGetManager::upgradeCommand() const
{
    std::vector<std::string> args{"upgrade"};
    if (assumeYes_) {
        args.push_back("-y");
    }
    return privileged("apt-get", args);
}

Command AptGetManager::orphanRemovalCommand(const std::vector<std::string>& orphans) const
{
    return removeCommand(orphans);
}

std::vector<std::string> AptGetManager::computeOrphans()
{
    Command query = unprivileged("apt-get", {"--simulate", "autoremove"});
    CommandOutput result = runner_.capture(query);
    if (result.exitCode != 0) {
        throw CommandFailedError(query.str(), result.exitCode);
    }

    // Simulated removals look like: "Remv libfoo1 [1.2-3]"
    std::vector<std::string> orphans;
    std::istringstream stream(result.output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind("Remv ", 0) != 0) {
            continue;
        }
        std::istringstream fields(line.substr(5));
        std::string name;
        if (fields >> name) {
            orphans.push_back(name);
        }
    }
    return orphans;
}

// ============================================================================
// PacmanManager
// ============================================================================

Command PacmanManager::installCommand(const std::vector<std::string>& packages) const
{
    std::vector<std::string> args{"-S", "--needed"};
    if (assumeYes_) {
        args.push_back("--noconfirm");
    }
    return privileged("pacman", withPackages(args, packages));
}

Command PacmanManager::removeCommand(const std::vector<std::string>& packages) const
{
    std::vector<std::string> args{"-Rs"};
    if (assumeYes_) {
        args.push_back("--noconfirm");
    }
    return privileged("pacman", withPackages(args, packages));
}

Command PacmanManager::searchCommand(const std::string& query) const
{
    return unprivileged("pacman", {"-Ss", query});
}

Command PacmanManager::syncCommand() const
{
    return privileged("pacman", {"-Sy"});
}

Command PacmanManager::upgradeCommand() const
{
    std::vector<std::string> args{"-Syu"};
    if (assumeYes_) {
        args.push_back("--noconfirm");
    }
    return privileged("pacman", args);
}

Command PacmanManager::orphanRemovalCommand(const std::vector<std::string>& orphans) const
{
    std::vector<std::string> args{"-Rns"};
    if (assumeYes_) {
        args.push_back("--noconfirm");
    }
    return privileged("pacman", withPackages(args, orphans));
}

std::vector<std::string> PacmanManager::computeOrphans()
{
    Command query = unprivileged("pacman", {"-Qdtq"});
    CommandOutput result = runner_.capture(query);

    // pacman exits 1 with empty output when there are no orphans
    if (result.exitCode == 1 && trim(result.output).empty()) {
        return {};
    }
    if (result.exitCode != 0) {
        throw CommandFailedError(query.str(), result.exitCode);
    }
    return splitWords(result.output);
}

// ============================================================================
// UnsupportedManager
// ============================================================================

UnsupportedManager::UnsupportedManager(std::string raw)
    : raw_(std::move(raw))
{
}

void UnsupportedManager::install(const std::vector<std::string>&)
{
    throw UnsupportedManagerError(raw_);
}

void UnsupportedManager::remove(const std::vector<std::string>&)
{
    throw UnsupportedManagerError(raw_);
}

SearchResults UnsupportedManager::search(const std::string&)
{
    throw UnsupportedManagerError(raw_);
}

void UnsupportedManager::syncIndex()
{
    throw UnsupportedManagerError(raw_);
}

void UnsupportedManager::upgradeAll()
{
    throw UnsupportedManagerError(raw_);
}

std::vector<std::string> UnsupportedManager::removeOrphans()
{
    throw UnsupportedManagerError(raw_);
}

} // namespace Bulkpack
