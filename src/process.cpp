#include "process.hpp"
#include "utils.hpp"

#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include <system_error>
#include <filesystem>
#include <utility>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <unistd.h>    // fork, execvp, dup2, pipe, _exit
#include <errno.h>
#include <cstdlib>     // getenv

namespace fs = std::filesystem;

namespace Bulkpack {

std::string Command::str() const
{
    std::string text = program;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

namespace Process {

    int execute(const std::vector<std::string>& argv, const Redirects& redirects)
    {
        if (argv.empty() || argv[0].empty()) {
            throw std::invalid_argument("Process::execute: empty command");
        }

        // Prepare arguments before forking
        std::vector<char*> cargv;
        for (const auto& arg : argv) {
            cargv.push_back(const_cast<char*>(arg.c_str()));
        }
        cargv.push_back(nullptr); // Null terminator

        pid_t pid = fork();
        if (pid < 0) {
            throw std::system_error(errno, std::system_category(), "Fork failed");
        }

        // --- Child Process ---
        if (pid == 0) {
            if (redirects.stdoutFd >= 0 && dup2(redirects.stdoutFd, STDOUT_FILENO) < 0) {
                _exit(127);
            }
            if (redirects.stderrFd >= 0 && dup2(redirects.stderrFd, STDERR_FILENO) < 0) {
                _exit(127);
            }

            execvp(cargv[0], cargv.data());

            // If execvp returns, an error occurred
            perror(("execvp failed for command: " + argv[0]).c_str());
            _exit(127);
        }

        // --- Parent Process ---
        int status = 0;
        pid_t waited;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            throw std::system_error(errno, std::system_category(), "waitpid failed");
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            log_warning(argv[0] + " terminated by signal " + std::to_string(WTERMSIG(status)));
        }
        return -1;
    }

    bool programExists(const std::string& program)
    {
        if (program.empty()) {
            return false;
        }
        if (program.find('/') != std::string::npos) {
            return access(program.c_str(), X_OK) == 0;
        }

        const char* path = std::getenv("PATH");
        std::string searchPath = path ? path : "/usr/local/bin:/usr/bin:/bin";

        size_t start = 0;
        while (start <= searchPath.size()) {
            size_t end = searchPath.find(':', start);
            if (end == std::string::npos) {
                end = searchPath.size();
            }
            std::string dir = searchPath.substr(start, end - start);
            if (dir.empty()) {
                dir = ".";
            }

            std::error_code ec;
            fs::path candidate = fs::path(dir) / program;
            if (fs::is_regular_file(candidate, ec) &&
                access(candidate.c_str(), X_OK) == 0) {
                return true;
            }
            start = end + 1;
        }
        return false;
    }

} // namespace Process

SystemCommandRunner::SystemCommandRunner(std::string privilegeCommand)
    : privilegeCommand_(std::move(privilegeCommand))
{
}

std::vector<std::string> SystemCommandRunner::buildArgv(const Command& command) const
{
    std::vector<std::string> argv;
    if (command.privileged && geteuid() != 0 && !privilegeCommand_.empty()) {
        argv.push_back(privilegeCommand_);
    }
    argv.push_back(command.program);
    argv.insert(argv.end(), command.args.begin(), command.args.end());
    return argv;
}

int SystemCommandRunner::run(const Command& command)
{
    return Process::execute(buildArgv(command));
}

CommandOutput SystemCommandRunner::capture(const Command& command)
{
    int fds[2];
    if (pipe(fds) != 0) {
        throw std::system_error(errno, std::system_category(), "pipe failed");
    }

    CommandOutput result;

    std::vector<std::string> argv = buildArgv(command);
    std::vector<char*> cargv;
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        throw std::system_error(err, std::system_category(), "Fork failed");
    }

    if (pid == 0) {
        close(fds[0]);
        if (dup2(fds[1], STDOUT_FILENO) < 0) {
            _exit(127);
        }
        close(fds[1]);
        execvp(cargv[0], cargv.data());
        perror(("execvp failed for command: " + argv[0]).c_str());
        _exit(127);
    }

    // Drain the pipe before waiting, a full pipe would block the child
    close(fds[1]);
    char buffer[4096];
    ssize_t n;
    while ((n = read(fds[0], buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(fds[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        throw std::system_error(errno, std::system_category(), "waitpid failed");
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

bool SystemCommandRunner::exists(const std::string& program) const
{
    return Process::programExists(program);
}

} // namespace Bulkpack
