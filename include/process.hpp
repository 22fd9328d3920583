#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

namespace Bulkpack {

/**
 * @brief A single external command invocation.
 */
struct Command
{
    std::string program;
    std::vector<std::string> args;
    bool privileged = false; // needs root; the runner elevates it

    /**
     * @brief Human readable form, e.g. "apt-get install vim git".
     */
    std::string str() const;

    bool operator==(const Command& other) const
    {
        return program == other.program && args == other.args &&
               privileged == other.privileged;
    }
};

/**
 * @brief Exit status plus captured standard output of a command.
 */
struct CommandOutput
{
    int exitCode = 0;
    std::string output;
};

/**
 * @class CommandRunner
 * @brief Executes backend commands. Adapters only talk to the system
 *        through this interface.
 */
class CommandRunner
{
public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Runs a command attached to the current terminal and waits for it.
     * @return The exit code, or -1 if the process was killed by a signal.
     */
    virtual int run(const Command& command) = 0;

    /**
     * @brief Runs a command and captures its standard output.
     */
    virtual CommandOutput capture(const Command& command) = 0;

    /**
     * @brief Checks whether a program can be found on PATH.
     */
    virtual bool exists(const std::string& program) const = 0;
};

/**
 * @class SystemCommandRunner
 * @brief fork/exec based runner. Privileged commands are prefixed with the
 *        configured privilege command (e.g. "sudo") unless already root.
 */
class SystemCommandRunner : public CommandRunner
{
public:
    explicit SystemCommandRunner(std::string privilegeCommand = "sudo");

    int run(const Command& command) override;
    CommandOutput capture(const Command& command) override;
    bool exists(const std::string& program) const override;

    /**
     * @brief Builds the argv actually passed to execvp.
     */
    std::vector<std::string> buildArgv(const Command& command) const;

private:
    std::string privilegeCommand_;
};

namespace Process {

/**
 * @brief File descriptors to install over the child's stdout/stderr.
 *        -1 leaves the stream inherited from the parent.
 */
struct Redirects
{
    int stdoutFd = -1;
    int stderrFd = -1;
};

/**
 * @brief Forks, applies the redirects and execs argv[0] via PATH lookup.
 *
 * @param argv Program followed by its arguments. Must not be empty.
 * @param redirects Optional stream redirects for the child.
 * @return The child's exit code, 127 if exec failed, -1 if it was signaled.
 * @throws std::system_error if fork or waitpid fail.
 */
int execute(const std::vector<std::string>& argv, const Redirects& redirects = {});

/**
 * @brief Searches PATH for an executable file named program. Names
 *        containing a slash are checked directly.
 */
bool programExists(const std::string& program);

} // namespace Process

} // namespace Bulkpack

#endif // PROCESS_HPP
