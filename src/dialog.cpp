#include "dialog.hpp"
#include "errors.hpp"
#include "process.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h> // mkstemp, close, unlink, lseek, read

namespace Bulkpack {

// ============================================================================
// ChoiceChannel
// ============================================================================

ChoiceChannel::ChoiceChannel(const std::string& directory)
{
    std::string dir = directory;
    if (dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        dir = (tmp && *tmp) ? tmp : "/tmp";
    }

    std::string pattern = dir + "/bulkpack-choice-XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    fd_ = mkstemp(buffer.data());
    if (fd_ < 0) {
        throw std::system_error(errno, std::system_category(),
                                "Unable to create dialog channel in " + dir);
    }
    path_ = buffer.data();
}

ChoiceChannel::~ChoiceChannel()
{
    if (fd_ >= 0) {
        close(fd_);
    }
    if (!path_.empty() && unlink(path_.c_str()) != 0 && errno != ENOENT) {
        log_warning("Failed to remove dialog channel " + path_);
    }
}

std::string ChoiceChannel::read()
{
    if (consumed_) {
        throw std::logic_error("Dialog channel already read: " + path_);
    }
    consumed_ = true;

    if (lseek(fd_, 0, SEEK_SET) < 0) {
        throw std::system_error(errno, std::system_category(), "lseek on " + path_);
    }

    std::string contents;
    char buffer[1024];
    ssize_t n;
    while ((n = ::read(fd_, buffer, sizeof(buffer))) != 0) {
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::system_category(), "read from " + path_);
        }
        contents.append(buffer, static_cast<size_t>(n));
    }
    return contents;
}

// ============================================================================
// Output parsing
// ============================================================================

std::vector<std::string> parseDialogOutput(const std::string& output, DialogMode mode)
{
    std::string text = trim(output);
    if (text.empty() || mode == DialogMode::YesNo) {
        return {};
    }
    if (mode == DialogMode::Menu) {
        return {text};
    }
    return splitWords(text);
}

// ============================================================================
// ExternalDialog
// ============================================================================

ExternalDialog::ExternalDialog(std::string program, std::string channelDirectory)
    : program_(std::move(program)),
      channelDirectory_(std::move(channelDirectory))
{
}

bool ExternalDialog::isAvailable() const
{
    return Process::programExists(program_);
}

std::vector<std::string> ExternalDialog::buildArgv(const DialogRequest& request) const
{
    const DialogGeometry& g = request.geometry;
    std::vector<std::string> argv{program_};

    if (!request.title.empty()) {
        argv.push_back("--title");
        argv.push_back(request.title);
    }

    switch (request.mode) {
    case DialogMode::Menu:
        argv.insert(argv.end(), {"--menu", request.text, std::to_string(g.height),
                                 std::to_string(g.width), std::to_string(g.listHeight)});
        for (const auto& item : request.items) {
            argv.push_back(item.tag);
            argv.push_back(item.label);
        }
        break;
    case DialogMode::Checklist:
        argv.insert(argv.end(), {"--checklist", request.text, std::to_string(g.height),
                                 std::to_string(g.width), std::to_string(g.listHeight)});
        for (const auto& item : request.items) {
            argv.push_back(item.tag);
            argv.push_back(item.label);
            argv.push_back(item.checked ? "on" : "off");
        }
        break;
    case DialogMode::YesNo:
        argv.insert(argv.end(), {"--yesno", request.text, std::to_string(g.height),
                                 std::to_string(g.width)});
        break;
    }
    return argv;
}

DialogResult ExternalDialog::show(const DialogRequest& request)
{
    ChoiceChannel channel(channelDirectory_);
    lastChannelPath_ = channel.path();

    Process::Redirects redirects;
    redirects.stderrFd = channel.fd();
    int exitCode = Process::execute(buildArgv(request), redirects);

    std::string output = channel.read();

    DialogResult result;
    switch (exitCode) {
    case 0:
        result.outcome = DialogOutcome::Ok;
        result.tags    = parseDialogOutput(output, request.mode);
        break;
    case 1:   // Cancel / No
    case 255: // Escape
        result.outcome = DialogOutcome::Cancel;
        break;
    default:
        throw DialogError(program_ + " exited with status " + std::to_string(exitCode) +
                          (output.empty() ? "" : ": " + trim(output)));
    }
    return result;
}

} // namespace Bulkpack
