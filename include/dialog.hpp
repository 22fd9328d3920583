#ifndef DIALOG_HPP
#define DIALOG_HPP

#include "config.hpp"

#include <string>
#include <vector>

namespace Bulkpack {

enum class DialogMode
{
    Menu,      // single choice
    Checklist, // multiple choice
    YesNo      // confirmation, no items
};

enum class DialogOutcome
{
    Ok,
    Cancel
};

struct DialogItem
{
    std::string tag;
    std::string label;
    bool checked = false; // Checklist only
};

struct DialogRequest
{
    std::string title;
    std::string text;
    DialogGeometry geometry;
    std::vector<DialogItem> items;
    DialogMode mode = DialogMode::Menu;
};

struct DialogResult
{
    DialogOutcome outcome = DialogOutcome::Cancel;
    std::vector<std::string> tags; // raw, possibly quoted

    bool ok() const { return outcome == DialogOutcome::Ok; }
};

/**
 * @class DialogProvider
 * @brief Interactive collaborator that shows one screen and returns the
 *        user's choice.
 */
class DialogProvider
{
public:
    virtual ~DialogProvider() = default;

    virtual bool isAvailable() const = 0;

    /**
     * @brief Displays the request and blocks until the user answers.
     */
    virtual DialogResult show(const DialogRequest& request) = 0;

    /**
     * @brief Name used in error messages.
     */
    virtual std::string name() const = 0;
};

/**
 * @class ChoiceChannel
 * @brief Temporary file the dialog program writes its answer into.
 *
 * Created on construction, deleted on destruction. Non-copyable so only one
 * owner can ever remove it.
 */
class ChoiceChannel
{
public:
    /**
     * @param directory Where to create the file (defaults to $TMPDIR or /tmp).
     * @throws std::system_error if the file cannot be created.
     */
    explicit ChoiceChannel(const std::string& directory = "");
    ~ChoiceChannel();

    ChoiceChannel(const ChoiceChannel&) = delete;
    ChoiceChannel& operator=(const ChoiceChannel&) = delete;

    const std::string& path() const { return path_; }
    int fd() const { return fd_; }

    /**
     * @brief Reads the whole contents. May only be called once.
     * @throws std::logic_error on a second call.
     */
    std::string read();

private:
    std::string path_;
    int fd_ = -1;
    bool consumed_ = false;
};

/**
 * @class ExternalDialog
 * @brief DialogProvider backed by the dialog(1)/whiptail(1) programs.
 *
 * The program's stderr is redirected into a ChoiceChannel for the duration
 * of one call. Exit status 0 means Ok, 1 and 255 mean Cancel.
 */
class ExternalDialog : public DialogProvider
{
public:
    explicit ExternalDialog(std::string program, std::string channelDirectory = "");

    bool isAvailable() const override;
    DialogResult show(const DialogRequest& request) override;
    std::string name() const override { return program_; }

    /**
     * @brief Command line passed to the program for a request.
     */
    std::vector<std::string> buildArgv(const DialogRequest& request) const;

    /**
     * @brief Path of the channel used by the most recent call. The file no
     *        longer exists once show() has returned or thrown.
     */
    const std::string& lastChannelPath() const { return lastChannelPath_; }

private:
    std::string program_;
    std::string channelDirectory_;
    std::string lastChannelPath_;
};

/**
 * @brief Splits dialog output into tags. Checklist output is
 *        space-separated and may be quoted; tags are returned unsanitized.
 */
std::vector<std::string> parseDialogOutput(const std::string& output, DialogMode mode);

} // namespace Bulkpack

#endif // DIALOG_HPP
