#ifndef FAKES_HPP
#define FAKES_HPP

#include "dialog.hpp"
#include "package_manager.hpp"
#include "process.hpp"

#include <deque>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace Bulkpack {
namespace Testing {

/**
 * Records every command and replays canned exit codes / outputs.
 */
class RecordingRunner : public CommandRunner
{
public:
    std::vector<Command> runs;
    std::vector<Command> captures;

    std::map<std::string, int> exitCodes;          // keyed by Command::str()
    std::map<std::string, CommandOutput> outputs;  // keyed by Command::str()

    int run(const Command& command) override
    {
        runs.push_back(command);
        auto it = exitCodes.find(command.str());
        return it == exitCodes.end() ? 0 : it->second;
    }

    CommandOutput capture(const Command& command) override
    {
        captures.push_back(command);
        auto it = outputs.find(command.str());
        return it == outputs.end() ? CommandOutput{} : it->second;
    }

    bool exists(const std::string&) const override { return true; }

    size_t totalCalls() const { return runs.size() + captures.size(); }
};

/**
 * Replays scripted dialog answers in order and keeps every request.
 */
class ScriptedDialog : public DialogProvider
{
public:
    bool available = true;
    std::deque<DialogResult> answers;
    std::vector<DialogRequest> requests;

    void answer(DialogOutcome outcome, std::vector<std::string> tags = {})
    {
        DialogResult result;
        result.outcome = outcome;
        result.tags    = std::move(tags);
        answers.push_back(result);
    }

    void ok(std::vector<std::string> tags = {}) { answer(DialogOutcome::Ok, std::move(tags)); }
    void cancel() { answer(DialogOutcome::Cancel); }

    bool isAvailable() const override { return available; }

    DialogResult show(const DialogRequest& request) override
    {
        requests.push_back(request);
        if (answers.empty()) {
            throw std::runtime_error("ScriptedDialog ran out of answers");
        }
        DialogResult result = answers.front();
        answers.pop_front();
        return result;
    }

    std::string name() const override { return "scripted"; }
};

/**
 * PackageManager that records install batches and fails chosen batches.
 */
class RecordingManager : public PackageManager
{
public:
    std::vector<std::vector<std::string>> installs;
    std::set<std::string> failOn; // fail any batch containing one of these

    std::string name() const override { return "recording"; }

    void install(const std::vector<std::string>& packages) override
    {
        installs.push_back(packages);
        for (const auto& package : packages) {
            if (failOn.count(package)) {
                throw std::runtime_error("unable to locate package " + package);
            }
        }
    }

    void remove(const std::vector<std::string>&) override {}

    SearchResults search(const std::string&) override
    {
        throw std::logic_error("search not used");
    }

    void syncIndex() override {}
    void upgradeAll() override {}
    std::vector<std::string> removeOrphans() override { return {}; }
};

} // namespace Testing
} // namespace Bulkpack

#endif // FAKES_HPP
