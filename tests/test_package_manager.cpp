#include "errors.hpp"
#include "fakes.hpp"
#include "manager_registry.hpp"
#include "package_manager.hpp"
#include "utils.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

using namespace Bulkpack;
using Bulkpack::Testing::RecordingRunner;

namespace {

Command expected(const std::string& program, std::vector<std::string> args, bool privileged)
{
    Command command;
    command.program    = program;
    command.args       = std::move(args);
    command.privileged = privileged;
    return command;
}

class PackageManagerTest : public ::testing::Test
{
protected:
    RecordingRunner runner;
    Highlighter plain{false};
    Highlighter color{true};
};

} // namespace

TEST_F(PackageManagerTest, AptInstallIsOneBatchedPrivilegedCall)
{
    AptGetManager apt(runner, plain, false);
    apt.install({"vim", "git"});

    ASSERT_EQ(runner.runs.size(), 1u);
    EXPECT_EQ(runner.runs[0], expected("apt-get", {"install", "vim", "git"}, true));
    EXPECT_TRUE(runner.captures.empty());
}

TEST_F(PackageManagerTest, EveryMutatingOperationIssuesExactlyOneInvocation)
{
    const std::vector<std::string> ids{"zsh", "tmux", "htop", "bat"};

    struct Case
    {
        std::string backend;
        std::function<void(PackageManager&)> op;
        Command command;
    };

    const std::vector<Case> cases = {
        {"apt-get", [&](PackageManager& m) { m.install(ids); },
         expected("apt-get", {"install", "zsh", "tmux", "htop", "bat"}, true)},
        {"apt-get", [&](PackageManager& m) { m.remove(ids); },
         expected("apt-get", {"remove", "zsh", "tmux", "htop", "bat"}, true)},
        {"apt-get", [](PackageManager& m) { m.syncIndex(); },
         expected("apt-get", {"update"}, true)},
        {"apt-get", [](PackageManager& m) { m.upgradeAll(); },
         expected("apt-get", {"upgrade"}, true)},
        {"pacman", [&](PackageManager& m) { m.install(ids); },
         expected("pacman", {"-S", "--needed", "zsh", "tmux", "htop", "bat"}, true)},
        {"pacman", [&](PackageManager& m) { m.remove(ids); },
         expected("pacman", {"-Rs", "zsh", "tmux", "htop", "bat"}, true)},
        {"pacman", [](PackageManager& m) { m.syncIndex(); },
         expected("pacman", {"-Sy"}, true)},
        {"pacman", [](PackageManager& m) { m.upgradeAll(); },
         expected("pacman", {"-Syu"}, true)},
    };

    for (const auto& c : cases) {
        RecordingRunner local;
        Config config;
        config.packageManager = c.backend;
        ManagerRegistry registry(config);
        auto manager = registry.createManager(local, plain);

        c.op(*manager);

        ASSERT_EQ(local.runs.size(), 1u) << c.command.str();
        EXPECT_EQ(local.runs[0], c.command) << local.runs[0].str();
        EXPECT_TRUE(local.captures.empty());
    }
}

TEST_F(PackageManagerTest, AssumeYesAddsNonInteractiveFlags)
{
    AptGetManager apt(runner, plain, true);
    PacmanManager pacman(runner, plain, true);

    apt.install({"git"});
    pacman.install({"git"});
    pacman.upgradeAll();

    ASSERT_EQ(runner.runs.size(), 3u);
    EXPECT_EQ(runner.runs[0], expected("apt-get", {"install", "-y", "git"}, true));
    EXPECT_EQ(runner.runs[1], expected("pacman", {"-S", "--needed", "--noconfirm", "git"}, true));
    EXPECT_EQ(runner.runs[2], expected("pacman", {"-Syu", "--noconfirm"}, true));
}

TEST_F(PackageManagerTest, FailedCommandThrowsWithExitCode)
{
    runner.exitCodes["apt-get install nosuchpkg"] = 100;
    AptGetManager apt(runner, plain, false);

    try {
        apt.install({"nosuchpkg"});
        FAIL() << "expected CommandFailedError";
    } catch (const CommandFailedError& e) {
        EXPECT_EQ(e.exitCode(), 100);
        EXPECT_EQ(e.command(), "apt-get install nosuchpkg");
    }
}

TEST_F(PackageManagerTest, EmptyPackageListIsRejectedWithoutCalls)
{
    PacmanManager pacman(runner, plain, false);

    EXPECT_THROW(pacman.install({}), std::invalid_argument);
    EXPECT_THROW(pacman.remove({}), std::invalid_argument);
    EXPECT_EQ(runner.totalCalls(), 0u);
}

TEST_F(PackageManagerTest, SearchIsLazyAndRestartable)
{
    runner.outputs["apt-cache search vim"] = CommandOutput{0, "vim - Vi IMproved\nneovim - fork of vim\n"};
    AptGetManager apt(runner, plain, false);

    SearchResults results = apt.search("vim");
    EXPECT_EQ(runner.totalCalls(), 0u);

    std::vector<std::string> first  = results.collect();
    std::vector<std::string> second = results.collect();

    EXPECT_EQ(runner.captures.size(), 2u);
    EXPECT_EQ(runner.captures[0], expected("apt-cache", {"search", "vim"}, false));
    EXPECT_EQ(first, (std::vector<std::string>{"vim - Vi IMproved", "neovim - fork of vim"}));
    EXPECT_EQ(first, second);
}

TEST_F(PackageManagerTest, SearchHighlightsQueryCaseInsensitively)
{
    runner.outputs["pacman -Ss vim"] = CommandOutput{0, "extra/gVim 9.0\n"};
    PacmanManager pacman(runner, color, false);

    std::vector<std::string> lines = pacman.search("vim").collect();

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], std::string("extra/g") + COLOR_MATCH + "Vim" + COLOR_RESET + " 9.0");
}

TEST_F(PackageManagerTest, SearchWithoutHighlighterPassesThroughAndWarnsOnce)
{
    runner.outputs["pacman -Ss vim"] = CommandOutput{0, "extra/vim\nextra/gvim\n"};
    PacmanManager pacman(runner, plain, false);

    EXPECT_FALSE(plain.warned());
    std::vector<std::string> lines = pacman.search("vim").collect();

    EXPECT_EQ(lines, (std::vector<std::string>{"extra/vim", "extra/gvim"}));
    EXPECT_TRUE(plain.warned());
}

TEST_F(PackageManagerTest, PacmanSearchWithNoMatchesIsEmpty)
{
    runner.outputs["pacman -Ss zzz"] = CommandOutput{1, ""};
    PacmanManager pacman(runner, plain, false);

    EXPECT_TRUE(pacman.search("zzz").collect().empty());
}

TEST_F(PackageManagerTest, SearchBackendErrorThrows)
{
    runner.outputs["apt-cache search vim"] = CommandOutput{100, ""};
    AptGetManager apt(runner, plain, false);

    SearchResults results = apt.search("vim");
    EXPECT_THROW(results.collect(), CommandFailedError);
}

TEST_F(PackageManagerTest, AptRemoveOrphansWithNothingToDo)
{
    runner.outputs["apt-get --simulate autoremove"] =
        CommandOutput{0, "Reading package lists...\n0 upgraded, 0 newly installed, 0 to remove\n"};
    AptGetManager apt(runner, plain, false);

    EXPECT_TRUE(apt.removeOrphans().empty());
    EXPECT_EQ(runner.captures.size(), 1u);
    EXPECT_TRUE(runner.runs.empty());
}

TEST_F(PackageManagerTest, AptRemoveOrphansRemovesAllInOneCall)
{
    runner.outputs["apt-get --simulate autoremove"] = CommandOutput{0,
        "Reading package lists...\n"
        "Remv libfoo1 [1.2-3]\n"
        "Remv libbar2 [0.9]\n"};
    AptGetManager apt(runner, plain, false);

    std::vector<std::string> removed = apt.removeOrphans();

    EXPECT_EQ(removed, (std::vector<std::string>{"libfoo1", "libbar2"}));
    ASSERT_EQ(runner.runs.size(), 1u);
    EXPECT_EQ(runner.runs[0], expected("apt-get", {"remove", "libfoo1", "libbar2"}, true));
}

TEST_F(PackageManagerTest, PacmanRemoveOrphans)
{
    RecordingRunner none;
    none.outputs["pacman -Qdtq"] = CommandOutput{1, ""};
    PacmanManager idle(none, plain, false);
    EXPECT_TRUE(idle.removeOrphans().empty());
    EXPECT_TRUE(none.runs.empty());

    runner.outputs["pacman -Qdtq"] = CommandOutput{0, "python-six\nlibxss\n"};
    PacmanManager pacman(runner, plain, false);
    pacman.removeOrphans();

    ASSERT_EQ(runner.runs.size(), 1u);
    EXPECT_EQ(runner.runs[0], expected("pacman", {"-Rns", "python-six", "libxss"}, true));
}

TEST_F(PackageManagerTest, UnsupportedManagerNeverCallsOut)
{
    Config config;
    config.packageManager = "zypper";
    ManagerRegistry registry(config);
    std::unique_ptr<PackageManager> manager = registry.createManager(runner, plain);

    const std::vector<std::function<void()>> operations = {
        [&] { manager->install({"vim"}); },
        [&] { manager->remove({"vim"}); },
        [&] { manager->search("vim"); },
        [&] { manager->syncIndex(); },
        [&] { manager->upgradeAll(); },
        [&] { manager->removeOrphans(); },
    };

    for (const auto& operation : operations) {
        try {
            operation();
            FAIL() << "expected UnsupportedManagerError";
        } catch (const UnsupportedManagerError& e) {
            EXPECT_EQ(e.raw(), "zypper");
        }
    }
    EXPECT_EQ(runner.totalCalls(), 0u);
}
