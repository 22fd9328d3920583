#include "config.hpp"
#include "fakes.hpp"
#include "manager_registry.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace Bulkpack;

namespace {

size_t countWarnings(const std::string& output)
{
    size_t count = 0;
    for (size_t pos = output.find("[WARN]"); pos != std::string::npos;
         pos = output.find("[WARN]", pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST(ManagerRegistryTest, ResolvesKnownValues)
{
    EXPECT_EQ(ManagerRegistry::resolve("apt").kind, ManagerKind::AptGet);
    EXPECT_EQ(ManagerRegistry::resolve("apt-get").kind, ManagerKind::AptGet);
    EXPECT_EQ(ManagerRegistry::resolve("pacman").kind, ManagerKind::Pacman);
}

TEST(ManagerRegistryTest, UnknownValuesCarryTheRawValue)
{
    for (const std::string value : {"", "yum", "Pacman", " apt", "brew"}) {
        ManagerSelection selection = ManagerRegistry::resolve(value);
        EXPECT_EQ(selection.kind, ManagerKind::Unsupported) << value;
        EXPECT_EQ(selection.raw, value);
        EXPECT_FALSE(selection.supported());
    }
}

TEST(ManagerRegistryTest, KnownValuesAllResolve)
{
    for (const auto& value : ManagerRegistry::knownValues()) {
        EXPECT_TRUE(ManagerRegistry::resolve(value).supported()) << value;
    }
}

TEST(ManagerRegistryTest, CreatesAdapterForResolvedKind)
{
    Testing::RecordingRunner runner;
    Highlighter highlighter(false);

    Config config;
    config.packageManager = "apt";
    EXPECT_EQ(ManagerRegistry(config).createManager(runner, highlighter)->name(), "apt-get");

    config.packageManager = "pacman";
    EXPECT_EQ(ManagerRegistry(config).createManager(runner, highlighter)->name(), "pacman");

    config.packageManager = "";
    ManagerRegistry unset(config);
    EXPECT_EQ(unset.selection().kind, ManagerKind::Unsupported);
    EXPECT_EQ(unset.createManager(runner, highlighter)->name(), "unsupported");
}

TEST(ManagerRegistryTest, KindNames)
{
    EXPECT_EQ(toString(ManagerKind::AptGet), "apt-get");
    EXPECT_EQ(toString(ManagerKind::Pacman), "pacman");
    EXPECT_EQ(toString(ManagerKind::Unsupported), "unsupported");
}

TEST(ManagerRegistryTest, WarnsOnceWhenUnset)
{
    testing::internal::CaptureStderr();
    ManagerRegistry unset{Config{}};
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(countWarnings(output), 1u);
    EXPECT_NE(output.find("No package manager configured"), std::string::npos);
    EXPECT_FALSE(unset.selection().supported());

    Config config;
    config.packageManager = "pacman";
    testing::internal::CaptureStderr();
    ManagerRegistry pacman(config);
    EXPECT_EQ(countWarnings(testing::internal::GetCapturedStderr()), 0u);
}

TEST(ManagerRegistryTest, CheckSupportedWarnsWithRawValue)
{
    Config config;
    config.packageManager = "yum";
    ManagerRegistry registry(config);

    testing::internal::CaptureStderr();
    EXPECT_FALSE(registry.checkSupported());
    std::string output = testing::internal::GetCapturedStderr();
    EXPECT_EQ(countWarnings(output), 1u);
    EXPECT_NE(output.find("yum"), std::string::npos);

    config.packageManager = "apt-get";
    testing::internal::CaptureStderr();
    EXPECT_TRUE(ManagerRegistry(config).checkSupported());
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}
