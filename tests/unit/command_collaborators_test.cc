#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "system/action_dispatcher.h"
#include "system/command_collaborators.h"
#include "tests/common/fake_collaborators.h"
#include "tests/common/fake_sysroot.h"
#include "tests/common/test_tmpdir.h"

using namespace stratum;
using namespace stratum::system;
using test::ScriptedRunner;

TEST(CommandCollaboratorsTest, ExpandCommand)
{
    EXPECT_EQ(ExpandCommand("dracut --force --kver {kernel}", "kernel", "6.17.0-5-generic"),
              "dracut --force --kver 6.17.0-5-generic");
    EXPECT_EQ(ExpandCommand("{x}-{x}", "x", "ab"), "ab-ab");
    EXPECT_EQ(ExpandCommand("no placeholder", "x", "ab"), "no placeholder");
}

TEST(CommandCollaboratorsTest, ParseAvailableRelease)
{
    EXPECT_EQ(ParseAvailableRelease("Checking for a new Ubuntu release\nNew release '25.04' available.\n"),
              "25.04");
    EXPECT_FALSE(ParseAvailableRelease("No new release found.\n").has_value());
    EXPECT_FALSE(ParseAvailableRelease("New release '").has_value());
}

TEST(CommandCollaboratorsTest, PackageSystemRunsConfiguredCommands)
{
    ScriptedRunner runner;
    runner.Push(ScriptedRunner::Exit(1, "", "New release '25.04' available.\nRun 'do-release-upgrade'\n"));
    runner.Push(ScriptedRunner::Exit(0));
    CommandPackageSystem pkgs("upgrade-to {target}", "do-release-upgrade -c", runner.Runner());

    EXPECT_EQ(pkgs.AvailableTarget(), "25.04");
    ASSERT_STRATUM_OK(pkgs.Upgrade("25.04"));
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1], (std::vector<std::string>{"upgrade-to", "25.04"}));
}

TEST(CommandCollaboratorsTest, NonZeroExitIsActionFailure)
{
    ScriptedRunner runner;
    runner.Push(ScriptedRunner::Exit(100, "", "E: held packages\n"));
    CommandPackageSystem pkgs("do-release-upgrade", "", runner.Runner());
    auto st = pkgs.Upgrade("25.04");
    EXPECT_EQ(st.code(), ErrorCode::kActionFailure);
    EXPECT_NE(st.message().find("held packages"), std::string::npos);
    EXPECT_FALSE(pkgs.AvailableTarget().has_value());
}

TEST(CommandCollaboratorsTest, InitImageSystem)
{
    test::ScopedTempDir dir("stratum_collab");
    test::FakeSysroot root(dir.path());
    root.InstallTool("dracut");

    ScriptedRunner runner;
    CommandInitImageSystem images("dracut --force --kver {kernel}", "update-initramfs -u -k all", root.Options(),
                                  runner.Runner());
    EXPECT_EQ(images.ListInstalledGenerators(), (std::set<std::string>{"dracut"}));

    EXPECT_EQ(images.Regenerate("").code(), ErrorCode::kInvalidArgument);
    ASSERT_STRATUM_OK(images.Regenerate("6.17.0-5-generic"));
    ASSERT_EQ(runner.calls.size(), 1u);
    EXPECT_EQ(runner.calls[0].back(), "6.17.0-5-generic");

    ASSERT_STRATUM_OK(images.RegenerateAll());
    ASSERT_EQ(runner.calls.size(), 2u);
    EXPECT_EQ(runner.calls[1], (std::vector<std::string>{"update-initramfs", "-u", "-k", "all"}));
}

TEST(CommandCollaboratorsTest, EmptyCommandIsNotSupported)
{
    ScriptedRunner runner;
    CommandBootConfigurator boot("", runner.Runner());
    EXPECT_EQ(boot.Sync().code(), ErrorCode::kNotSupported);
    EXPECT_TRUE(runner.calls.empty());
}

TEST(ActionDispatcherTest, RoutesActionsToCollaborators)
{
    auto pkgs = std::make_shared<test::FakePackageSystem>();
    auto images = std::make_shared<test::FakeInitImageSystem>();
    auto boot = std::make_shared<test::FakeBootConfigurator>();
    Collaborators deps{nullptr, pkgs, images, boot};
    ActionDispatcher dispatcher(deps);

    RequiredAction upgrade;
    upgrade.kind = ActionKind::kUpgradePackages;
    upgrade.target = "25.04";
    EXPECT_TRUE(dispatcher.Execute(upgrade).success);
    EXPECT_EQ(pkgs->upgrades, (std::vector<std::string>{"25.04"}));

    RequiredAction regen;
    regen.kind = ActionKind::kRegenerateInitImage;
    regen.target = "6.17.0-5-generic";
    EXPECT_TRUE(dispatcher.Execute(regen).success);
    EXPECT_EQ(images->regenerated.size(), 1u);

    RequiredAction sync;
    sync.kind = ActionKind::kSyncBootConfig;
    boot->result = Status::ActionFailure("mirror missing");
    ActionReport r = dispatcher.Execute(sync);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.detail.find("mirror missing"), std::string::npos);
    EXPECT_EQ(boot->syncs, 1);
}

TEST(ActionDispatcherTest, RebootNeedsAHook)
{
    RequiredAction reboot;
    reboot.kind = ActionKind::kReboot;

    ActionDispatcher without(Collaborators{});
    EXPECT_FALSE(without.CanExecute(reboot));
    EXPECT_FALSE(without.Execute(reboot).success);

    int reboots = 0;
    ActionDispatcher with(Collaborators{}, [&reboots]
                          {
                              ++reboots;
                              return Status::Ok();
                          });
    EXPECT_TRUE(with.CanExecute(reboot));
    EXPECT_TRUE(with.Execute(reboot).success);
    EXPECT_EQ(reboots, 1);
}
