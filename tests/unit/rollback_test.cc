#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "core/fact_collector.h"
#include "core/rollback.h"
#include "storage/checkpoint_store.h"
#include "tests/common/fake_collaborators.h"
#include "tests/common/fake_sysroot.h"
#include "tests/common/memory_backend.h"
#include "tests/common/test_tmpdir.h"

using namespace stratum;
using stratum::core::RollbackExecutor;
using stratum::core::RollbackSelector;

class RollbackTest : public ::testing::Test
{
protected:
    RollbackTest() : dir_("stratum_rollback"), root_(dir_.path()) {}

    void SetUp() override
    {
        root_.SetRelease("25.04");
        root_.SetKernel("6.14.0-27-generic");
        root_.SetBootId("boot-1");

        backend_ = std::make_shared<test::MemoryBackend>();
        CheckpointStoreOptions opts;
        opts.clock = [this]
        { return now_; };
        store_ = std::make_unique<storage::CheckpointStore>(backend_, opts);
        collector_ = std::make_unique<core::FactCollector>(root_.Options(), backend_);
        images_ = std::make_shared<test::FakeInitImageSystem>();
        boot_ = std::make_shared<test::FakeBootConfigurator>();

        state_.run_id = "run-1";
        state_.current_phase = Phase::kPackagesUpgraded;
    }

    CheckpointGroup MustCreate(const std::string &label, Phase phase)
    {
        CheckpointGroup g;
        auto st = store_->Create(label, "run-1", phase, &g);
        EXPECT_TRUE(st.ok()) << st.ToString();
        return g;
    }

    RollbackExecutor Executor()
    {
        return RollbackExecutor(store_.get(), collector_.get(), images_, boot_, MigrationPlan{}, [this]
                                { return now_; });
    }

    uint64_t now_ = 1760000000;
    test::ScopedTempDir dir_;
    test::FakeSysroot root_;
    std::shared_ptr<test::MemoryBackend> backend_;
    std::unique_ptr<storage::CheckpointStore> store_;
    std::unique_ptr<core::FactCollector> collector_;
    std::shared_ptr<test::FakeInitImageSystem> images_;
    std::shared_ptr<test::FakeBootConfigurator> boot_;
    MigrationState state_;
};

TEST_F(RollbackTest, NoCandidatesIsPreconditionFailure)
{
    RollbackSelector selector(store_.get());
    CheckpointGroup g;
    auto st = selector.Select(RollbackCriterion{}, &g);
    EXPECT_EQ(st.code(), ErrorCode::kPreconditionFailure);
}

TEST_F(RollbackTest, CandidatesAreNewestFirst)
{
    MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    now_ += 7200;
    MustCreate("before-dracut-migration", Phase::kRebootedStep2);

    RollbackSelector selector(store_.get());
    std::vector<CheckpointGroup> c;
    ASSERT_STRATUM_OK(selector.Candidates(false, &c));
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ(c[0].key.label, "before-dracut-migration");
    EXPECT_EQ(c[1].key.label, "before-upgrade-to-plucky");

    CheckpointGroup latest;
    ASSERT_STRATUM_OK(selector.Select(RollbackCriterion{}, &latest));
    EXPECT_EQ(latest.key.label, "before-dracut-migration");
}

TEST_F(RollbackTest, SelectByIndexAndKey)
{
    CheckpointGroup older = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    MustCreate("before-dracut-migration", Phase::kRebootedStep2);
    RollbackSelector selector(store_.get());

    RollbackCriterion by_index;
    by_index.kind = RollbackCriterion::Kind::kIndex;
    by_index.index = 1;
    CheckpointGroup g;
    ASSERT_STRATUM_OK(selector.Select(by_index, &g));
    EXPECT_EQ(g.key, older.key);

    by_index.index = 2;
    EXPECT_EQ(selector.Select(by_index, &g).code(), ErrorCode::kInvalidArgument);

    RollbackCriterion by_key;
    by_key.kind = RollbackCriterion::Kind::kKey;
    by_key.key = older.key;
    ASSERT_STRATUM_OK(selector.Select(by_key, &g));
    EXPECT_EQ(g.key, older.key);

    by_key.key.created_at = 1;
    EXPECT_EQ(selector.Select(by_key, &g).code(), ErrorCode::kNotFound);
}

TEST_F(RollbackTest, InconsistentGroupIsNeverOffered)
{
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->DropSnapshot("rpool/home", g.checkpoints.front().name);

    RollbackSelector selector(store_.get());
    std::vector<CheckpointGroup> c;
    ASSERT_STRATUM_OK(selector.Candidates(true, &c));
    EXPECT_TRUE(c.empty());

    RollbackCriterion by_key;
    by_key.kind = RollbackCriterion::Kind::kKey;
    by_key.key = g.key;
    CheckpointGroup out;
    EXPECT_EQ(selector.Select(by_key, &out).code(), ErrorCode::kPreconditionFailure);
}

TEST_F(RollbackTest, SafetyGroupsOnlyOnRequest)
{
    MustCreate("before-rollback", Phase::kPackagesUpgraded);
    RollbackSelector selector(store_.get());
    std::vector<CheckpointGroup> c;
    ASSERT_STRATUM_OK(selector.Candidates(false, &c));
    EXPECT_TRUE(c.empty());
    ASSERT_STRATUM_OK(selector.Candidates(true, &c));
    EXPECT_EQ(c.size(), 1u);
}

TEST_F(RollbackTest, ExecuteRestoresAndResetsPhase)
{
    root_.SetRelease("24.04");
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->Write("rpool/ROOT/ubuntu", "plucky");
    state_.pending = PendingAction{};

    now_ += 60;
    RollbackResult res = Executor().Execute(g, &state_);
    ASSERT_EQ(res.outcome, Outcome::kSuccess) << res.status.ToString();
    EXPECT_EQ(res.restored, g.key);
    EXPECT_EQ(res.rolled_back_units.size(), 4u);
    EXPECT_TRUE(res.quarantined_units.empty());
    EXPECT_TRUE(res.reboot_required);
    EXPECT_EQ(backend_->Read("rpool/ROOT/ubuntu"), "initial");

    // Boot images and boot config are rebuilt for the restored root.
    EXPECT_EQ(images_->regenerate_all_calls, 1);
    EXPECT_EQ(boot_->syncs, 1);

    EXPECT_EQ(state_.current_phase, Phase::kCheckpointed);
    EXPECT_FALSE(state_.pending.has_value());
    EXPECT_EQ(state_.last_checkpoint_group, g.key);
    ASSERT_FALSE(state_.history.empty());
    EXPECT_EQ(state_.history.back().event, HistoryEvent::kRolledBack);
    EXPECT_EQ(state_.history.back().to, Phase::kRolledBack);
}

TEST_F(RollbackTest, ConsumedSafetyGroupIsNotReported)
{
    root_.SetRelease("24.04");
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    now_ += 60;

    // Every unit is restored, so every newer snapshot goes, the safety
    // capture included.
    RollbackResult res = Executor().Execute(g, &state_);
    ASSERT_EQ(res.outcome, Outcome::kSuccess) << res.status.ToString();
    EXPECT_FALSE(res.safety.has_value());
    EXPECT_TRUE(res.safety_consumed);

    std::vector<CheckpointGroup> groups;
    ASSERT_STRATUM_OK(store_->List(&groups));
    for (const auto &grp : groups)
        EXPECT_NE(grp.key.label, "before-rollback") << grp.key.ToString();
    EXPECT_NE(state_.history.back().detail.find("consumed by rollback"), std::string::npos)
        << state_.history.back().detail;
}

TEST_F(RollbackTest, SubUnitCreatedAfterCaptureSurvivesInQuarantine)
{
    root_.SetRelease("24.04");
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->AddUnit("rpool/home/newdata", "precious");

    now_ += 60;
    RollbackResult res = Executor().Execute(g, &state_);
    ASSERT_EQ(res.outcome, Outcome::kSuccess) << res.status.ToString();
    EXPECT_FALSE(backend_->HasUnit("rpool/home/newdata"));

    ASSERT_EQ(res.quarantined_units.size(), 1u);
    const QuarantinedUnit &q = res.quarantined_units[0];
    EXPECT_EQ(q.unit, "rpool/home/newdata");
    EXPECT_EQ(backend_->Read(q.moved_to), "precious");
    // The safety capture of the new unit moved with it.
    const auto snaps = backend_->SnapshotsOf(q.moved_to);
    ASSERT_EQ(snaps.size(), 1u);
    EXPECT_EQ(snaps[0].rfind("before-rollback-", 0), 0u);

    // What is left of the safety group is not a group that can be restored.
    EXPECT_FALSE(res.safety.has_value());
    EXPECT_TRUE(res.safety_consumed);
    const std::string &detail = state_.history.back().detail;
    EXPECT_NE(detail.find("quarantined rpool/home/newdata -> " + q.moved_to), std::string::npos) << detail;
    EXPECT_NE(detail.find("consumed by rollback"), std::string::npos) << detail;
}

TEST_F(RollbackTest, BootRefreshFailureIsUnverified)
{
    root_.SetRelease("24.04");
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    boot_->result = Status::ActionFailure("boot config sync: exit 1");

    RollbackResult res = Executor().Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kUnverified);
    EXPECT_EQ(res.status.code(), ErrorCode::kPostconditionFailure);
    EXPECT_NE(res.status.message().find("boot config sync failed"), std::string::npos) << res.status.ToString();
    EXPECT_EQ(res.restored, g.key);
    EXPECT_TRUE(res.reboot_required);
    EXPECT_EQ(images_->regenerate_all_calls, 1);
    EXPECT_EQ(state_.current_phase, Phase::kCheckpointed);
    EXPECT_EQ(state_.history.back().event, HistoryEvent::kRollbackUnverified);
}

TEST_F(RollbackTest, MissingBootCollaboratorsLeaveRollbackUnverified)
{
    root_.SetRelease("24.04");
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    RollbackExecutor executor(store_.get(), collector_.get(), nullptr, nullptr, MigrationPlan{}, [this]
                              { return now_; });

    RollbackResult res = executor.Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kUnverified);
    EXPECT_NE(res.status.message().find("no init image system"), std::string::npos);
    EXPECT_NE(res.status.message().find("no boot configurator"), std::string::npos);
    EXPECT_TRUE(res.reboot_required);
}

TEST_F(RollbackTest, UnverifiedWhenReleaseDoesNotMatch)
{
    // The fake root keeps reporting 25.04 after restoring a 24.04 capture.
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    RollbackResult res = Executor().Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kUnverified);
    EXPECT_EQ(res.status.code(), ErrorCode::kPostconditionFailure);
    EXPECT_EQ(state_.current_phase, Phase::kCheckpointed);
    EXPECT_EQ(state_.history.back().event, HistoryEvent::kRollbackUnverified);
}

TEST_F(RollbackTest, SafetyCaptureFailureTouchesNothing)
{
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->Write("rpool/home", "later");
    backend_->fail_snapshot_on = "rpool/var";

    RollbackResult res = Executor().Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kFailure);
    EXPECT_EQ(res.status.code(), ErrorCode::kCheckpointFailure);
    EXPECT_EQ(backend_->rollback_calls, 0);
    EXPECT_EQ(images_->regenerate_all_calls, 0);
    EXPECT_FALSE(res.reboot_required);
    EXPECT_EQ(backend_->Read("rpool/home"), "later");
    EXPECT_EQ(state_.current_phase, Phase::kPackagesUpgraded);
    EXPECT_EQ(state_.history.back().event, HistoryEvent::kCheckpointFailure);
}

TEST_F(RollbackTest, UnitFailureIsRollbackFailure)
{
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->fail_rollback_on = "rpool/var";

    RollbackResult res = Executor().Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kFailure);
    EXPECT_EQ(res.status.code(), ErrorCode::kRollbackFailure);
    EXPECT_EQ(res.failed_unit, "rpool/var");
    EXPECT_EQ(res.rolled_back_units.size(), 2u);
    EXPECT_FALSE(res.reboot_required);
    EXPECT_EQ(boot_->syncs, 0);
    // The two restored units lost their part of the safety group.
    EXPECT_FALSE(res.safety.has_value());
    EXPECT_TRUE(res.safety_consumed);
    EXPECT_EQ(state_.current_phase, Phase::kPackagesUpgraded);
    EXPECT_EQ(state_.history.back().event, HistoryEvent::kRollbackFailure);
}

TEST_F(RollbackTest, SafetyGroupKeptWhenNothingWasRestored)
{
    CheckpointGroup g = MustCreate("before-upgrade-to-plucky", Phase::kCheckpointed);
    backend_->fail_rollback_on = "rpool/ROOT";

    now_ += 60;
    RollbackResult res = Executor().Execute(g, &state_);
    EXPECT_EQ(res.outcome, Outcome::kFailure);
    EXPECT_TRUE(res.rolled_back_units.empty());
    ASSERT_TRUE(res.safety.has_value());
    EXPECT_FALSE(res.safety_consumed);

    CheckpointGroup safety;
    ASSERT_STRATUM_OK(store_->Find(*res.safety, &safety));
    EXPECT_TRUE(safety.consistent);
    EXPECT_EQ(safety.key.label, "before-rollback");
}

TEST(ExpectedReleaseTest, FollowsThePlan)
{
    MigrationPlan plan;
    EXPECT_EQ(core::ExpectedRelease(Phase::kPreflightVerified, plan), "24.04");
    EXPECT_EQ(core::ExpectedRelease(Phase::kCheckpointed, plan), "24.04");
    EXPECT_EQ(core::ExpectedRelease(Phase::kRebootedStep1, plan), "25.04");
    EXPECT_EQ(core::ExpectedRelease(Phase::kRebootedStep2, plan), "25.10");
    plan.interim_release.clear();
    EXPECT_EQ(core::ExpectedRelease(Phase::kPackagesUpgraded, plan), "25.10");
}
