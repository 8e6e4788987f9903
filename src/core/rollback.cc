#include "core/rollback.h"

#include <utility>

#include "util/logging.h"

namespace stratum::core
{
    namespace
    {
        static std::string JoinUnits(const std::vector<std::string> &units)
        {
            std::string s;
            for (const auto &u : units)
            {
                if (!s.empty())
                    s += ",";
                s += u;
            }
            return s;
        }
    } // namespace

    std::string ExpectedRelease(Phase phase, const MigrationPlan &plan)
    {
        switch (phase)
        {
        case Phase::kNotStarted:
        case Phase::kPreflightVerified:
        case Phase::kCheckpointed:
            return plan.source_release;
        case Phase::kPackagesUpgraded:
        case Phase::kRebootedStep1:
            return plan.FirstRelease();
        default:
            return plan.target_release;
        }
    }

    Status RollbackSelector::Candidates(bool include_safety, std::vector<CheckpointGroup> *out)
    {
        out->clear();
        std::vector<CheckpointGroup> all;
        auto st = store_->List(&all);
        if (!st.ok())
            return st;
        for (auto &g : all)
        {
            if (!g.consistent)
            {
                STRATUM_LOG_WARN("checkpoint group {} is inconsistent ({} of {} units), not offered",
                                 g.key.ToString(), g.checkpoints.size(), g.expected_units);
                continue;
            }
            if (!include_safety && store_->IsSafety(g.key))
                continue;
            out->push_back(std::move(g));
        }
        return Status::Ok();
    }

    Status RollbackSelector::Select(const RollbackCriterion &criterion, CheckpointGroup *out)
    {
        if (criterion.kind == RollbackCriterion::Kind::kKey)
        {
            auto st = store_->Find(criterion.key, out);
            if (!st.ok())
                return st;
            if (!out->consistent)
                return Status::PreconditionFailure("checkpoint group " + criterion.key.ToString() +
                                                   " is inconsistent and cannot be restored");
            return Status::Ok();
        }

        std::vector<CheckpointGroup> candidates;
        auto st = Candidates(criterion.include_safety, &candidates);
        if (!st.ok())
            return st;
        if (candidates.empty())
            return Status::PreconditionFailure("no consistent checkpoint group to roll back to");

        const std::size_t idx = criterion.kind == RollbackCriterion::Kind::kIndex ? criterion.index : 0;
        if (idx >= candidates.size())
            return Status::InvalidArgument("candidate index " + std::to_string(idx) + " out of range (" +
                                           std::to_string(candidates.size()) + " candidates)");
        *out = std::move(candidates[idx]);
        return Status::Ok();
    }

    RollbackExecutor::RollbackExecutor(storage::CheckpointStore *store, const FactCollector *facts,
                                       std::shared_ptr<InitImageSystem> init_images,
                                       std::shared_ptr<BootConfigurator> boot, MigrationPlan plan,
                                       std::function<uint64_t()> clock)
        : store_(store),
          facts_(facts),
          init_images_(std::move(init_images)),
          boot_(std::move(boot)),
          plan_(std::move(plan)),
          clock_(std::move(clock))
    {
    }

    std::string RollbackExecutor::RefreshBoot()
    {
        std::string problems;
        auto note = [&](const std::string &what)
        {
            STRATUM_LOG_ERROR("post-rollback boot refresh: {}", what);
            if (!problems.empty())
                problems += "; ";
            problems += what;
        };

        if (!init_images_)
            note("no init image system to regenerate boot images");
        else if (auto st = init_images_->RegenerateAll(); !st.ok())
            note("init image regeneration failed: " + st.message());

        if (!boot_)
            note("no boot configurator to sync boot config");
        else if (auto st = boot_->Sync(); !st.ok())
            note("boot config sync failed: " + st.message());

        if (problems.empty())
            STRATUM_LOG_INFO("boot images and boot config refreshed for the restored root");
        return problems;
    }

    RollbackResult RollbackExecutor::Execute(const CheckpointGroup &group, MigrationState *state)
    {
        RollbackResult res;
        res.phase = state->current_phase;

        auto record = [&](HistoryEvent ev, Phase to, const std::string &detail, const SystemFacts &f)
        {
            state->history.push_back(HistoryEntry{clock_(), state->current_phase, to, ev, detail, f.Summary()});
        };

        if (!group.consistent)
        {
            res.status = Status::PreconditionFailure("checkpoint group " + group.key.ToString() + " is inconsistent");
            return res;
        }

        STRATUM_LOG_INFO("rollback to {} requested (phase {})", group.key.ToString(), PhaseName(group.phase));

        // 1. Safety capture of the current state; nothing is touched if it fails.
        CheckpointGroup safety;
        auto st = store_->Create(store_->safety_label(), state->run_id, state->current_phase, &safety);
        if (!st.ok())
        {
            STRATUM_LOG_ERROR("safety checkpoint failed, rollback aborted: {}", st.ToString());
            res.status = Status::CheckpointFailure("safety checkpoint: " + st.message());
            record(HistoryEvent::kCheckpointFailure, state->current_phase,
                   "rollback to " + group.key.ToString() + " aborted: " + res.status.message(), facts_->Collect());
            return res;
        }
        res.safety = safety.key;

        // 2. Restore.
        storage::RollbackReport report;
        st = store_->RollbackGroup(group, &report);
        res.rolled_back_units = report.rolled_back;
        res.quarantined_units = report.quarantined;
        res.failed_unit = report.failed_unit;

        // Restoring a unit discards its newer snapshots, the safety capture
        // among them. Only a group that is still whole is reported.
        CheckpointGroup still;
        const auto found = store_->Find(safety.key, &still);
        if (!found.ok() || !still.consistent)
        {
            STRATUM_LOG_WARN("safety group {} did not survive the rollback ({})", safety.key.ToString(),
                             found.ok() ? std::string("inconsistent") : found.ToString());
            res.safety.reset();
            res.safety_consumed = true;
        }
        const std::string safety_note = res.safety_consumed
                                            ? "safety " + safety.key.ToString() + " consumed by rollback"
                                            : "safety " + safety.key.ToString();
        std::string quarantine_note;
        for (const auto &q : report.quarantined)
            quarantine_note += "; quarantined " + q.unit + " -> " + q.moved_to;

        if (!st.ok())
        {
            STRATUM_LOG_ERROR("rollback to {} failed; manual intervention required: {}", group.key.ToString(),
                              st.ToString());
            res.status = st.code() == ErrorCode::kRollbackFailure ? st : Status::RollbackFailure(st.message());
            record(HistoryEvent::kRollbackFailure, state->current_phase,
                   "rollback to " + group.key.ToString() + " failed at " + report.failed_unit + "; restored [" +
                       JoinUnits(report.rolled_back) + "]" + quarantine_note + "; " + safety_note + "; " +
                       res.status.message(),
                   facts_->Collect());
            return res;
        }
        res.restored = group.key;
        res.reboot_required = true;

        // 3. Boot refresh for the restored root.
        std::string mismatch = RefreshBoot();

        // 4. Verify.
        const SystemFacts after = facts_->Collect();
        const std::string want = ExpectedRelease(group.phase, plan_);
        auto add = [&mismatch](const std::string &what)
        {
            if (!mismatch.empty())
                mismatch += "; ";
            mismatch += what;
        };
        if (!after.release || *after.release != want)
            add("release is " + after.release.value_or("unknown") + ", expected " + want);
        if (!PoolUsable(after.pool))
            add(std::string("pool is ") + PoolHealthName(after.pool));

        // 5. Record. The storage already changed, so the record follows it
        // even when verification failed.
        const std::string detail = "restored " + group.key.ToString() + " [" + JoinUnits(report.rolled_back) + "]" +
                                   quarantine_note + "; " + safety_note +
                                   (mismatch.empty() ? std::string() : "; unverified: " + mismatch);
        record(mismatch.empty() ? HistoryEvent::kRolledBack : HistoryEvent::kRollbackUnverified, Phase::kRolledBack,
               detail, after);
        state->current_phase = group.phase;
        state->pending.reset();
        state->last_checkpoint_group = group.key;
        res.phase = group.phase;

        if (!mismatch.empty())
        {
            STRATUM_LOG_WARN("rollback to {} is unverified: {}", group.key.ToString(), mismatch);
            res.outcome = Outcome::kUnverified;
            res.status = Status::PostconditionFailure(mismatch);
            return res;
        }

        STRATUM_LOG_INFO("rollback to {} verified; phase reset to {}; reboot to run it", group.key.ToString(),
                         PhaseName(group.phase));
        res.outcome = Outcome::kSuccess;
        res.status = Status::Ok();
        return res;
    }

} // namespace stratum::core
