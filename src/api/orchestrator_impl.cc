#include "api/orchestrator_impl.h"

#include <chrono>
#include <cstdio>
#include <memory>
#include <random>
#include <utility>

#include "storage/state_file.h"
#include "util/logging.h"
#include "util/text.h"

namespace stratum
{
    namespace
    {
        // Edges that need no external action are applied in the same Step();
        // the chain is short, this only guards against a broken table.
        constexpr int kMaxAutoTransitions = 16;

        static std::function<uint64_t()> MakeClock(const CheckpointStoreOptions &opts)
        {
            if (opts.clock)
                return opts.clock;
            return []
            {
                return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                                 std::chrono::system_clock::now().time_since_epoch())
                                                 .count());
            };
        }

        static bool AwaitsReboot(const PendingAction &p)
        {
            return p.kind == ActionKind::kReboot || p.applied;
        }

        static bool Rebooted(const PendingAction &p, const SystemFacts &facts)
        {
            return !p.boot_id.empty() && facts.boot_id && *facts.boot_id != p.boot_id;
        }

        static CheckpointStoreOptions WithClock(CheckpointStoreOptions opts, const std::function<uint64_t()> &clock)
        {
            opts.clock = clock;
            return opts;
        }
    } // namespace

    Status Orchestrator::Open(const OrchestratorOptions &opts, Collaborators deps, std::unique_ptr<Orchestrator> *out)
    {
        if (!out)
            return Status::InvalidArgument("out=null");
        if (!deps.backend)
            return Status::InvalidArgument("a snapshot backend is required");
        if (opts.state_dir.empty())
            return Status::InvalidArgument("state_dir is empty");
        *out = std::make_unique<OrchestratorImpl>(opts, std::move(deps));
        return Status::Ok();
    }

    OrchestratorImpl::OrchestratorImpl(OrchestratorOptions opts, Collaborators deps)
        : opts_(std::move(opts)),
          deps_(std::move(deps)),
          clock_(MakeClock(opts_.checkpoints)),
          store_(deps_.backend, WithClock(opts_.checkpoints, clock_)),
          collector_(opts_.collector, deps_.backend, deps_.init_images),
          detector_(opts_.plan),
          machine_(opts_.plan)
    {
    }

    std::string OrchestratorImpl::NewRunId() const
    {
        std::random_device rd;
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "%04x", static_cast<unsigned>(rd() & 0xFFFF));
        return "run-" + util::FormatTimestamp(Now()) + "-" + suffix;
    }

    Status OrchestratorImpl::Load(MigrationState *state, bool create)
    {
        auto st = storage::StateFile::Load(opts_.state_dir, state);
        if (st.ok() || st.code() != ErrorCode::kNotFound || !create)
            return st;

        *state = MigrationState{};
        state->run_id = NewRunId();
        state->current_phase = Phase::kNotStarted;
        STRATUM_LOG_INFO("starting migration run {} ({} -> {})", state->run_id, opts_.plan.source_release,
                         opts_.plan.target_release);
        Append(state, HistoryEvent::kStarted, Phase::kNotStarted, Phase::kNotStarted,
               opts_.plan.source_release + " -> " +
                   (opts_.plan.HasInterim() ? opts_.plan.interim_release + " -> " : std::string()) +
                   opts_.plan.target_release,
               SystemFacts{});
        return Persist(*state);
    }

    Status OrchestratorImpl::Persist(const MigrationState &state)
    {
        return storage::StateFile::Save(opts_.state_dir, state);
    }

    void OrchestratorImpl::Append(MigrationState *state, HistoryEvent ev, Phase from, Phase to, std::string detail,
                                  const SystemFacts &facts)
    {
        if (ev == HistoryEvent::kPreconditionFailure || ev == HistoryEvent::kCheckpointFailure ||
            ev == HistoryEvent::kActionFailure || ev == HistoryEvent::kRollbackFailure)
            STRATUM_LOG_ERROR("[{}] {} -> {}: {}", HistoryEventName(ev), PhaseName(from), PhaseName(to), detail);
        else
            STRATUM_LOG_INFO("[{}] {} -> {}: {}", HistoryEventName(ev), PhaseName(from), PhaseName(to), detail);
        state->history.push_back(HistoryEntry{Now(), from, to, ev, std::move(detail), facts.Summary()});
    }

    bool OrchestratorImpl::Reconcile(MigrationState *state, const SystemFacts &facts)
    {
        const Phase detected = detector_.Detect(facts, *state);
        if (!IsAhead(detected, state->current_phase))
            return false;

        Append(state, HistoryEvent::kReconciled, state->current_phase, detected,
               "facts show progress beyond the record", facts);
        state->current_phase = detected;
        if (state->pending && !IsAhead(state->pending->to, detected))
            state->pending.reset();
        return true;
    }

    Result<MigrationState> OrchestratorImpl::State()
    {
        MigrationState state;
        auto st = Load(&state, false);
        if (st.code() == ErrorCode::kNotFound)
            return MigrationState{};
        if (!st.ok())
            return st;
        (void)Reconcile(&state, collector_.Collect());
        return state;
    }

    Result<SystemFacts> OrchestratorImpl::Facts()
    {
        return collector_.Collect();
    }

    StepResult OrchestratorImpl::Finish(Outcome outcome, Status status, Phase phase)
    {
        StepResult r;
        r.outcome = outcome;
        r.status = std::move(status);
        r.phase = phase;
        return r;
    }

    StepResult OrchestratorImpl::Ticket(const MigrationState &state, const PendingAction &p, const core::Transition &t)
    {
        StepResult r = Finish(Outcome::kSuccess, Status::Ok(), state.current_phase);
        r.action.kind = p.kind;
        r.action.from = p.from;
        r.action.to = p.to;
        r.action.target = p.target;
        r.action.reboot_after = p.reboot_after;
        if (!t.checkpoint_label.empty())
            r.action.checkpoint = state.last_checkpoint_group;
        r.reboot_required = p.kind == ActionKind::kReboot;
        r.on_complete = [this](const ActionReport &report)
        { return Commit(report); };
        return r;
    }

    Status OrchestratorImpl::EnsureCheckpoint(MigrationState *state, const core::Transition &t, CheckpointKey *key)
    {
        if (state->last_checkpoint_group && state->last_checkpoint_group->label == t.checkpoint_label)
        {
            CheckpointGroup g;
            auto st = store_.Find(*state->last_checkpoint_group, &g);
            if (st.ok() && g.consistent && g.run_id == state->run_id && g.phase == t.from)
            {
                STRATUM_LOG_INFO("reusing checkpoint group {} for {} -> {}", g.key.ToString(), PhaseName(t.from),
                                 PhaseName(t.to));
                *key = g.key;
                return Status::Ok();
            }
        }

        CheckpointGroup g;
        auto st = store_.Create(t.checkpoint_label, state->run_id, t.from, &g);
        if (!st.ok())
            return st;
        *key = g.key;
        return Status::Ok();
    }

    StepResult OrchestratorImpl::Step()
    {
        MigrationState state;
        auto st = Load(&state, true);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, Phase::kNotStarted);

        SystemFacts facts = collector_.Collect();

        // A reboot-spanning action whose reboot has happened is confirmed
        // against its own postcondition before anything else.
        if (state.pending && state.pending->from == state.current_phase && AwaitsReboot(*state.pending) &&
            Rebooted(*state.pending, facts))
        {
            StepResult r = CommitPending(&state, facts);
            if (r.outcome != Outcome::kSuccess)
                return r;
        }

        if (Reconcile(&state, facts))
        {
            st = Persist(state);
            if (!st.ok())
                return Finish(Outcome::kFailure, st, state.current_phase);
        }

        // An action issued earlier and never committed.
        if (state.pending)
        {
            if (state.pending->from != state.current_phase)
            {
                STRATUM_LOG_WARN("dropping stale pending {} ({} -> {}), record is at {}",
                                 ActionKindName(state.pending->kind), PhaseName(state.pending->from),
                                 PhaseName(state.pending->to), PhaseName(state.current_phase));
                state.pending.reset();
                st = Persist(state);
                if (!st.ok())
                    return Finish(Outcome::kFailure, st, state.current_phase);
            }
            else
            {
                return CommitPending(&state, facts);
            }
        }

        for (int i = 0; i < kMaxAutoTransitions; ++i)
        {
            if (IsTerminal(state.current_phase))
                return Finish(Outcome::kSuccess, Status::Ok(), state.current_phase);

            core::Transition t;
            st = machine_.Advance(state.current_phase, &t);
            if (!st.ok())
                return Finish(Outcome::kFailure, st, state.current_phase);

            st = machine_.CheckPrecondition(t, facts);
            if (!st.ok())
            {
                Append(&state, HistoryEvent::kPreconditionFailure, t.from, t.from, st.message(), facts);
                auto pst = Persist(state);
                if (!pst.ok())
                    STRATUM_LOG_ERROR("could not record precondition failure: {}", pst.ToString());
                return Finish(Outcome::kFailure, st, state.current_phase);
            }

            core::TransitionContext ctx;
            if (!t.checkpoint_label.empty())
            {
                CheckpointKey key;
                st = EnsureCheckpoint(&state, t, &key);
                if (!st.ok())
                {
                    Status failure = st.code() == ErrorCode::kCheckpointFailure
                                         ? st
                                         : Status::CheckpointFailure(st.ToString());
                    Append(&state, HistoryEvent::kCheckpointFailure, t.from, t.from, failure.message(), facts);
                    auto pst = Persist(state);
                    if (!pst.ok())
                        STRATUM_LOG_ERROR("could not record checkpoint failure: {}", pst.ToString());
                    return Finish(Outcome::kFailure, failure, state.current_phase);
                }
                if (!(state.last_checkpoint_group && *state.last_checkpoint_group == key))
                    Append(&state, HistoryEvent::kCheckpointed, t.from, t.from, key.ToString(), facts);
                state.last_checkpoint_group = key;
                ctx.checkpoint_recorded = true;
                st = Persist(state);
                if (!st.ok())
                    return Finish(Outcome::kFailure, st, state.current_phase);
            }

            if (t.action == ActionKind::kNone)
            {
                st = machine_.CheckPostcondition(t, facts, ctx);
                if (!st.ok())
                {
                    Append(&state, HistoryEvent::kUnverified, t.from, t.from, st.message(), facts);
                    auto pst = Persist(state);
                    if (!pst.ok())
                        STRATUM_LOG_ERROR("could not record unverified transition: {}", pst.ToString());
                    return Finish(Outcome::kUnverified, st, state.current_phase);
                }
                Append(&state, HistoryEvent::kAdvanced, t.from, t.to, "", facts);
                state.current_phase = t.to;
                st = Persist(state);
                if (!st.ok())
                    return Finish(Outcome::kFailure, st, state.current_phase);
                continue;
            }

            PendingAction p;
            p.kind = t.action;
            p.from = t.from;
            p.to = t.to;
            p.target = t.action == ActionKind::kRegenerateInitImage ? facts.kernel_release.value_or("") : t.target;
            p.boot_id = facts.boot_id.value_or("");
            p.issued_at = Now();
            p.reboot_after = t.reboot_after;
            state.pending = p;
            Append(&state, HistoryEvent::kActionIssued, t.from, t.to,
                   std::string(ActionKindName(p.kind)) + (p.target.empty() ? "" : " " + p.target), facts);

            // The record must name the action before anyone performs it.
            st = Persist(state);
            if (!st.ok())
                return Finish(Outcome::kFailure, st, state.current_phase);
            return Ticket(state, p, t);
        }
        return Finish(Outcome::kFailure, Status::Internal("phase table did not converge"), state.current_phase);
    }

    // Decides what an uncommitted pending action means on this boot.
    StepResult OrchestratorImpl::CommitPending(MigrationState *state, const SystemFacts &facts)
    {
        const PendingAction p = *state->pending;
        core::Transition t;
        auto st = machine_.Advance(p.from, &t);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, state->current_phase);

        if (!AwaitsReboot(p))
        {
            STRATUM_LOG_WARN("{} was issued but never reported; issuing it again", ActionKindName(p.kind));
            return Ticket(*state, p, t);
        }

        if (!Rebooted(p, facts))
        {
            StepResult r = Ticket(*state, p, t);
            r.action.kind = ActionKind::kReboot;
            r.reboot_required = true;
            return r;
        }

        core::TransitionContext ctx;
        ctx.issued_boot_id = p.boot_id;
        ctx.checkpoint_recorded = state->last_checkpoint_group.has_value();
        st = machine_.CheckPostcondition(t, facts, ctx);
        state->pending.reset();
        if (!st.ok())
        {
            Append(state, HistoryEvent::kUnverified, t.from, t.from, st.message(), facts);
            auto pst = Persist(*state);
            if (!pst.ok())
                STRATUM_LOG_ERROR("could not record unverified transition: {}", pst.ToString());
            return Finish(Outcome::kUnverified, st, state->current_phase);
        }
        Append(state, HistoryEvent::kAdvanced, t.from, t.to, "reboot confirmed", facts);
        state->current_phase = t.to;
        st = Persist(*state);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, state->current_phase);
        return Finish(Outcome::kSuccess, Status::Ok(), state->current_phase);
    }

    StepResult OrchestratorImpl::Commit(const ActionReport &report)
    {
        MigrationState state;
        auto st = Load(&state, false);
        if (st.code() == ErrorCode::kNotFound)
            return Finish(Outcome::kFailure, Status::PreconditionFailure("no migration in progress"),
                          Phase::kNotStarted);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, Phase::kNotStarted);
        if (!state.pending)
            return Finish(Outcome::kFailure, Status::PreconditionFailure("no action is pending"),
                          state.current_phase);

        const PendingAction p = *state.pending;
        core::Transition t;
        st = machine_.Advance(p.from, &t);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, state.current_phase);

        const SystemFacts facts = collector_.Collect();

        if (!report.success)
        {
            Status failure = Status::ActionFailure(std::string(ActionKindName(p.kind)) + ": " + report.detail);
            Append(&state, HistoryEvent::kActionFailure, p.from, p.from, failure.message(), facts);
            state.pending.reset();
            st = Persist(state);
            if (!st.ok())
                return Finish(Outcome::kFailure, st, state.current_phase);
            return Finish(Outcome::kFailure, failure, state.current_phase);
        }

        const bool needs_reboot = p.kind == ActionKind::kReboot || p.reboot_after;
        if (needs_reboot && !Rebooted(p, facts))
        {
            state.pending->applied = true;
            Append(&state, HistoryEvent::kActionApplied, p.from, p.to,
                   report.detail.empty() ? "awaiting reboot" : report.detail + "; awaiting reboot", facts);
            st = Persist(state);
            if (!st.ok())
                return Finish(Outcome::kFailure, st, state.current_phase);
            StepResult r = Finish(Outcome::kSuccess, Status::Ok(), state.current_phase);
            r.action.kind = ActionKind::kReboot;
            r.action.from = p.from;
            r.action.to = p.to;
            r.reboot_required = true;
            return r;
        }

        core::TransitionContext ctx;
        ctx.issued_boot_id = p.boot_id;
        ctx.checkpoint_recorded = state.last_checkpoint_group.has_value();
        st = machine_.CheckPostcondition(t, facts, ctx);
        state.pending.reset();
        if (!st.ok())
        {
            Append(&state, HistoryEvent::kUnverified, p.from, p.from, st.message(), facts);
            auto pst = Persist(state);
            if (!pst.ok())
                STRATUM_LOG_ERROR("could not record unverified transition: {}", pst.ToString());
            return Finish(Outcome::kUnverified, st, state.current_phase);
        }

        Append(&state, HistoryEvent::kAdvanced, p.from, p.to, report.detail, facts);
        state.current_phase = p.to;
        st = Persist(state);
        if (!st.ok())
            return Finish(Outcome::kFailure, st, state.current_phase);
        return Finish(Outcome::kSuccess, Status::Ok(), state.current_phase);
    }

    Status OrchestratorImpl::Candidates(const RollbackCriterion &criterion, std::vector<CheckpointGroup> *out)
    {
        core::RollbackSelector selector(&store_);
        return selector.Candidates(criterion.include_safety, out);
    }

    RollbackResult OrchestratorImpl::Rollback(const RollbackCriterion &criterion)
    {
        RollbackResult res;
        MigrationState state;
        auto st = Load(&state, true);
        if (!st.ok())
        {
            res.status = st;
            return res;
        }
        res.phase = state.current_phase;

        core::RollbackSelector selector(&store_);
        CheckpointGroup group;
        st = selector.Select(criterion, &group);
        if (!st.ok())
        {
            Append(&state, HistoryEvent::kPreconditionFailure, state.current_phase, state.current_phase,
                   "rollback: " + st.message(), collector_.Collect());
            auto pst = Persist(state);
            if (!pst.ok())
                STRATUM_LOG_ERROR("could not record rollback refusal: {}", pst.ToString());
            res.status = st;
            return res;
        }

        core::RollbackExecutor executor(&store_, &collector_, deps_.init_images, deps_.boot, opts_.plan, clock_);
        res = executor.Execute(group, &state);

        st = Persist(state);
        if (!st.ok())
        {
            STRATUM_LOG_ERROR("rollback applied to storage but the state record was not saved: {}", st.ToString());
            res.outcome = Outcome::kFailure;
            res.status = Status::IOError("rollback applied but state not saved: " + st.message());
        }
        return res;
    }

    Status OrchestratorImpl::ListCheckpoints(std::vector<CheckpointGroup> *out)
    {
        return store_.List(out);
    }

    Status OrchestratorImpl::DestroyCheckpoints(const CheckpointKey &key, bool force)
    {
        MigrationState state;
        auto st = Load(&state, false);
        if (!st.ok() && st.code() != ErrorCode::kNotFound)
            return st;
        return store_.Destroy(key, state.last_checkpoint_group, force);
    }

} // namespace stratum
