#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/fact_collector.h"
#include "core/phase_detector.h"
#include "core/rollback.h"
#include "core/state_machine.h"
#include "storage/checkpoint_store.h"
#include "stratum/orchestrator.h"

namespace stratum
{

    // Orchestrator over the persisted state in opts.state_dir. Every public
    // call re-reads the record, so a fresh instance per invocation is the
    // normal use. The on_complete callback of a StepResult refers to this
    // instance and must not outlive it.
    class OrchestratorImpl final : public Orchestrator
    {
    public:
        OrchestratorImpl(OrchestratorOptions opts, Collaborators deps);

        Result<MigrationState> State() override;
        Result<SystemFacts> Facts() override;

        StepResult Step() override;
        StepResult Commit(const ActionReport &report) override;

        Status Candidates(const RollbackCriterion &criterion, std::vector<CheckpointGroup> *out) override;
        RollbackResult Rollback(const RollbackCriterion &criterion) override;

        Status ListCheckpoints(std::vector<CheckpointGroup> *out) override;
        Status DestroyCheckpoints(const CheckpointKey &key, bool force) override;

    private:
        // NotFound when nothing was recorded yet and `create` is false.
        Status Load(MigrationState *state, bool create);
        Status Persist(const MigrationState &state);
        void Append(MigrationState *state, HistoryEvent ev, Phase from, Phase to, std::string detail,
                    const SystemFacts &facts);

        // Moves the record forward when facts prove more progress. Returns
        // true when it changed anything.
        bool Reconcile(MigrationState *state, const SystemFacts &facts);

        // Reuses this run's consistent group for the edge or captures a new one.
        Status EnsureCheckpoint(MigrationState *state, const core::Transition &t, CheckpointKey *key);

        StepResult Ticket(const MigrationState &state, const PendingAction &p, const core::Transition &t);
        StepResult Finish(Outcome outcome, Status status, Phase phase);
        StepResult CommitPending(MigrationState *state, const SystemFacts &facts);

        uint64_t Now() const { return clock_(); }
        std::string NewRunId() const;

        OrchestratorOptions opts_;
        Collaborators deps_;
        std::function<uint64_t()> clock_;
        storage::CheckpointStore store_;
        core::FactCollector collector_;
        core::PhaseDetector detector_;
        core::MigrationStateMachine machine_;
    };

} // namespace stratum
