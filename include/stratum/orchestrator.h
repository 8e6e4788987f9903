#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stratum/collaborators.h"
#include "stratum/options.h"
#include "stratum/snapshot_backend.h"
#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum
{

    struct Collaborators
    {
        std::shared_ptr<SnapshotBackend> backend;
        std::shared_ptr<PackageSystem> packages;
        std::shared_ptr<InitImageSystem> init_images;
        std::shared_ptr<BootConfigurator> boot;
    };

    // What the caller must do before the migration can move on.
    struct RequiredAction
    {
        ActionKind kind = ActionKind::kNone;
        Phase from = Phase::kNotStarted;
        Phase to = Phase::kNotStarted;
        std::string target;
        bool reboot_after = false;
        std::optional<CheckpointKey> checkpoint; // group guarding this action
    };

    struct ActionReport
    {
        bool success = false;
        std::string detail;
    };

    struct StepResult
    {
        Outcome outcome = Outcome::kFailure;
        Status status;
        Phase phase = Phase::kNotStarted;
        RequiredAction action;
        bool reboot_required = false;
        // Set when action.kind != kNone; reports the action's outcome back.
        std::function<StepResult(const ActionReport &)> on_complete;
    };

    struct RollbackCriterion
    {
        enum class Kind : uint8_t
        {
            kLatest,
            kIndex,
            kKey,
        };

        Kind kind = Kind::kLatest;
        std::size_t index = 0; // into Candidates(), newest first
        CheckpointKey key;
        bool include_safety = false;
    };

    struct RollbackResult
    {
        Outcome outcome = Outcome::kFailure;
        Status status;
        std::optional<CheckpointKey> restored;
        // Safety group that still exists after the call. Empty when the
        // rollback consumed it; see safety_consumed.
        std::optional<CheckpointKey> safety;
        bool safety_consumed = false;
        std::vector<std::string> rolled_back_units;
        std::vector<QuarantinedUnit> quarantined_units;
        std::string failed_unit;
        Phase phase = Phase::kNotStarted;
        // Set once storage was restored; the restored system only runs after
        // a reboot.
        bool reboot_required = false;
    };

    // Single-node, single-operator orchestration surface. Calls are sequential;
    // cancelling during checkpoint creation or rollback is unsafe.
    class Orchestrator
    {
    public:
        virtual ~Orchestrator() = default;

        static Status Open(const OrchestratorOptions &opts, Collaborators deps,
                           std::unique_ptr<Orchestrator> *out);

        // Persisted record after reconciling it with current facts.
        virtual Result<MigrationState> State() = 0;
        virtual Result<SystemFacts> Facts() = 0;

        virtual StepResult Step() = 0;
        virtual StepResult Commit(const ActionReport &report) = 0;

        virtual Status Candidates(const RollbackCriterion &criterion, std::vector<CheckpointGroup> *out) = 0;
        virtual RollbackResult Rollback(const RollbackCriterion &criterion) = 0;

        virtual Status ListCheckpoints(std::vector<CheckpointGroup> *out) = 0;
        virtual Status DestroyCheckpoints(const CheckpointKey &key, bool force) = 0;
    };

} // namespace stratum
