#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/fact_collector.h"
#include "storage/checkpoint_store.h"
#include "stratum/options.h"
#include "stratum/orchestrator.h"
#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum::core
{

    // Release the system runs while in `phase`, which is what a rollback to a
    // group captured in that phase must bring back.
    std::string ExpectedRelease(Phase phase, const MigrationPlan &plan);

    class RollbackSelector
    {
    public:
        explicit RollbackSelector(storage::CheckpointStore *store) : store_(store) {}

        // Consistent groups, newest first. Safety groups only on request.
        Status Candidates(bool include_safety, std::vector<CheckpointGroup> *out);

        // Latest candidate, the n-th candidate, or a group by key. Naming an
        // inconsistent group is a PreconditionFailure, as is having nothing
        // to choose from.
        Status Select(const RollbackCriterion &criterion, CheckpointGroup *out);

    private:
        storage::CheckpointStore *store_;
    };

    // Guarded rollback: safety capture, restore, boot refresh, verify,
    // record. Updates `state` in memory; the caller persists it. A failed boot
    // refresh leaves the rollback unverified.
    class RollbackExecutor
    {
    public:
        RollbackExecutor(storage::CheckpointStore *store, const FactCollector *facts,
                         std::shared_ptr<InitImageSystem> init_images, std::shared_ptr<BootConfigurator> boot,
                         MigrationPlan plan, std::function<uint64_t()> clock);

        RollbackResult Execute(const CheckpointGroup &group, MigrationState *state);

    private:
        // Rebuilds boot images and boot config for the restored root. Returns
        // what went wrong, empty on success.
        std::string RefreshBoot();

        storage::CheckpointStore *store_;
        const FactCollector *facts_;
        std::shared_ptr<InitImageSystem> init_images_;
        std::shared_ptr<BootConfigurator> boot_;
        MigrationPlan plan_;
        std::function<uint64_t()> clock_;
    };

} // namespace stratum::core
