#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "stratum/options.h"
#include "stratum/snapshot_backend.h"
#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum::storage
{

    struct RollbackReport
    {
        std::vector<std::string> rolled_back; // units restored, in order
        std::vector<QuarantinedUnit> quarantined; // sub-units created after the checkpoint
        std::string failed_unit;              // empty unless a unit failed
    };

    // Named, timestamped checkpoint groups across every storage unit of the
    // substrate. Knows nothing about phases beyond tagging captures with one.
    class CheckpointStore
    {
    public:
        CheckpointStore(std::shared_ptr<SnapshotBackend> backend, CheckpointStoreOptions opts);

        // Captures every unit under one (label, created_at) key. Either all
        // units succeed or the partial captures are destroyed again and
        // CheckpointFailure is returned.
        Status Create(const std::string &label, const std::string &run_id, Phase phase, CheckpointGroup *out);

        // Groups of recognized labels, newest first. Inconsistent groups are
        // listed with consistent=false.
        Status List(std::vector<CheckpointGroup> *out);
        Status Find(const CheckpointKey &key, CheckpointGroup *out);

        // Restores every unit of a consistent group, parents first, then moves
        // sub-units that appeared below them after the capture into the
        // quarantine container. Stops at the first failing unit.
        Status RollbackGroup(const CheckpointGroup &group, RollbackReport *report);

        // Refused for the group `pinned` refers to unless forced.
        Status Destroy(const CheckpointKey &key, const std::optional<CheckpointKey> &pinned, bool force);

        bool IsRecognized(const std::string &label) const;
        bool IsQuarantined(const std::string &unit) const;
        bool IsSafety(const CheckpointKey &key) const { return key.label == opts_.safety_label; }
        const std::string &safety_label() const { return opts_.safety_label; }

    private:
        uint64_t NextCreatedAt(const std::vector<SnapshotRecord> &existing) const;
        Status ListLiveUnits(std::vector<std::string> *out);
        std::string QuarantinePath(const std::string &unit, const std::string &tag) const;

        std::shared_ptr<SnapshotBackend> backend_;
        CheckpointStoreOptions opts_;
    };

} // namespace stratum::storage
