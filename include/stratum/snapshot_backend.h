#pragma once
#include <string>
#include <vector>

#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum
{

    // One snapshot as the substrate reports it. `has_metadata` is false for
    // snapshots this tool did not create; those never join a group.
    struct SnapshotRecord
    {
        std::string unit;
        std::string name;
        bool has_metadata = false;
        Checkpoint checkpoint;
    };

    // Snapshot substrate: a hierarchy of independently snapshottable units
    // ("pool/ROOT/ubuntu", "pool/home", ...) with no multi-unit transactions.
    // Unit paths use '/' for containment.
    class SnapshotBackend
    {
    public:
        virtual ~SnapshotBackend() = default;

        // Walks the hierarchy; parents come before their children.
        virtual Status ListUnits(std::vector<std::string> *out) = 0;

        // Captures `unit` as `name`, attaching the checkpoint metadata (with
        // complete=false).
        virtual Status Snapshot(const std::string &unit, const std::string &name,
                                const Checkpoint &meta) = 0;
        virtual Status MarkComplete(const std::string &unit, const std::string &name) = 0;

        virtual Status ListSnapshots(std::vector<SnapshotRecord> *out) = 0;

        virtual Status Rollback(const std::string &unit, const std::string &name) = 0;
        virtual Status Destroy(const std::string &unit, const std::string &name) = 0;
        // Renames `from` and everything below it to `to`, snapshots included,
        // creating missing parents of `to`. The pool root cannot move.
        virtual Status MoveUnit(const std::string &from, const std::string &to) = 0;

        virtual PoolHealth Health() = 0;
        virtual std::string backend_id() const = 0;
    };

} // namespace stratum
