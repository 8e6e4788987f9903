#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "stratum/snapshot_backend.h"
#include "util/subprocess.h"

namespace stratum::storage
{

    // SnapshotBackend over the zfs/zpool command line tools. Units are the
    // datasets below the pool root; checkpoint metadata lives in "stratum:*"
    // user properties on each snapshot.
    class ZfsBackend final : public SnapshotBackend
    {
    public:
        explicit ZfsBackend(std::string pool, util::CommandRunner runner = util::RunProcess);

        Status ListUnits(std::vector<std::string> *out) override;
        Status Snapshot(const std::string &unit, const std::string &name, const Checkpoint &meta) override;
        Status MarkComplete(const std::string &unit, const std::string &name) override;
        Status ListSnapshots(std::vector<SnapshotRecord> *out) override;
        Status Rollback(const std::string &unit, const std::string &name) override;
        Status Destroy(const std::string &unit, const std::string &name) override;
        Status MoveUnit(const std::string &from, const std::string &to) override;
        PoolHealth Health() override;
        std::string backend_id() const override { return "zfs:" + pool_; }

        // Output parsers, pure.
        static std::vector<std::string> ParseUnitListing(std::string_view text, std::string_view pool);
        static std::vector<SnapshotRecord> ParseSnapshotListing(std::string_view text);
        static PoolHealth ParseHealth(std::string_view text);

    private:
        Status Run(std::vector<std::string> argv, util::ProcessResult *out);
        Status Run(std::vector<std::string> argv);

        std::string pool_;
        util::CommandRunner runner_;
    };

} // namespace stratum::storage
