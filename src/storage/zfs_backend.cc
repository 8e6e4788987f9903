#include "storage/zfs_backend.h"

#include <algorithm>
#include <utility>

#include "util/logging.h"
#include "util/text.h"

namespace stratum::storage
{
    namespace
    {
        constexpr const char *kPropLabel = "stratum:label";
        constexpr const char *kPropCreated = "stratum:created";
        constexpr const char *kPropRun = "stratum:run";
        constexpr const char *kPropPhase = "stratum:phase";
        constexpr const char *kPropUnits = "stratum:units";
        constexpr const char *kPropComplete = "stratum:complete";

        static std::string Prop(const char *key, const std::string &value)
        {
            return std::string(key) + "=" + value;
        }

        static std::vector<std::string_view> SplitTabs(std::string_view line)
        {
            std::vector<std::string_view> out;
            std::size_t start = 0;
            while (true)
            {
                std::size_t tab = line.find('\t', start);
                if (tab == std::string_view::npos)
                {
                    out.push_back(line.substr(start));
                    break;
                }
                out.push_back(line.substr(start, tab - start));
                start = tab + 1;
            }
            return out;
        }

        template <typename Fn>
        static void ForEachLine(std::string_view text, Fn &&fn)
        {
            while (!text.empty())
            {
                std::size_t nl = text.find('\n');
                std::string_view line = util::Trim(text.substr(0, nl));
                text = (nl == std::string_view::npos) ? std::string_view{} : text.substr(nl + 1);
                if (!line.empty())
                    fn(line);
            }
        }
    } // namespace

    ZfsBackend::ZfsBackend(std::string pool, util::CommandRunner runner)
        : pool_(std::move(pool)), runner_(std::move(runner))
    {
    }

    Status ZfsBackend::Run(std::vector<std::string> argv, util::ProcessResult *out)
    {
        util::ProcessSpec spec;
        spec.argv = std::move(argv);
        STRATUM_LOG_DEBUG("exec: {}", util::JoinCommandLine(spec.argv));
        auto st = runner_(spec, out);
        if (!st.ok())
            return st;
        if (!out->succeeded())
            return Status::IOError(util::DescribeFailure(spec, *out));
        return Status::Ok();
    }

    Status ZfsBackend::Run(std::vector<std::string> argv)
    {
        util::ProcessResult r;
        return Run(std::move(argv), &r);
    }

    Status ZfsBackend::ListUnits(std::vector<std::string> *out)
    {
        util::ProcessResult r;
        auto st = Run({"zfs", "list", "-H", "-o", "name", "-t", "filesystem,volume", "-r", pool_}, &r);
        if (!st.ok())
            return st;
        *out = ParseUnitListing(r.stdout_text, pool_);
        return Status::Ok();
    }

    Status ZfsBackend::Snapshot(const std::string &unit, const std::string &name, const Checkpoint &meta)
    {
        return Run({"zfs", "snapshot",
                    "-o", Prop(kPropLabel, meta.key.label),
                    "-o", Prop(kPropCreated, std::to_string(meta.key.created_at)),
                    "-o", Prop(kPropRun, meta.run_id),
                    "-o", Prop(kPropPhase, PhaseName(meta.phase)),
                    "-o", Prop(kPropUnits, std::to_string(meta.unit_count)),
                    "-o", Prop(kPropComplete, meta.complete ? "1" : "0"),
                    unit + "@" + name});
    }

    Status ZfsBackend::MarkComplete(const std::string &unit, const std::string &name)
    {
        return Run({"zfs", "set", Prop(kPropComplete, "1"), unit + "@" + name});
    }

    Status ZfsBackend::ListSnapshots(std::vector<SnapshotRecord> *out)
    {
        util::ProcessResult r;
        const std::string cols = std::string("name,") + kPropLabel + "," + kPropCreated + "," + kPropRun + "," +
                                 kPropPhase + "," + kPropUnits + "," + kPropComplete;
        auto st = Run({"zfs", "list", "-H", "-p", "-t", "snapshot", "-o", cols, "-r", pool_}, &r);
        if (!st.ok())
            return st;
        *out = ParseSnapshotListing(r.stdout_text);
        return Status::Ok();
    }

    Status ZfsBackend::Rollback(const std::string &unit, const std::string &name)
    {
        // -r: snapshots newer than the target are destroyed, as zfs requires.
        return Run({"zfs", "rollback", "-r", unit + "@" + name});
    }

    Status ZfsBackend::Destroy(const std::string &unit, const std::string &name)
    {
        return Run({"zfs", "destroy", unit + "@" + name});
    }

    Status ZfsBackend::MoveUnit(const std::string &from, const std::string &to)
    {
        if (from == pool_ || from.find('/') == std::string::npos)
            return Status::InvalidArgument("refusing to move pool root " + from);
        const std::size_t slash = to.rfind('/');
        if (slash == std::string::npos || to.compare(0, pool_.size() + 1, pool_ + "/") != 0)
            return Status::InvalidArgument("destination " + to + " is not inside pool " + pool_);

        // rename -p and -u cannot be combined, so the parents come first.
        auto st = Run({"zfs", "create", "-p", to.substr(0, slash)});
        if (!st.ok())
            return st;
        // -u: the running system keeps its mounts until the next boot.
        return Run({"zfs", "rename", "-u", from, to});
    }

    PoolHealth ZfsBackend::Health()
    {
        util::ProcessResult r;
        auto st = Run({"zpool", "list", "-H", "-o", "health", pool_}, &r);
        if (!st.ok())
        {
            STRATUM_LOG_DEBUG("pool {} not available: {}", pool_, st.ToString());
            return PoolHealth::kAbsent;
        }
        return ParseHealth(r.stdout_text);
    }

    std::vector<std::string> ZfsBackend::ParseUnitListing(std::string_view text, std::string_view pool)
    {
        std::vector<std::string> units;
        ForEachLine(text, [&](std::string_view line)
                    {
                        if (line != pool)
                            units.emplace_back(line);
                    });
        std::stable_sort(units.begin(), units.end(),
                         [](const std::string &a, const std::string &b)
                         {
                             const auto da = std::count(a.begin(), a.end(), '/');
                             const auto db = std::count(b.begin(), b.end(), '/');
                             return da != db ? da < db : a < b;
                         });
        return units;
    }

    std::vector<SnapshotRecord> ZfsBackend::ParseSnapshotListing(std::string_view text)
    {
        std::vector<SnapshotRecord> out;
        ForEachLine(text, [&](std::string_view line)
                    {
                        auto cols = SplitTabs(line);
                        if (cols.empty())
                            return;
                        const std::string_view full = cols[0];
                        const std::size_t at = full.find('@');
                        if (at == std::string_view::npos)
                            return;

                        SnapshotRecord rec;
                        rec.unit = std::string(full.substr(0, at));
                        rec.name = std::string(full.substr(at + 1));
                        rec.checkpoint.unit = rec.unit;
                        rec.checkpoint.name = rec.name;

                        // "-" marks an unset user property: not one of ours.
                        if (cols.size() != 7 || cols[1] == "-" || cols[2] == "-")
                        {
                            out.push_back(std::move(rec));
                            return;
                        }

                        Checkpoint &c = rec.checkpoint;
                        uint64_t units = 0;
                        auto phase = ParsePhase(cols[4]);
                        if (!util::ParseU64(cols[2], &c.key.created_at) || !phase ||
                            !util::ParseU64(cols[5], &units) || units > UINT32_MAX)
                        {
                            STRATUM_LOG_WARN("snapshot {} carries malformed checkpoint metadata", full);
                            out.push_back(std::move(rec));
                            return;
                        }
                        c.key.label = std::string(cols[1]);
                        c.run_id = cols[3] == "-" ? std::string() : std::string(cols[3]);
                        c.phase = *phase;
                        c.unit_count = static_cast<uint32_t>(units);
                        c.complete = cols[6] == "1";
                        rec.has_metadata = true;
                        out.push_back(std::move(rec));
                    });
        return out;
    }

    PoolHealth ZfsBackend::ParseHealth(std::string_view text)
    {
        const std::string_view h = util::Trim(text);
        if (h == "ONLINE")
            return PoolHealth::kHealthy;
        if (h == "DEGRADED")
            return PoolHealth::kDegraded;
        if (h.empty())
            return PoolHealth::kAbsent;
        // FAULTED, UNAVAIL, SUSPENDED, OFFLINE, REMOVED
        return PoolHealth::kFaulted;
    }

} // namespace stratum::storage
