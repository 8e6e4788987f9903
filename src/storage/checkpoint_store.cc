#include "storage/checkpoint_store.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <utility>

#include "util/logging.h"
#include "util/text.h"

namespace stratum::storage
{
    namespace
    {
        static std::size_t Depth(const std::string &unit)
        {
            return static_cast<std::size_t>(std::count(unit.begin(), unit.end(), '/'));
        }

        static bool IsBelow(const std::string &unit, const std::string &ancestor)
        {
            return unit.size() > ancestor.size() + 1 &&
                   unit.compare(0, ancestor.size(), ancestor) == 0 &&
                   unit[ancestor.size()] == '/';
        }

        static std::string PoolOf(const std::string &unit)
        {
            return unit.substr(0, unit.find('/'));
        }

        static std::string JoinUnits(const std::vector<std::string> &units)
        {
            std::string s;
            for (const auto &u : units)
            {
                if (!s.empty())
                    s += ", ";
                s += u;
            }
            return s.empty() ? "none" : s;
        }

        static bool IsConsistent(const CheckpointGroup &g)
        {
            if (g.expected_units == 0 || g.checkpoints.size() != g.expected_units)
                return false;
            std::set<std::string> seen;
            for (const auto &c : g.checkpoints)
            {
                if (!c.complete || c.run_id != g.run_id || c.phase != g.phase || c.unit_count != g.expected_units)
                    return false;
                if (!seen.insert(c.unit).second)
                    return false;
            }
            return true;
        }
    } // namespace

    CheckpointStore::CheckpointStore(std::shared_ptr<SnapshotBackend> backend, CheckpointStoreOptions opts)
        : backend_(std::move(backend)), opts_(std::move(opts))
    {
        if (!opts_.clock)
        {
            opts_.clock = []
            {
                return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                                                 std::chrono::system_clock::now().time_since_epoch())
                                                 .count());
            };
        }
    }

    bool CheckpointStore::IsRecognized(const std::string &label) const
    {
        for (const auto &p : opts_.recognized_prefixes)
            if (label.size() > p.size() && label.compare(0, p.size(), p) == 0)
                return true;
        return false;
    }

    bool CheckpointStore::IsQuarantined(const std::string &unit) const
    {
        const std::size_t slash = unit.find('/');
        if (slash == std::string::npos || opts_.quarantine_container.empty())
            return false;
        const std::string &q = opts_.quarantine_container;
        return unit.compare(slash + 1, q.size(), q) == 0 &&
               (unit.size() == slash + 1 + q.size() || unit[slash + 1 + q.size()] == '/');
    }

    Status CheckpointStore::ListLiveUnits(std::vector<std::string> *out)
    {
        auto st = backend_->ListUnits(out);
        if (!st.ok())
            return st;
        out->erase(std::remove_if(out->begin(), out->end(),
                                  [this](const std::string &u)
                                  { return IsQuarantined(u); }),
                   out->end());
        return Status::Ok();
    }

    // <pool>/<container>/<tag>/<unit path below the pool>
    std::string CheckpointStore::QuarantinePath(const std::string &unit, const std::string &tag) const
    {
        const std::string pool = PoolOf(unit);
        return pool + "/" + opts_.quarantine_container + "/" + tag + unit.substr(pool.size());
    }

    uint64_t CheckpointStore::NextCreatedAt(const std::vector<SnapshotRecord> &existing) const
    {
        uint64_t t = opts_.clock();
        for (const auto &r : existing)
            if (r.has_metadata && r.checkpoint.key.created_at >= t)
                t = r.checkpoint.key.created_at + 1;
        return t;
    }

    Status CheckpointStore::Create(const std::string &label, const std::string &run_id, Phase phase,
                                   CheckpointGroup *out)
    {
        if (!IsRecognized(label))
            return Status::InvalidArgument("unrecognized checkpoint label: " + label);

        std::vector<std::string> units;
        auto st = ListLiveUnits(&units);
        if (!st.ok())
            return Status::CheckpointFailure("list units: " + st.ToString());
        if (units.empty())
            return Status::CheckpointFailure("no storage units to capture");

        std::vector<SnapshotRecord> existing;
        st = backend_->ListSnapshots(&existing);
        if (!st.ok())
            return Status::CheckpointFailure("list snapshots: " + st.ToString());

        CheckpointGroup g;
        g.key.label = label;
        g.key.created_at = NextCreatedAt(existing);
        g.run_id = run_id;
        g.phase = phase;
        g.expected_units = static_cast<uint32_t>(units.size());

        const std::string name = label + "-" + util::FormatTimestamp(g.key.created_at);
        STRATUM_LOG_INFO("creating checkpoint group {} ({}) across {} units", g.key.ToString(), name, units.size());

        Status failure;
        std::vector<std::string> captured;
        for (const auto &unit : units)
        {
            Checkpoint meta;
            meta.unit = unit;
            meta.name = name;
            meta.key = g.key;
            meta.run_id = run_id;
            meta.phase = phase;
            meta.unit_count = g.expected_units;
            meta.complete = false;

            st = backend_->Snapshot(unit, name, meta);
            if (!st.ok())
            {
                failure = Status::CheckpointFailure("capture " + unit + ": " + st.ToString());
                break;
            }
            captured.push_back(unit);

            st = backend_->MarkComplete(unit, name);
            if (!st.ok())
            {
                failure = Status::CheckpointFailure("complete " + unit + ": " + st.ToString());
                break;
            }
            meta.complete = true;
            g.checkpoints.push_back(std::move(meta));
            STRATUM_LOG_INFO("  captured {}@{}", unit, name);
        }

        if (!failure.ok())
        {
            STRATUM_LOG_ERROR("checkpoint group {} failed: {}", g.key.ToString(), failure.message());
            std::string leftovers;
            for (auto it = captured.rbegin(); it != captured.rend(); ++it)
            {
                auto dst = backend_->Destroy(*it, name);
                if (!dst.ok())
                {
                    STRATUM_LOG_ERROR("  compensation: destroy {}@{} failed: {}", *it, name, dst.ToString());
                    leftovers += leftovers.empty() ? *it : ", " + *it;
                }
                else
                {
                    STRATUM_LOG_INFO("  compensation: destroyed {}@{}", *it, name);
                }
            }
            std::string msg = failure.message();
            if (!leftovers.empty())
                msg += "; partial captures left incomplete on: " + leftovers;
            return Status::CheckpointFailure(std::move(msg));
        }

        g.consistent = true;
        STRATUM_LOG_INFO("checkpoint group {} complete", g.key.ToString());
        *out = std::move(g);
        return Status::Ok();
    }

    Status CheckpointStore::List(std::vector<CheckpointGroup> *out)
    {
        out->clear();

        std::vector<SnapshotRecord> records;
        auto st = backend_->ListSnapshots(&records);
        if (!st.ok())
            return st;

        std::map<std::pair<uint64_t, std::string>, CheckpointGroup> groups;
        for (auto &r : records)
        {
            if (!r.has_metadata)
            {
                STRATUM_LOG_DEBUG("skipping foreign snapshot {}@{}", r.unit, r.name);
                continue;
            }
            if (!IsRecognized(r.checkpoint.key.label))
            {
                STRATUM_LOG_DEBUG("skipping unrecognized label {} on {}", r.checkpoint.key.label, r.unit);
                continue;
            }

            const auto id = std::make_pair(r.checkpoint.key.created_at, r.checkpoint.key.label);
            auto it = groups.find(id);
            if (it == groups.end())
            {
                CheckpointGroup g;
                g.key = r.checkpoint.key;
                g.run_id = r.checkpoint.run_id;
                g.phase = r.checkpoint.phase;
                g.expected_units = r.checkpoint.unit_count;
                it = groups.emplace(id, std::move(g)).first;
            }
            it->second.checkpoints.push_back(std::move(r.checkpoint));
        }

        out->reserve(groups.size());
        for (auto it = groups.rbegin(); it != groups.rend(); ++it)
        {
            CheckpointGroup &g = it->second;
            std::sort(g.checkpoints.begin(), g.checkpoints.end(),
                      [](const Checkpoint &a, const Checkpoint &b)
                      { return a.unit < b.unit; });
            g.consistent = IsConsistent(g);
            out->push_back(std::move(g));
        }
        return Status::Ok();
    }

    Status CheckpointStore::Find(const CheckpointKey &key, CheckpointGroup *out)
    {
        std::vector<CheckpointGroup> groups;
        auto st = List(&groups);
        if (!st.ok())
            return st;
        for (auto &g : groups)
        {
            if (g.key == key)
            {
                *out = std::move(g);
                return Status::Ok();
            }
        }
        return Status::NotFound("checkpoint group " + key.ToString());
    }

    Status CheckpointStore::RollbackGroup(const CheckpointGroup &group, RollbackReport *report)
    {
        *report = RollbackReport{};
        if (!group.consistent)
            return Status::PreconditionFailure("checkpoint group " + group.key.ToString() + " is inconsistent");

        std::vector<const Checkpoint *> order;
        order.reserve(group.checkpoints.size());
        for (const auto &c : group.checkpoints)
            order.push_back(&c);
        std::sort(order.begin(), order.end(),
                  [](const Checkpoint *a, const Checkpoint *b)
                  {
                      const auto da = Depth(a->unit), db = Depth(b->unit);
                      return da != db ? da < db : a->unit < b->unit;
                  });

        STRATUM_LOG_INFO("rolling back group {} ({} units)", group.key.ToString(), order.size());
        for (const Checkpoint *c : order)
        {
            auto st = backend_->Rollback(c->unit, c->name);
            if (!st.ok())
            {
                report->failed_unit = c->unit;
                STRATUM_LOG_ERROR("  rollback {}@{} failed: {}", c->unit, c->name, st.ToString());
                return Status::RollbackFailure("unit " + c->unit + ": " + st.ToString() +
                                               "; already rolled back: " + JoinUnits(report->rolled_back));
            }
            report->rolled_back.push_back(c->unit);
            STRATUM_LOG_INFO("  rolled back {}@{}", c->unit, c->name);
        }

        // The rollback surface is the containment tree of each checkpointed
        // unit. Units created below them since the capture are moved aside
        // with their snapshots rather than destroyed.
        std::vector<std::string> units;
        auto st = ListLiveUnits(&units);
        if (!st.ok())
        {
            report->failed_unit = "(unit listing)";
            return Status::RollbackFailure("list units: " + st.ToString() +
                                           "; already rolled back: " + JoinUnits(report->rolled_back));
        }

        std::set<std::string> checkpointed;
        for (const auto &c : group.checkpoints)
            checkpointed.insert(c.unit);

        // Parents first; a moved unit takes its children along.
        std::vector<std::string> extra;
        for (const auto &u : units)
        {
            if (checkpointed.count(u))
                continue;
            const bool new_below = std::any_of(checkpointed.begin(), checkpointed.end(),
                                               [&](const std::string &c)
                                               { return IsBelow(u, c); });
            const bool parent_moving = std::any_of(extra.begin(), extra.end(),
                                                   [&](const std::string &e)
                                                   { return IsBelow(u, e); });
            if (new_below && !parent_moving)
                extra.push_back(u);
        }

        // One container per rollback: the restored group's snapshot name and
        // the time of the rollback, so repeated rollbacks never collide.
        const std::string tag = (group.checkpoints.empty()
                                     ? group.key.label + "-" + util::FormatTimestamp(group.key.created_at)
                                     : group.checkpoints.front().name) +
                                "." + util::FormatTimestamp(opts_.clock());
        for (const auto &u : extra)
        {
            const std::string dest = QuarantinePath(u, tag);
            st = backend_->MoveUnit(u, dest);
            if (!st.ok())
            {
                report->failed_unit = u;
                STRATUM_LOG_ERROR("  quarantine of new sub-unit {} failed: {}", u, st.ToString());
                return Status::RollbackFailure("quarantine " + u + ": " + st.ToString() +
                                               "; already rolled back: " + JoinUnits(report->rolled_back));
            }
            report->quarantined.push_back(QuarantinedUnit{u, dest});
            STRATUM_LOG_WARN("  sub-unit {} was created after the checkpoint; moved to {}", u, dest);
        }
        return Status::Ok();
    }

    Status CheckpointStore::Destroy(const CheckpointKey &key, const std::optional<CheckpointKey> &pinned, bool force)
    {
        if (pinned && *pinned == key && !force)
            return Status::PreconditionFailure("checkpoint group " + key.ToString() +
                                               " is the last recorded group; use force to destroy it");

        std::vector<SnapshotRecord> records;
        auto st = backend_->ListSnapshots(&records);
        if (!st.ok())
            return st;

        Status first_error;
        std::size_t matched = 0;
        for (const auto &r : records)
        {
            if (!r.has_metadata || !(r.checkpoint.key == key))
                continue;
            ++matched;
            auto dst = backend_->Destroy(r.unit, r.name);
            if (!dst.ok())
            {
                STRATUM_LOG_ERROR("destroy {}@{} failed: {}", r.unit, r.name, dst.ToString());
                if (first_error.ok())
                    first_error = dst;
                continue;
            }
            STRATUM_LOG_INFO("destroyed {}@{}", r.unit, r.name);
        }
        if (matched == 0)
            return Status::NotFound("checkpoint group " + key.ToString());
        return first_error;
    }

} // namespace stratum::storage
