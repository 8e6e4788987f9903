#pragma once
#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "stratum/snapshot_backend.h"

namespace stratum::test
{

    // SnapshotBackend over an in-memory unit tree. Each unit carries a content
    // string so tests can observe what a rollback restored. Rollback follows
    // zfs semantics: snapshots of the unit newer than the target go away.
    class MemoryBackend final : public SnapshotBackend
    {
    public:
        explicit MemoryBackend(std::vector<std::string> units = {"rpool/ROOT", "rpool/ROOT/ubuntu", "rpool/home",
                                                                  "rpool/var"})
        {
            for (auto &u : units)
                content_[u] = "initial";
        }

        // --- Test controls ---
        std::string fail_snapshot_on; // Snapshot() of this unit fails
        std::string fail_complete_on; // MarkComplete() of this unit fails
        std::string fail_rollback_on; // Rollback() of this unit fails
        std::string fail_destroy_on;  // Destroy() of a snapshot on this unit fails
        std::string fail_move_on;     // MoveUnit() of this unit fails
        bool fail_list_units = false;
        PoolHealth health = PoolHealth::kHealthy;
        // Runs after each successful unit rollback.
        std::function<void(const std::string &unit, const std::string &name)> on_rollback;

        int snapshot_calls = 0;
        int rollback_calls = 0;

        void AddUnit(const std::string &unit, std::string data = "initial") { content_[unit] = std::move(data); }
        void Write(const std::string &unit, std::string data) { content_[unit] = std::move(data); }
        std::string Read(const std::string &unit) const
        {
            auto it = content_.find(unit);
            return it == content_.end() ? std::string() : it->second;
        }
        bool HasUnit(const std::string &unit) const { return content_.count(unit) > 0; }

        // A snapshot some other tool took, without checkpoint metadata.
        void AddForeignSnapshot(const std::string &unit, const std::string &name)
        {
            Snap s;
            s.rec.unit = unit;
            s.rec.name = name;
            s.rec.checkpoint.unit = unit;
            s.rec.checkpoint.name = name;
            s.data = Read(unit);
            snaps_.push_back(std::move(s));
        }

        // Drops one unit's snapshot of a group, leaving the group incomplete.
        void DropSnapshot(const std::string &unit, const std::string &name)
        {
            snaps_.erase(std::remove_if(snaps_.begin(), snaps_.end(),
                                        [&](const Snap &s)
                                        { return s.rec.unit == unit && s.rec.name == name; }),
                         snaps_.end());
        }

        std::size_t SnapshotCount() const { return snaps_.size(); }

        // --- SnapshotBackend ---
        Status ListUnits(std::vector<std::string> *out) override
        {
            if (fail_list_units)
                return Status::IOError("list units: injected failure");
            out->clear();
            for (const auto &[unit, data] : content_)
                out->push_back(unit);
            std::stable_sort(out->begin(), out->end(),
                             [](const std::string &a, const std::string &b)
                             {
                                 const auto da = std::count(a.begin(), a.end(), '/');
                                 const auto db = std::count(b.begin(), b.end(), '/');
                                 return da != db ? da < db : a < b;
                             });
            return Status::Ok();
        }

        Status Snapshot(const std::string &unit, const std::string &name, const Checkpoint &meta) override
        {
            ++snapshot_calls;
            if (unit == fail_snapshot_on)
                return Status::IOError("snapshot " + unit + ": injected failure");
            if (!HasUnit(unit))
                return Status::NotFound("no unit " + unit);
            if (FindSnap(unit, name))
                return Status::AlreadyExists(unit + "@" + name);
            Snap s;
            s.rec.unit = unit;
            s.rec.name = name;
            s.rec.has_metadata = true;
            s.rec.checkpoint = meta;
            s.rec.checkpoint.unit = unit;
            s.rec.checkpoint.name = name;
            s.rec.checkpoint.complete = false;
            s.data = Read(unit);
            snaps_.push_back(std::move(s));
            return Status::Ok();
        }

        Status MarkComplete(const std::string &unit, const std::string &name) override
        {
            if (unit == fail_complete_on)
                return Status::IOError("set property on " + unit + ": injected failure");
            Snap *s = FindSnap(unit, name);
            if (!s)
                return Status::NotFound(unit + "@" + name);
            s->rec.checkpoint.complete = true;
            return Status::Ok();
        }

        Status ListSnapshots(std::vector<SnapshotRecord> *out) override
        {
            out->clear();
            for (const auto &s : snaps_)
                out->push_back(s.rec);
            return Status::Ok();
        }

        Status Rollback(const std::string &unit, const std::string &name) override
        {
            ++rollback_calls;
            if (unit == fail_rollback_on)
                return Status::IOError("rollback " + unit + ": injected failure");
            auto it = std::find_if(snaps_.begin(), snaps_.end(),
                                   [&](const Snap &s)
                                   { return s.rec.unit == unit && s.rec.name == name; });
            if (it == snaps_.end())
                return Status::NotFound(unit + "@" + name);
            content_[unit] = it->data;
            // Later snapshots of the same unit are discarded.
            const auto idx = static_cast<std::size_t>(it - snaps_.begin());
            std::vector<Snap> kept;
            for (std::size_t i = 0; i < snaps_.size(); ++i)
            {
                if (i > idx && snaps_[i].rec.unit == unit)
                    continue;
                kept.push_back(std::move(snaps_[i]));
            }
            snaps_ = std::move(kept);
            if (on_rollback)
                on_rollback(unit, name);
            return Status::Ok();
        }

        Status Destroy(const std::string &unit, const std::string &name) override
        {
            if (unit == fail_destroy_on)
                return Status::IOError("destroy " + unit + ": injected failure");
            if (!FindSnap(unit, name))
                return Status::NotFound(unit + "@" + name);
            DropSnapshot(unit, name);
            return Status::Ok();
        }

        Status MoveUnit(const std::string &from, const std::string &to) override
        {
            if (from == fail_move_on)
                return Status::IOError("rename " + from + ": injected failure");
            if (from.find('/') == std::string::npos)
                return Status::InvalidArgument("refusing to move pool root " + from);
            if (!HasUnit(from))
                return Status::NotFound("no unit " + from);
            if (HasUnit(to))
                return Status::AlreadyExists(to);

            auto rebase = [&](const std::string &u) -> std::string
            {
                if (u == from)
                    return to;
                if (u.size() > from.size() && u.compare(0, from.size(), from) == 0 && u[from.size()] == '/')
                    return to + u.substr(from.size());
                return std::string();
            };

            std::map<std::string, std::string> moved;
            for (auto it = content_.begin(); it != content_.end();)
            {
                std::string dest = rebase(it->first);
                if (dest.empty())
                {
                    ++it;
                    continue;
                }
                moved[dest] = std::move(it->second);
                it = content_.erase(it);
            }
            // Parents of the destination, as `zfs create -p` makes them.
            for (std::size_t slash = to.find('/'); slash != std::string::npos; slash = to.find('/', slash + 1))
            {
                const std::string parent = to.substr(0, slash);
                if (parent.find('/') != std::string::npos && !HasUnit(parent))
                    content_[parent] = std::string();
            }
            for (auto &[unit, data] : moved)
                content_[unit] = std::move(data);
            for (auto &s : snaps_)
            {
                std::string dest = rebase(s.rec.unit);
                if (dest.empty())
                    continue;
                s.rec.unit = dest;
                s.rec.checkpoint.unit = dest;
            }
            return Status::Ok();
        }

        // Snapshot names present on one unit.
        std::vector<std::string> SnapshotsOf(const std::string &unit) const
        {
            std::vector<std::string> out;
            for (const auto &s : snaps_)
                if (s.rec.unit == unit)
                    out.push_back(s.rec.name);
            return out;
        }

        PoolHealth Health() override { return health; }
        std::string backend_id() const override { return "memory"; }

    private:
        struct Snap
        {
            SnapshotRecord rec;
            std::string data;
        };

        Snap *FindSnap(const std::string &unit, const std::string &name)
        {
            for (auto &s : snaps_)
                if (s.rec.unit == unit && s.rec.name == name)
                    return &s;
            return nullptr;
        }

        std::map<std::string, std::string> content_;
        std::vector<Snap> snaps_;
    };

} // namespace stratum::test
