#include "config/config.h"
#include "core/validation.h"
#include "storage/zfs_backend.h"
#include "stratum/orchestrator.h"
#include "system/action_dispatcher.h"
#include "system/command_collaborators.h"
#include "util/text.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Front end for the migration orchestrator. Non-interactive: every decision
// is a command or a flag.

namespace
{
    constexpr const char *kDefaultConfig = "/etc/stratum/stratum.conf";

    void PrintUsage()
    {
        std::cerr << "Usage: stratumctl [--config=<file>] <command> [args]\n"
                  << "  status                                   - Show the recorded migration state\n"
                  << "  facts                                    - Show facts read from the system\n"
                  << "  step [--execute]                         - Advance; print (or run) the next action\n"
                  << "  commit ok|fail [detail]                  - Report the outcome of the pending action\n"
                  << "  rollback [--index=N|--group=LABEL@TIME] [--include-safety]\n"
                  << "                                           - Restore a checkpoint group\n"
                  << "  checkpoints [list]                       - List checkpoint groups\n"
                  << "  checkpoints destroy LABEL@TIME [--force] - Destroy a checkpoint group\n"
                  << "  validate                                 - Run post-migration checks\n"
                  << "\n"
                  << "Exit status: 0 success, 2 unverified, 1 failure.\n"
                  << "Interrupting a checkpoint capture or a rollback is not supported and\n"
                  << "may leave storage units in a mixed state.\n";
    }

    int ExitCode(stratum::Outcome o)
    {
        switch (o)
        {
        case stratum::Outcome::kSuccess:
            return 0;
        case stratum::Outcome::kUnverified:
            return 2;
        case stratum::Outcome::kFailure:
            return 1;
        }
        return 1;
    }

    struct Runtime
    {
        stratum::config::Config cfg;
        stratum::Collaborators deps;
        std::unique_ptr<stratum::Orchestrator> orch;
    };

    bool OpenRuntime(const std::string &config_path, Runtime *rt)
    {
        auto st = stratum::config::LoadConfigFile(config_path, &rt->cfg);
        if (!st.ok())
        {
            std::cerr << "Error: " << st.ToString() << "\n";
            return false;
        }
        st = stratum::config::ApplyLogging(rt->cfg);
        if (!st.ok())
        {
            std::cerr << "Error: " << st.ToString() << "\n";
            return false;
        }

        rt->deps.backend = std::make_shared<stratum::storage::ZfsBackend>(rt->cfg.pool);
        rt->deps.packages = std::make_shared<stratum::system::CommandPackageSystem>(
            rt->cfg.upgrade_command, rt->cfg.upgrade_check_command);
        rt->deps.init_images = std::make_shared<stratum::system::CommandInitImageSystem>(
            rt->cfg.regenerate_command, rt->cfg.regenerate_all_command, rt->cfg.collector);
        rt->deps.boot = std::make_shared<stratum::system::CommandBootConfigurator>(rt->cfg.boot_sync_command);

        st = stratum::Orchestrator::Open(stratum::config::ToOptions(rt->cfg), rt->deps, &rt->orch);
        if (!st.ok())
        {
            std::cerr << "Error: " << st.ToString() << "\n";
            return false;
        }
        return true;
    }

    void PrintGroup(const stratum::CheckpointGroup &g, std::size_t index)
    {
        std::cout << "  [" << index << "] " << g.key.ToString()
                  << "  (" << stratum::util::FormatTimestamp(g.key.created_at) << " UTC)"
                  << "  phase=" << stratum::PhaseName(g.phase)
                  << "  units=" << g.checkpoints.size() << "/" << g.expected_units
                  << (g.consistent ? "" : "  INCONSISTENT") << "\n";
    }

    void PrintAction(const stratum::StepResult &r)
    {
        const auto &a = r.action;
        std::cout << "Phase:  " << stratum::PhaseName(r.phase) << "\n";
        if (a.kind == stratum::ActionKind::kNone)
            return;
        std::cout << "Action: " << stratum::ActionKindName(a.kind);
        if (!a.target.empty())
            std::cout << " " << a.target;
        std::cout << "  (" << stratum::PhaseName(a.from) << " -> " << stratum::PhaseName(a.to) << ")\n";
        if (a.checkpoint)
            std::cout << "Guarded by checkpoint " << a.checkpoint->ToString() << "\n";
        if (a.reboot_after)
            std::cout << "A reboot follows this action.\n";
    }

    int Report(const stratum::StepResult &r)
    {
        PrintAction(r);
        if (r.reboot_required)
            std::cout << "Reboot required; run 'stratumctl step' after the system is back.\n";
        std::cout << "Outcome: " << stratum::OutcomeName(r.outcome);
        if (!r.status.ok())
            std::cout << " (" << r.status.ToString() << ")";
        std::cout << "\n";
        if (r.outcome == stratum::Outcome::kUnverified)
            std::cout << "The action reported success but the system does not confirm it. Rolling back is advised.\n";
        return ExitCode(r.outcome);
    }

    int CmdStatus(Runtime &rt)
    {
        auto res = rt.orch->State();
        if (!res.ok())
        {
            std::cerr << "Error: " << res.status().ToString() << "\n";
            return 1;
        }
        const stratum::MigrationState &s = res.value();
        if (s.run_id.empty())
        {
            std::cout << "No migration recorded.\n";
            return 0;
        }
        std::cout << "Run:        " << s.run_id << "\n"
                  << "Phase:      " << stratum::PhaseName(s.current_phase) << "\n"
                  << "Last group: " << (s.last_checkpoint_group ? s.last_checkpoint_group->ToString() : "-") << "\n";
        if (s.pending)
        {
            std::cout << "Pending:    " << stratum::ActionKindName(s.pending->kind)
                      << (s.pending->target.empty() ? "" : " " + s.pending->target)
                      << (s.pending->applied ? " (applied, awaiting reboot)" : "") << "\n";
        }
        std::cout << "History:\n";
        for (const auto &h : s.history)
        {
            std::cout << "  " << stratum::util::FormatTimestamp(h.timestamp) << "  "
                      << stratum::HistoryEventName(h.event) << "  "
                      << stratum::PhaseName(h.from) << " -> " << stratum::PhaseName(h.to);
            if (!h.detail.empty())
                std::cout << "  " << h.detail;
            std::cout << "\n";
        }
        return 0;
    }

    int CmdFacts(Runtime &rt)
    {
        auto res = rt.orch->Facts();
        if (!res.ok())
        {
            std::cerr << "Error: " << res.status().ToString() << "\n";
            return 1;
        }
        const stratum::SystemFacts &f = res.value();
        std::cout << "Release:   " << f.release.value_or("unknown") << "\n"
                  << "Kernel:    " << f.kernel_release.value_or("unknown") << "\n"
                  << "Pool:      " << stratum::PoolHealthName(f.pool) << "\n"
                  << "Boot id:   " << f.boot_id.value_or("unknown") << "\n"
                  << "Free:      " << (f.free_bytes ? std::to_string(*f.free_bytes >> 30) + "GB" : "unknown") << "\n"
                  << "Tools:     " << rt.cfg.collector.init_generator_a << "=" << (f.tools.init_generator_a ? "yes" : "no")
                  << " " << rt.cfg.collector.init_generator_b << "=" << (f.tools.init_generator_b ? "yes" : "no")
                  << " " << rt.cfg.collector.boot_sync_helper << "=" << (f.tools.boot_sync_helper ? "yes" : "no")
                  << "\n";
        return 0;
    }

    int CmdStep(Runtime &rt, const std::vector<std::string> &args)
    {
        bool execute = false;
        for (const auto &a : args)
        {
            if (a == "--execute")
                execute = true;
            else
            {
                std::cerr << "Error: unknown step option " << a << "\n";
                return 1;
            }
        }

        stratum::StepResult r = rt.orch->Step();
        if (!execute || r.action.kind == stratum::ActionKind::kNone || !r.on_complete)
            return Report(r);

        stratum::system::ActionDispatcher dispatcher(rt.deps);
        if (!dispatcher.CanExecute(r.action))
            return Report(r);

        PrintAction(r);
        stratum::ActionReport report = dispatcher.Execute(r.action);
        return Report(r.on_complete(report));
    }

    int CmdCommit(Runtime &rt, const std::vector<std::string> &args)
    {
        if (args.empty() || (args[0] != "ok" && args[0] != "fail"))
        {
            std::cerr << "Error: commit requires ok|fail\n";
            PrintUsage();
            return 1;
        }
        stratum::ActionReport report;
        report.success = args[0] == "ok";
        for (std::size_t i = 1; i < args.size(); ++i)
        {
            if (!report.detail.empty())
                report.detail += " ";
            report.detail += args[i];
        }
        return Report(rt.orch->Commit(report));
    }

    bool ParseRollbackArgs(const std::vector<std::string> &args, stratum::RollbackCriterion *c)
    {
        for (const auto &a : args)
        {
            if (a == "--include-safety")
            {
                c->include_safety = true;
            }
            else if (a.rfind("--index=", 0) == 0)
            {
                std::uint64_t idx = 0;
                if (!stratum::util::ParseU64(std::string_view(a).substr(8), &idx))
                {
                    std::cerr << "Error: bad index " << a << "\n";
                    return false;
                }
                c->kind = stratum::RollbackCriterion::Kind::kIndex;
                c->index = static_cast<std::size_t>(idx);
            }
            else if (a.rfind("--group=", 0) == 0)
            {
                auto key = stratum::CheckpointKey::Parse(std::string_view(a).substr(8));
                if (!key)
                {
                    std::cerr << "Error: bad group key " << a << " (expected LABEL@TIME)\n";
                    return false;
                }
                c->kind = stratum::RollbackCriterion::Kind::kKey;
                c->key = *key;
            }
            else
            {
                std::cerr << "Error: unknown rollback option " << a << "\n";
                return false;
            }
        }
        return true;
    }

    int CmdRollback(Runtime &rt, const std::vector<std::string> &args)
    {
        stratum::RollbackCriterion criterion;
        if (!ParseRollbackArgs(args, &criterion))
            return 1;

        std::vector<stratum::CheckpointGroup> candidates;
        auto st = rt.orch->Candidates(criterion, &candidates);
        if (st.ok())
        {
            std::cout << "Candidates (newest first):\n";
            for (std::size_t i = 0; i < candidates.size(); ++i)
                PrintGroup(candidates[i], i);
        }

        stratum::RollbackResult r = rt.orch->Rollback(criterion);
        if (r.safety)
            std::cout << "Safety checkpoint: " << r.safety->ToString() << "\n";
        else if (r.safety_consumed)
            std::cout << "Safety checkpoint: consumed by the rollback (no longer available)\n";
        if (r.restored)
            std::cout << "Restored:          " << r.restored->ToString() << "\n";
        for (const auto &u : r.rolled_back_units)
            std::cout << "  rolled back " << u << "\n";
        for (const auto &q : r.quarantined_units)
            std::cout << "  quarantined " << q.unit << " -> " << q.moved_to << "\n";
        if (!r.failed_unit.empty())
            std::cout << "  FAILED at   " << r.failed_unit << "  (manual intervention required)\n";
        std::cout << "Phase:   " << stratum::PhaseName(r.phase) << "\n"
                  << "Outcome: " << stratum::OutcomeName(r.outcome);
        if (!r.status.ok())
            std::cout << " (" << r.status.ToString() << ")";
        std::cout << "\n";
        if (r.reboot_required)
            std::cout << "Reboot to run the restored system.\n";
        return ExitCode(r.outcome);
    }

    int CmdCheckpoints(Runtime &rt, const std::vector<std::string> &args)
    {
        if (args.empty() || args[0] == "list")
        {
            std::vector<stratum::CheckpointGroup> groups;
            auto st = rt.orch->ListCheckpoints(&groups);
            if (!st.ok())
            {
                std::cerr << "Error: " << st.ToString() << "\n";
                return 1;
            }
            std::cout << "Checkpoint groups (" << groups.size() << "):\n";
            for (std::size_t i = 0; i < groups.size(); ++i)
                PrintGroup(groups[i], i);
            return 0;
        }
        if (args[0] == "destroy")
        {
            if (args.size() < 2)
            {
                std::cerr << "Error: destroy requires LABEL@TIME\n";
                return 1;
            }
            auto key = stratum::CheckpointKey::Parse(args[1]);
            if (!key)
            {
                std::cerr << "Error: bad group key " << args[1] << "\n";
                return 1;
            }
            const bool force = args.size() > 2 && args[2] == "--force";
            auto st = rt.orch->DestroyCheckpoints(*key, force);
            if (!st.ok())
            {
                std::cerr << "Error: " << st.ToString() << "\n";
                return 1;
            }
            std::cout << "Destroyed " << key->ToString() << "\n";
            return 0;
        }
        PrintUsage();
        return 1;
    }

    int CmdValidate(Runtime &rt)
    {
        auto facts = rt.orch->Facts();
        if (!facts.ok())
        {
            std::cerr << "Error: " << facts.status().ToString() << "\n";
            return 1;
        }
        stratum::core::ValidationReport report = stratum::core::Validate(facts.value(), rt.cfg.plan);
        for (const auto &c : report.checks)
            std::cout << "  [" << stratum::core::VerdictName(c.verdict) << "] " << c.name << ": " << c.detail << "\n";
        std::cout << report.Summary() << "\n";
        return report.Passed() ? 0 : 1;
    }
} // namespace

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = kDefaultConfig;
    if (!args.empty() && args[0].rfind("--config=", 0) == 0)
    {
        config_path = args[0].substr(9);
        args.erase(args.begin());
    }
    if (args.empty())
    {
        PrintUsage();
        return 1;
    }

    const std::string mode = args[0];
    args.erase(args.begin());

    Runtime rt;
    if (mode != "help" && !OpenRuntime(config_path, &rt))
        return 1;

    if (mode == "status")
        return CmdStatus(rt);
    else if (mode == "facts")
        return CmdFacts(rt);
    else if (mode == "step")
        return CmdStep(rt, args);
    else if (mode == "commit")
        return CmdCommit(rt, args);
    else if (mode == "rollback")
        return CmdRollback(rt, args);
    else if (mode == "checkpoints")
        return CmdCheckpoints(rt, args);
    else if (mode == "validate")
        return CmdValidate(rt);

    PrintUsage();
    return 1;
}
