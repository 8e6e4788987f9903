#include "core/state_machine.h"

#include <utility>

#include "core/validation.h"

namespace stratum::core
{
    namespace
    {
        static std::string Join(const std::vector<std::string> &parts)
        {
            std::string s;
            for (const auto &p : parts)
            {
                if (!s.empty())
                    s += "; ";
                s += p;
            }
            return s;
        }

        static void NeedRelease(const SystemFacts &f, const std::string &want, std::vector<std::string> *out)
        {
            if (!f.release || *f.release != want)
                out->push_back("release is " + f.release.value_or("unknown") + ", expected " + want);
        }

        static void NeedPoolUsable(const SystemFacts &f, std::vector<std::string> *out)
        {
            if (!PoolUsable(f.pool))
                out->push_back(std::string("pool is ") + PoolHealthName(f.pool));
        }

        static void NeedNewBoot(const SystemFacts &f, const TransitionContext &ctx, std::vector<std::string> *out)
        {
            if (ctx.issued_boot_id.empty())
            {
                out->push_back("boot id was not recorded when the reboot was requested");
                return;
            }
            if (!f.boot_id)
                out->push_back("boot id unknown");
            else if (*f.boot_id == ctx.issued_boot_id)
                out->push_back("system has not rebooted yet");
        }
    } // namespace

    MigrationStateMachine::MigrationStateMachine(MigrationPlan plan) : plan_(std::move(plan))
    {
        const MigrationPlan &p = plan_;
        const std::string first = p.FirstRelease();
        const std::string target = p.target_release;
        const MigrationPlan cfg = p;

        // NotStarted -> PreflightVerified
        rules_.push_back(Rule{
            Transition{Phase::kNotStarted, Phase::kPreflightVerified, "", ActionKind::kNone, "", false},
            [cfg](const SystemFacts &f, std::vector<std::string> *out)
            {
                for (auto &m : PreflightFailures(f, cfg))
                    out->push_back(std::move(m));
            },
            [cfg](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
            {
                for (auto &m : PreflightFailures(f, cfg))
                    out->push_back(std::move(m));
            }});

        // PreflightVerified -> Checkpointed
        rules_.push_back(Rule{
            Transition{Phase::kPreflightVerified, Phase::kCheckpointed, "pre-" + p.target_codename + "-upgrade",
                       ActionKind::kNone, "", false},
            [](const SystemFacts &f, std::vector<std::string> *out)
            { NeedPoolUsable(f, out); },
            [](const SystemFacts &, const TransitionContext &ctx, std::vector<std::string> *out)
            {
                if (!ctx.checkpoint_recorded)
                    out->push_back("no checkpoint recorded");
            }});

        // Checkpointed -> PackagesUpgraded
        rules_.push_back(Rule{
            Transition{Phase::kCheckpointed, Phase::kPackagesUpgraded, "before-upgrade-to-" + p.FirstCodename(),
                       ActionKind::kUpgradePackages, first, false},
            [source = p.source_release](const SystemFacts &f, std::vector<std::string> *out)
            {
                NeedRelease(f, source, out);
                NeedPoolUsable(f, out);
            },
            [first](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
            { NeedRelease(f, first, out); }});

        // PackagesUpgraded -> Rebooted(step1)
        rules_.push_back(Rule{
            Transition{Phase::kPackagesUpgraded, Phase::kRebootedStep1, "", ActionKind::kReboot, "", false},
            [first](const SystemFacts &f, std::vector<std::string> *out)
            { NeedRelease(f, first, out); },
            [first](const SystemFacts &f, const TransitionContext &ctx, std::vector<std::string> *out)
            {
                NeedRelease(f, first, out);
                NeedNewBoot(f, ctx, out);
            }});

        // Rebooted(step1) -> Rebooted(step2): the second upgrade when an
        // interim release is planned, otherwise a pass-through.
        if (p.HasInterim())
        {
            rules_.push_back(Rule{
                Transition{Phase::kRebootedStep1, Phase::kRebootedStep2, "before-upgrade-to-" + p.target_codename,
                           ActionKind::kUpgradePackages, target, true},
                [first](const SystemFacts &f, std::vector<std::string> *out)
                {
                    NeedRelease(f, first, out);
                    NeedPoolUsable(f, out);
                },
                [target](const SystemFacts &f, const TransitionContext &ctx, std::vector<std::string> *out)
                {
                    NeedRelease(f, target, out);
                    NeedNewBoot(f, ctx, out);
                }});
        }
        else
        {
            rules_.push_back(Rule{
                Transition{Phase::kRebootedStep1, Phase::kRebootedStep2, "", ActionKind::kNone, "", false},
                [first](const SystemFacts &f, std::vector<std::string> *out)
                { NeedRelease(f, first, out); },
                [target](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
                { NeedRelease(f, target, out); }});
        }

        // Rebooted(step2) -> InitSystemMigrated
        rules_.push_back(Rule{
            Transition{Phase::kRebootedStep2, Phase::kInitSystemMigrated, "before-dracut-migration",
                       ActionKind::kRegenerateInitImage, "", false},
            [target](const SystemFacts &f, std::vector<std::string> *out)
            {
                NeedRelease(f, target, out);
                if (!f.tools.init_generator_b)
                    out->push_back("replacement init-image generator is not installed");
            },
            [](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
            {
                if (!f.tools.init_generator_b)
                    out->push_back("replacement init-image generator is not installed");
                if (!f.boot_image_bytes)
                    out->push_back("no init image for running kernel " + f.kernel_release.value_or("?"));
            }});

        // InitSystemMigrated -> BootConfigSynced
        rules_.push_back(Rule{
            Transition{Phase::kInitSystemMigrated, Phase::kBootConfigSynced, "", ActionKind::kSyncBootConfig, "",
                       false},
            [](const SystemFacts &f, std::vector<std::string> *out)
            {
                if (!f.tools.boot_sync_helper)
                    out->push_back("boot sync helper is not installed");
            },
            [](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
            { NeedPoolUsable(f, out); }});

        // BootConfigSynced -> Validated
        rules_.push_back(Rule{
            Transition{Phase::kBootConfigSynced, Phase::kValidated, "", ActionKind::kNone, "", false},
            [](const SystemFacts &, std::vector<std::string> *) {},
            [cfg](const SystemFacts &f, const TransitionContext &, std::vector<std::string> *out)
            {
                ValidationReport r = Validate(f, cfg);
                if (!r.Passed())
                    out->push_back("validation failed: " + r.Failures());
            }});

        // Validated -> Complete
        rules_.push_back(Rule{
            Transition{Phase::kValidated, Phase::kComplete, "", ActionKind::kNone, "", false},
            [](const SystemFacts &, std::vector<std::string> *) {},
            [](const SystemFacts &, const TransitionContext &, std::vector<std::string> *) {}});
    }

    const MigrationStateMachine::Rule *MigrationStateMachine::Find(Phase from) const
    {
        for (const auto &r : rules_)
            if (r.edge.from == from)
                return &r;
        return nullptr;
    }

    Status MigrationStateMachine::Advance(Phase current, Transition *out) const
    {
        const Rule *r = Find(current);
        if (!r)
            return Status::InvalidArgument(std::string("no transition out of ") + PhaseName(current));
        *out = r->edge;
        return Status::Ok();
    }

    Status MigrationStateMachine::CheckPrecondition(const Transition &t, const SystemFacts &facts) const
    {
        const Rule *r = Find(t.from);
        if (!r)
            return Status::InvalidArgument(std::string("no transition out of ") + PhaseName(t.from));
        std::vector<std::string> unmet;
        r->pre(facts, &unmet);
        if (!unmet.empty())
            return Status::PreconditionFailure(std::string(PhaseName(t.from)) + " -> " + PhaseName(t.to) + ": " +
                                               Join(unmet));
        return Status::Ok();
    }

    Status MigrationStateMachine::CheckPostcondition(const Transition &t, const SystemFacts &facts,
                                                     const TransitionContext &ctx) const
    {
        const Rule *r = Find(t.from);
        if (!r)
            return Status::InvalidArgument(std::string("no transition out of ") + PhaseName(t.from));
        std::vector<std::string> unmet;
        r->post(facts, ctx, &unmet);
        if (!unmet.empty())
            return Status::PostconditionFailure(std::string(PhaseName(t.from)) + " -> " + PhaseName(t.to) + ": " +
                                                Join(unmet));
        return Status::Ok();
    }

    std::vector<Transition> MigrationStateMachine::Transitions() const
    {
        std::vector<Transition> out;
        out.reserve(rules_.size());
        for (const auto &r : rules_)
            out.push_back(r.edge);
        return out;
    }

} // namespace stratum::core
