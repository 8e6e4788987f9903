#pragma once
#include <functional>
#include <string>
#include <vector>

#include "stratum/options.h"
#include "stratum/status.h"
#include "stratum/types.h"

namespace stratum::core
{

    // One edge of the phase graph.
    struct Transition
    {
        Phase from = Phase::kNotStarted;
        Phase to = Phase::kNotStarted;
        std::string checkpoint_label; // empty: no checkpoint before this edge
        ActionKind action = ActionKind::kNone;
        std::string target; // release for upgrades; kernel is filled in by the caller
        bool reboot_after = false;
    };

    // What a postcondition may look at besides the facts.
    struct TransitionContext
    {
        std::string issued_boot_id; // boot id when the action was issued
        bool checkpoint_recorded = false;
    };

    // Table-driven phase graph. Advance() only describes the next edge; the
    // caller runs the action and reports back, so nothing here does I/O.
    class MigrationStateMachine
    {
    public:
        explicit MigrationStateMachine(MigrationPlan plan);

        // Edge leaving `current`. InvalidArgument for terminal phases.
        Status Advance(Phase current, Transition *out) const;

        // PreconditionFailure listing every unmet check.
        Status CheckPrecondition(const Transition &t, const SystemFacts &facts) const;
        // PostconditionFailure listing every unmet check.
        Status CheckPostcondition(const Transition &t, const SystemFacts &facts, const TransitionContext &ctx) const;

        const MigrationPlan &plan() const { return plan_; }
        std::vector<Transition> Transitions() const;

    private:
        using Pre = std::function<void(const SystemFacts &, std::vector<std::string> *)>;
        using Post = std::function<void(const SystemFacts &, const TransitionContext &, std::vector<std::string> *)>;

        struct Rule
        {
            Transition edge;
            Pre pre;
            Post post;
        };

        const Rule *Find(Phase from) const;

        MigrationPlan plan_;
        std::vector<Rule> rules_;
    };

} // namespace stratum::core
