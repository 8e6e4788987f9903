#include "core/phase_detector.h"

namespace stratum::core
{
    namespace
    {
        // A reboot is proven by a boot id different from the one recorded when
        // the action leading to `to` was issued.
        static bool RebootedInto(const SystemFacts &facts, const MigrationState &state, Phase to)
        {
            if (!state.pending || state.pending->to != to || state.pending->boot_id.empty())
                return false;
            return facts.boot_id && *facts.boot_id != state.pending->boot_id;
        }
    } // namespace

    Phase PhaseDetector::FactLowerBound(const SystemFacts &facts, const MigrationState &state) const
    {
        if (!facts.release || *facts.release == plan_.source_release)
            return Phase::kNotStarted;

        const std::string &release = *facts.release;

        if (plan_.HasInterim() && release == plan_.interim_release)
        {
            if (RebootedInto(facts, state, Phase::kRebootedStep1))
                return Phase::kRebootedStep1;
            return Phase::kPackagesUpgraded;
        }

        if (release == plan_.target_release)
        {
            if (plan_.HasInterim())
            {
                // The target is only installed from the rebooted interim.
                if (RebootedInto(facts, state, Phase::kRebootedStep2))
                    return Phase::kRebootedStep2;
                return Phase::kRebootedStep1;
            }
            if (RebootedInto(facts, state, Phase::kRebootedStep1))
                return Phase::kRebootedStep1;
            return Phase::kPackagesUpgraded;
        }

        // Unknown release: nothing provable.
        return Phase::kNotStarted;
    }

    Phase PhaseDetector::Detect(const SystemFacts &facts, const MigrationState &state) const
    {
        if (IsTerminal(state.current_phase))
            return state.current_phase;
        const Phase lower = FactLowerBound(facts, state);
        return IsAhead(lower, state.current_phase) ? lower : state.current_phase;
    }

} // namespace stratum::core
