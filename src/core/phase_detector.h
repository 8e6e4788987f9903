#pragma once
#include <utility>

#include "stratum/options.h"
#include "stratum/types.h"

namespace stratum::core
{

    // Maps facts plus the persisted record to the current phase. Pure: the
    // same input always yields the same phase.
    //
    // The persisted phase is the source of truth; facts only move it forward
    // when they prove a previous run got further than it recorded. Facts never
    // move it backwards.
    class PhaseDetector
    {
    public:
        explicit PhaseDetector(MigrationPlan plan) : plan_(std::move(plan)) {}

        Phase Detect(const SystemFacts &facts, const MigrationState &state) const;

        // Furthest phase the facts alone prove was reached.
        Phase FactLowerBound(const SystemFacts &facts, const MigrationState &state) const;

    private:
        MigrationPlan plan_;
    };

} // namespace stratum::core
