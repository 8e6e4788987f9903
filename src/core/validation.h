#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "stratum/options.h"
#include "stratum/types.h"

namespace stratum::core
{

    enum class Verdict : uint8_t
    {
        kPass = 0,
        kWarn = 1,
        kFail = 2,
    };

    const char *VerdictName(Verdict v) noexcept;

    struct CheckResult
    {
        std::string name;
        Verdict verdict = Verdict::kPass;
        std::string detail;
    };

    struct ValidationReport
    {
        std::vector<CheckResult> checks;

        std::size_t Count(Verdict v) const;
        bool Passed() const { return Count(Verdict::kFail) == 0; }
        std::string Summary() const; // "7 checks: 5 pass, 1 warn, 1 fail"
        std::string Failures() const;
    };

    // Post-migration health of the system as seen through its facts.
    ValidationReport Validate(const SystemFacts &facts, const MigrationPlan &plan);

    // Entry checks for the whole migration. Empty when every check passes.
    std::vector<std::string> PreflightFailures(const SystemFacts &facts, const MigrationPlan &plan);

} // namespace stratum::core
