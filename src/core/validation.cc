#include "core/validation.h"

#include <utility>

namespace stratum::core
{
    namespace
    {
        static void Add(ValidationReport *r, std::string name, Verdict v, std::string detail)
        {
            r->checks.push_back(CheckResult{std::move(name), v, std::move(detail)});
        }

        static std::string Gb(uint64_t bytes)
        {
            return std::to_string(bytes >> 30) + "GB";
        }
    } // namespace

    const char *VerdictName(Verdict v) noexcept
    {
        switch (v)
        {
        case Verdict::kPass:
            return "pass";
        case Verdict::kWarn:
            return "warn";
        case Verdict::kFail:
            return "fail";
        }
        return "fail";
    }

    std::size_t ValidationReport::Count(Verdict v) const
    {
        std::size_t n = 0;
        for (const auto &c : checks)
            if (c.verdict == v)
                ++n;
        return n;
    }

    std::string ValidationReport::Summary() const
    {
        return std::to_string(checks.size()) + " checks: " + std::to_string(Count(Verdict::kPass)) + " pass, " +
               std::to_string(Count(Verdict::kWarn)) + " warn, " + std::to_string(Count(Verdict::kFail)) + " fail";
    }

    std::string ValidationReport::Failures() const
    {
        std::string s;
        for (const auto &c : checks)
        {
            if (c.verdict != Verdict::kFail)
                continue;
            if (!s.empty())
                s += "; ";
            s += c.name + ": " + c.detail;
        }
        return s;
    }

    ValidationReport Validate(const SystemFacts &f, const MigrationPlan &plan)
    {
        ValidationReport r;

        if (f.release && *f.release == plan.target_release)
            Add(&r, "release", Verdict::kPass, *f.release);
        else
            Add(&r, "release", Verdict::kFail,
                "expected " + plan.target_release + ", found " + f.release.value_or("unknown"));

        if (f.kernel && !(*f.kernel < plan.min_kernel))
            Add(&r, "kernel", Verdict::kPass, f.kernel->ToString());
        else
            Add(&r, "kernel", Verdict::kFail,
                "need >= " + plan.min_kernel.ToString() + ", running " +
                    (f.kernel ? f.kernel->ToString() : std::string("unknown")));

        switch (f.pool)
        {
        case PoolHealth::kHealthy:
            Add(&r, "pool", Verdict::kPass, "ONLINE");
            break;
        case PoolHealth::kDegraded:
            Add(&r, "pool", Verdict::kWarn, "DEGRADED");
            break;
        default:
            Add(&r, "pool", Verdict::kFail, PoolHealthName(f.pool));
            break;
        }

        Add(&r, "init-generator-b", f.tools.init_generator_b ? Verdict::kPass : Verdict::kFail,
            f.tools.init_generator_b ? "installed" : "missing");
        Add(&r, "init-generator-a-removed", f.tools.init_generator_a ? Verdict::kWarn : Verdict::kPass,
            f.tools.init_generator_a ? "still installed" : "removed");
        Add(&r, "boot-sync-helper", f.tools.boot_sync_helper ? Verdict::kPass : Verdict::kFail,
            f.tools.boot_sync_helper ? "installed" : "missing");

        if (!f.free_bytes)
            Add(&r, "free-space", Verdict::kWarn, "unknown");
        else if (*f.free_bytes < plan.min_free_bytes)
            Add(&r, "free-space", Verdict::kWarn, Gb(*f.free_bytes) + " free, want " + Gb(plan.min_free_bytes));
        else
            Add(&r, "free-space", Verdict::kPass, Gb(*f.free_bytes) + " free");

        return r;
    }

    std::vector<std::string> PreflightFailures(const SystemFacts &f, const MigrationPlan &plan)
    {
        std::vector<std::string> out;
        if (!f.release || *f.release != plan.source_release)
            out.push_back("release is " + f.release.value_or("unknown") + ", expected " + plan.source_release);
        if (f.pool != PoolHealth::kHealthy)
            out.push_back(std::string("pool is ") + PoolHealthName(f.pool) + ", expected healthy");
        if (!f.kernel)
            out.push_back("kernel version unknown");
        else if (*f.kernel < plan.min_kernel)
            out.push_back("kernel " + f.kernel->ToString() + " is older than " + plan.min_kernel.ToString());
        if (!f.free_bytes)
            out.push_back("free space unknown");
        else if (*f.free_bytes < plan.min_free_bytes)
            out.push_back("only " + Gb(*f.free_bytes) + " free, need " + Gb(plan.min_free_bytes));
        return out;
    }

} // namespace stratum::core
