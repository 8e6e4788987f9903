#include <gtest/gtest.h>

#include "core/validation.h"

using namespace stratum;
using namespace stratum::core;

namespace
{
    SystemFacts Healthy()
    {
        SystemFacts f;
        f.release = "25.10";
        f.kernel = KernelVersion{6, 17};
        f.pool = PoolHealth::kHealthy;
        f.tools.init_generator_b = true;
        f.tools.boot_sync_helper = true;
        f.free_bytes = 40ull << 30;
        return f;
    }

    Verdict VerdictOf(const ValidationReport &r, const std::string &name)
    {
        for (const auto &c : r.checks)
            if (c.name == name)
                return c.verdict;
        ADD_FAILURE() << "no check named " << name;
        return Verdict::kFail;
    }
} // namespace

TEST(ValidationTest, HealthySystemPassesEverything)
{
    ValidationReport r = Validate(Healthy(), MigrationPlan{});
    EXPECT_EQ(r.checks.size(), 7u);
    EXPECT_TRUE(r.Passed());
    EXPECT_EQ(r.Count(Verdict::kPass), 7u);
    EXPECT_EQ(r.Summary(), "7 checks: 7 pass, 0 warn, 0 fail");
    EXPECT_TRUE(r.Failures().empty());
}

TEST(ValidationTest, WarningsDoNotFail)
{
    SystemFacts f = Healthy();
    f.pool = PoolHealth::kDegraded;
    f.tools.init_generator_a = true;
    f.free_bytes = 1ull << 30;
    ValidationReport r = Validate(f, MigrationPlan{});
    EXPECT_TRUE(r.Passed());
    EXPECT_EQ(r.Count(Verdict::kWarn), 3u);
    EXPECT_EQ(VerdictOf(r, "pool"), Verdict::kWarn);
    EXPECT_EQ(VerdictOf(r, "init-generator-a-removed"), Verdict::kWarn);
    EXPECT_EQ(VerdictOf(r, "free-space"), Verdict::kWarn);
}

TEST(ValidationTest, HardFailures)
{
    SystemFacts f = Healthy();
    f.release = "25.04";
    f.kernel = KernelVersion{6, 8};
    f.pool = PoolHealth::kFaulted;
    f.tools.init_generator_b = false;
    f.tools.boot_sync_helper = false;
    ValidationReport r = Validate(f, MigrationPlan{});
    EXPECT_FALSE(r.Passed());
    EXPECT_EQ(r.Count(Verdict::kFail), 5u);
    EXPECT_NE(r.Failures().find("release: expected 25.10, found 25.04"), std::string::npos);
}

TEST(ValidationTest, PreflightFailures)
{
    MigrationPlan plan;
    SystemFacts f = Healthy();
    f.release = "24.04";
    EXPECT_TRUE(PreflightFailures(f, plan).empty());

    f.pool = PoolHealth::kDegraded;
    f.kernel.reset();
    f.free_bytes = 2ull << 30;
    auto failures = PreflightFailures(f, plan);
    EXPECT_EQ(failures.size(), 3u);
}
