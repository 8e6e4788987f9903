#include <gtest/gtest.h>

#include <string>

#include "stratum/types.h"
#include "util/subprocess.h"
#include "util/text.h"

using namespace stratum;

TEST(TextTest, EscapeRoundTripsAwkwardValues)
{
    for (const std::string v : {"", "plain", "two words", "100%", "tab\there", "line\nbreak"})
    {
        const std::string esc = util::EscapeField(v);
        EXPECT_EQ(esc.find(' '), std::string::npos);
        EXPECT_EQ(esc.find('\n'), std::string::npos);
        std::string back;
        ASSERT_TRUE(util::UnescapeField(esc, &back)) << esc;
        EXPECT_EQ(back, v);
    }
}

TEST(TextTest, UnescapeRejectsTruncatedSequence)
{
    std::string out;
    EXPECT_FALSE(util::UnescapeField("abc%2", &out));
    EXPECT_FALSE(util::UnescapeField("abc%zz", &out));
}

TEST(TextTest, SplitWsAndTrim)
{
    auto parts = util::SplitWs("  phase \t Checkpointed  ");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "phase");
    EXPECT_EQ(parts[1], "Checkpointed");
    EXPECT_EQ(util::Trim("  x y \r\n"), "x y");
}

TEST(TextTest, ParseU64)
{
    std::uint64_t v = 0;
    EXPECT_TRUE(util::ParseU64("1760000000", &v));
    EXPECT_EQ(v, 1760000000u);
    EXPECT_FALSE(util::ParseU64("", &v));
    EXPECT_FALSE(util::ParseU64("12a", &v));
    EXPECT_FALSE(util::ParseU64("-1", &v));
    EXPECT_FALSE(util::ParseU64("99999999999999999999", &v));
}

TEST(TextTest, FormatTimestampIsUtc)
{
    EXPECT_EQ(util::FormatTimestamp(0), "19700101-000000");
    EXPECT_EQ(util::FormatTimestamp(1760000000), "20251009-085320");
}

TEST(TextTest, CommandLineSplitAndJoin)
{
    auto argv = util::SplitCommandLine("do-release-upgrade -f \"Dist Upgrade\"  x");
    ASSERT_EQ(argv.size(), 4u);
    EXPECT_EQ(argv[2], "Dist Upgrade");
    EXPECT_EQ(util::JoinCommandLine(argv), "do-release-upgrade -f \"Dist Upgrade\" x");
    EXPECT_TRUE(util::SplitCommandLine("   ").empty());
}

TEST(TypesTest, PhaseNamesRoundTrip)
{
    for (int i = 0; i <= static_cast<int>(Phase::kRolledBack); ++i)
    {
        const Phase p = static_cast<Phase>(i);
        auto back = ParsePhase(PhaseName(p));
        ASSERT_TRUE(back.has_value()) << PhaseName(p);
        EXPECT_EQ(*back, p);
    }
    EXPECT_FALSE(ParsePhase("Bogus").has_value());
}

TEST(TypesTest, PhaseOrdering)
{
    EXPECT_TRUE(IsAhead(Phase::kPackagesUpgraded, Phase::kCheckpointed));
    EXPECT_FALSE(IsAhead(Phase::kCheckpointed, Phase::kCheckpointed));
    EXPECT_FALSE(IsAhead(Phase::kRolledBack, Phase::kNotStarted));
    EXPECT_FALSE(IsAhead(Phase::kComplete, Phase::kRolledBack));
    EXPECT_TRUE(IsTerminal(Phase::kComplete));
    EXPECT_TRUE(IsTerminal(Phase::kRolledBack));
    EXPECT_FALSE(IsTerminal(Phase::kValidated));
}

TEST(TypesTest, KernelVersionParse)
{
    auto k = KernelVersion::Parse("6.14.0-27-generic");
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->major, 6u);
    EXPECT_EQ(k->minor, 14u);
    EXPECT_EQ(k->ToString(), "6.14");

    EXPECT_TRUE(KernelVersion::Parse("6.8") < KernelVersion::Parse("6.14"));
    EXPECT_FALSE(KernelVersion::Parse("6").has_value());
    EXPECT_FALSE(KernelVersion::Parse("generic").has_value());
    EXPECT_FALSE(KernelVersion::Parse("").has_value());
}

TEST(TypesTest, CheckpointKeySplitsOnLastAt)
{
    auto k = CheckpointKey::Parse("before-upgrade-to-plucky@1760000000");
    ASSERT_TRUE(k.has_value());
    EXPECT_EQ(k->label, "before-upgrade-to-plucky");
    EXPECT_EQ(k->created_at, 1760000000u);
    EXPECT_EQ(k->ToString(), "before-upgrade-to-plucky@1760000000");

    auto odd = CheckpointKey::Parse("pre-a@b@42");
    ASSERT_TRUE(odd.has_value());
    EXPECT_EQ(odd->label, "pre-a@b");

    EXPECT_FALSE(CheckpointKey::Parse("no-time").has_value());
    EXPECT_FALSE(CheckpointKey::Parse("@42").has_value());
    EXPECT_FALSE(CheckpointKey::Parse("label@soon").has_value());
}
