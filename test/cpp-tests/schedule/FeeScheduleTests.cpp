/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/schedule/FeeSchedule.hpp"
#include "LedgerException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

//-------------------------------------------------------------------------

using namespace subledger;
using namespace subledger::schedule;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'700'000'000;
constexpr Timestamp kHour = FeeSchedule::kAccrualUnit;

}  // namespace

//-------------------------------------------------------------------------

TEST(FeeScheduleTest, StartsWithSingleOpenEntry)
{
    const FeeSchedule schedule{100, kStart};
    ASSERT_EQ(schedule.size(), 1);
    EXPECT_TRUE(schedule.entries().front().isOpen());
    EXPECT_EQ(schedule.entries().front().start, kStart);
    EXPECT_EQ(schedule.currentRate(), 100);
}

TEST(FeeScheduleTest, RejectsNegativeFee)
{
    EXPECT_THROW(FeeSchedule(-1, kStart), ValidationError);
    FeeSchedule schedule{100, kStart};
    EXPECT_THROW(schedule.appendRate(-5, kStart + kHour), ValidationError);
    EXPECT_EQ(schedule.currentRate(), 100);
}

//-------------------------------------------------------------------------

TEST(FeeScheduleTest, AppendClosesOpenEntry)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(200, kStart + 10 * kHour);

    ASSERT_EQ(schedule.size(), 2);
    EXPECT_EQ(
        schedule.entries()[0],
        (FeeEntry{.start = kStart, .end = kStart + 10 * kHour, .amount = 100}));
    EXPECT_EQ(
        schedule.entries()[1],
        (FeeEntry{.start = kStart + 10 * kHour, .end = TIMESTAMP_FAR_FUTURE, .amount = 200}));
    EXPECT_EQ(schedule.currentRate(), 200);
}

TEST(FeeScheduleTest, AppendAtOpenStartReplacesRate)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(300, kStart);
    ASSERT_EQ(schedule.size(), 1);
    EXPECT_EQ(schedule.currentRate(), 300);
}

TEST(FeeScheduleTest, AppendBeforeOpenStartThrows)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(200, kStart + kHour);
    EXPECT_THROW(schedule.appendRate(300, kStart), ValidationError);
    EXPECT_EQ(schedule.size(), 2);
}

//-------------------------------------------------------------------------

TEST(FeeScheduleTest, EarningsSpanRateChange)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(250, kStart + 10 * kHour);

    EXPECT_EQ(schedule.earningsFor(kStart, kStart + 20 * kHour), 10 * 100 + 10 * 250);
    EXPECT_EQ(schedule.earningsFor(kStart + 5 * kHour, kStart + 12 * kHour), 5 * 100 + 2 * 250);
    EXPECT_EQ(schedule.earningsFor(kStart + 15 * kHour, kStart + 20 * kHour), 5 * 250);
}

TEST(FeeScheduleTest, PartialUnitsAreTruncatedPerSlice)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(200, kStart + kHour + kHour / 2);

    // 1.5h at 100 -> 1 unit, 1.5h at 200 -> 1 unit.
    EXPECT_EQ(schedule.earningsFor(kStart, kStart + 3 * kHour), 100 + 200);
    EXPECT_EQ(schedule.earningsFor(kStart, kStart + kHour - 1), 0);
}

TEST(FeeScheduleTest, EmptyOrInvertedWindowEarnsNothing)
{
    const FeeSchedule schedule{100, kStart};
    EXPECT_EQ(schedule.earningsFor(kStart + kHour, kStart + kHour), 0);
    EXPECT_EQ(schedule.earningsFor(kStart + 2 * kHour, kStart + kHour), 0);
}

TEST(FeeScheduleTest, ZeroRateSliceContributesNothing)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(0, kStart + 2 * kHour);
    schedule.appendRate(100, kStart + 4 * kHour);
    EXPECT_EQ(schedule.earningsFor(kStart, kStart + 6 * kHour), 4 * 100);
}

TEST(FeeScheduleTest, EarningsOverflowThrows)
{
    const FeeSchedule schedule{std::numeric_limits<Amount>::max() / 2, kStart};
    EXPECT_THROW(
        static_cast<void>(schedule.earningsFor(kStart, kStart + 3 * kHour)),
        std::overflow_error);
}

//-------------------------------------------------------------------------

TEST(FeeScheduleTest, PruneDropsClosedEntriesOnly)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(200, kStart + kHour);
    schedule.appendRate(300, kStart + 2 * kHour);

    EXPECT_EQ(schedule.pruneBefore(kStart + kHour), 1);
    ASSERT_EQ(schedule.size(), 2);
    EXPECT_EQ(schedule.entries().front().amount, 200);

    EXPECT_EQ(schedule.pruneBefore(TIMESTAMP_FAR_FUTURE), 1);
    ASSERT_EQ(schedule.size(), 1);
    EXPECT_TRUE(schedule.entries().front().isOpen());
    EXPECT_EQ(schedule.currentRate(), 300);
}

TEST(FeeScheduleTest, PruneKeepsEarningsAfterCutoff)
{
    FeeSchedule schedule{100, kStart};
    schedule.appendRate(200, kStart + 5 * kHour);
    schedule.appendRate(400, kStart + 8 * kHour);

    const Timestamp cutoff = kStart + 6 * kHour;
    const Amount before = schedule.earningsFor(cutoff, kStart + 12 * kHour);
    schedule.pruneBefore(cutoff);
    EXPECT_EQ(schedule.earningsFor(cutoff, kStart + 12 * kHour), before);
    EXPECT_EQ(before, 2 * 200 + 4 * 400);
}

//-------------------------------------------------------------------------

struct ProrationTestParams
{
    Timestamp joinedOffset;
    Timestamp untilOffset;
    Amount expected;
};

void PrintTo(const ProrationTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.joinedOffset = {}, .untilOffset = {}, .expected = {}}}",
        params.joinedOffset,
        params.untilOffset,
        params.expected);
}

struct ProrationTest : TestWithParam<ProrationTestParams>
{
    virtual void SetUp() override
    {
        schedule.appendRate(50, kStart + 24 * kHour);
        schedule.appendRate(10, kStart + 48 * kHour);
    }

    FeeSchedule schedule{100, kStart};
};

TEST_P(ProrationTest, WorksCorrectly)
{
    const auto [joinedOffset, untilOffset, expected] = GetParam();
    EXPECT_EQ(schedule.earningsFor(kStart + joinedOffset, kStart + untilOffset), expected);
}

INSTANTIATE_TEST_SUITE_P(
    FeeScheduleTest,
    ProrationTest,
    Values(
        ProrationTestParams{0, 24 * kHour, 2400},
        ProrationTestParams{0, 48 * kHour, 2400 + 1200},
        ProrationTestParams{0, 72 * kHour, 2400 + 1200 + 240},
        ProrationTestParams{23 * kHour, 25 * kHour, 100 + 50},
        ProrationTestParams{30 * kHour, 30 * kHour + kHour - 1, 0},
        ProrationTestParams{100 * kHour, 110 * kHour, 100}));

//-------------------------------------------------------------------------
