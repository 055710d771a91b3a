/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/roster/SubscriberRoster.hpp"
#include "LedgerException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <random>

//-------------------------------------------------------------------------

using namespace subledger;
using namespace subledger::roster;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

constexpr Timestamp kStart = 1'700'000'000;

std::vector<SubscriberId> membersOf(const SubscriberRoster& roster)
{
    return {roster.members().begin(), roster.members().end()};
}

void expectConsistent(const SubscriberRoster& roster, const std::set<SubscriberId>& expected)
{
    ASSERT_EQ(roster.size(), expected.size());
    EXPECT_THAT(membersOf(roster), UnorderedElementsAreArray(expected));
    for (size_t i = 0; i < roster.members().size(); ++i) {
        const SubscriberId id = roster.members()[i];
        EXPECT_TRUE(roster.contains(id));
        EXPECT_EQ(roster.at(id).index, i);
    }
}

}  // namespace

//-------------------------------------------------------------------------

TEST(SubscriberRosterTest, AddRecordsJoinTime)
{
    SubscriberRoster roster;
    roster.add(7, kStart);
    roster.add(3, kStart + 10);

    EXPECT_THAT(membersOf(roster), ElementsAre(7, 3));
    EXPECT_EQ(roster.joinedAt(7), kStart);
    EXPECT_EQ(roster.joinedAt(3), kStart + 10);
    EXPECT_FALSE(roster.contains(4));
}

TEST(SubscriberRosterTest, DuplicateAddThrows)
{
    SubscriberRoster roster;
    roster.add(1, kStart);
    EXPECT_THROW(roster.add(1, kStart + 1), StateError);
    EXPECT_EQ(roster.size(), 1);
    EXPECT_EQ(roster.joinedAt(1), kStart);
}

TEST(SubscriberRosterTest, InvalidJoinTimeThrows)
{
    SubscriberRoster roster;
    EXPECT_THROW(roster.add(1, TIMESTAMP_INVALID), ValidationError);
    EXPECT_TRUE(roster.empty());
}

TEST(SubscriberRosterTest, RemoveSwapsLastIntoSlot)
{
    SubscriberRoster roster;
    roster.add(1, kStart);
    roster.add(2, kStart);
    roster.add(3, kStart);

    roster.remove(1);
    EXPECT_THAT(membersOf(roster), ElementsAre(3, 2));
    EXPECT_EQ(roster.at(3).index, 0);
    EXPECT_EQ(roster.at(2).index, 1);
    EXPECT_FALSE(roster.contains(1));
}

TEST(SubscriberRosterTest, RemoveLastAndOnly)
{
    SubscriberRoster roster;
    roster.add(5, kStart);
    roster.add(6, kStart);
    roster.remove(6);
    EXPECT_THAT(membersOf(roster), ElementsAre(5));
    roster.remove(5);
    EXPECT_TRUE(roster.empty());
}

TEST(SubscriberRosterTest, MissingMemberThrows)
{
    SubscriberRoster roster;
    EXPECT_THROW(roster.remove(1), StateError);
    EXPECT_THROW(static_cast<void>(roster.at(1)), StateError);
    EXPECT_THROW(static_cast<void>(roster.joinedAt(1)), StateError);
}

TEST(SubscriberRosterTest, ReAddAfterRemoveUsesNewJoinTime)
{
    SubscriberRoster roster;
    roster.add(1, kStart);
    roster.remove(1);
    roster.add(1, kStart + 100);
    EXPECT_EQ(roster.joinedAt(1), kStart + 100);
}

//-------------------------------------------------------------------------

struct RosterIntegrityTest : TestWithParam<uint32_t>
{
    SubscriberRoster roster;
    std::set<SubscriberId> expected;
};

TEST_P(RosterIntegrityTest, IndexStaysConsistentUnderChurn)
{
    std::mt19937 rng{GetParam()};
    std::uniform_int_distribution<SubscriberId> idDist{1, 40};

    for (int step = 0; step < 500; ++step) {
        const SubscriberId id = idDist(rng);
        if (expected.contains(id)) {
            roster.remove(id);
            expected.erase(id);
        } else {
            roster.add(id, kStart + step);
            expected.insert(id);
        }
        ASSERT_NO_FATAL_FAILURE(expectConsistent(roster, expected));
    }
}

INSTANTIATE_TEST_SUITE_P(SubscriberRosterTest, RosterIntegrityTest, Values(1u, 42u, 1337u));

//-------------------------------------------------------------------------
