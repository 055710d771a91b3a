/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "test-common/LedgerHarness.hpp"

#include "LedgerException.hpp"
#include "json_util.hpp"
#include "subledger/ledger/EventLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace subledger;
using namespace subledger::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> readLines(const fs::path& path)
{
    std::ifstream ifs{path};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(LedgerTest, MissingCollaboratorThrows)
{
    ManualClock clock{kStart};
    external::InMemoryDedupKeyStore keys;
    EXPECT_THROW(
        subledger::ledger::Ledger(
            makeTestConfig(),
            subledger::ledger::LedgerCollaborators{
                .transfers = nullptr,
                .keys = &keys,
                .clock = &clock,
                .logger = util::makeNullLogger()
            }),
        std::invalid_argument);
}

TEST(LedgerTest, CustomIdAllocatorsAreUsed)
{
    external::InMemoryValueTransferService transfers{"ledger"};
    external::InMemoryDedupKeyStore keys;
    ManualClock clock{kStart};
    subledger::ledger::Ledger ledger{
        makeTestConfig(),
        subledger::ledger::LedgerCollaborators{
            .transfers = &transfers,
            .keys = &keys,
            .clock = &clock,
            .providerIds = std::make_unique<external::MonotonicIdAllocator>(1000),
            .logger = util::makeNullLogger()
        }};

    EXPECT_EQ(ledger.registry().registerProvider({"bob"}, "k", 100), 1000);
    EXPECT_EQ(ledger.registry().nextSubscriberId(), 1);
}

TEST(LedgerTest, QueriesRequireKnownIds)
{
    LedgerHarness harness;
    EXPECT_THROW(static_cast<void>(harness.ledger->providerEarnings(1)), StateError);
    EXPECT_THROW(static_cast<void>(harness.ledger->subscriberOwed(1)), StateError);
}

TEST(LedgerTest, JsonSnapshot)
{
    LedgerHarness harness;
    const auto providers = harness.addProviders(3);
    const auto id = harness.addSubscriber("alice", 1000, providers);
    harness.clock.advanceHours(2);

    rapidjson::Document json;
    harness.ledger->jsonSerialize(json);

    EXPECT_EQ(json["timestamp"].GetUint64(), kStart + 2 * kHour);
    EXPECT_STREQ(json["config"]["overdraftPolicy"].GetString(), "clamp");
    const auto& state = json["state"];
    ASSERT_EQ(state["providers"].Size(), 3);
    const auto& provider = state["providers"][0];
    EXPECT_EQ(provider["providerId"].GetUint64(), providers[0]);
    EXPECT_EQ(provider["fee"].GetInt64(), 100);
    EXPECT_TRUE(provider["schedule"][0]["end"].IsNull());
    EXPECT_EQ(provider["roster"].Size(), 1);
    const auto& subscriber = state["subscribers"][0];
    EXPECT_EQ(subscriber["subscriberId"].GetUint64(), id);
    EXPECT_EQ(subscriber["balance"].GetInt64(), 1000);
    EXPECT_EQ(subscriber["subscriptions"].Size(), 3);
}

//-------------------------------------------------------------------------

struct EventLoggerTest : Test
{
    virtual void SetUp() override
    {
        logPath = fs::temp_directory_path()
            / fmt::format("subledger-events-{}.csv", UnitTest::GetInstance()->random_seed());
        auto config = makeTestConfig();
        config.logging.eventLog = logPath;
        harness = std::make_unique<LedgerHarness>(std::move(config));
    }

    virtual void TearDown() override
    {
        harness.reset();
        fs::remove(logPath);
    }

    fs::path logPath;
    std::unique_ptr<LedgerHarness> harness;
};

TEST_F(EventLoggerTest, WritesOneRowPerEvent)
{
    ASSERT_NE(harness->ledger->eventLogger(), nullptr);
    const auto providers = harness->addProviders(3);
    const auto id = harness->addSubscriber("alice", 1000, providers);
    harness->clock.advanceHours(1);
    harness->ledger->settlement().withdraw({harness->provider(providers[0]).owner()}, providers[0]);
    harness->ledger->settlement().cancel({"alice"}, id);

    const auto lines = readLines(logPath);
    ASSERT_EQ(lines.size(), 1 + 3 + 1 + 1 + 1);
    EXPECT_EQ(lines[0], subledger::ledger::EventLogger::s_header);
    EXPECT_THAT(lines[1], StartsWith(fmt::format("{},ProviderRegistered,1,,provider-owner-0,100,hash=", kStart)));
    EXPECT_THAT(lines[4], StartsWith(fmt::format("{},SubscriberRegistered,,1,alice,1000,plan=basic", kStart)));
    EXPECT_EQ(lines[5], fmt::format("{},Withdrawal,1,,provider-owner-0,100,forfeited=0", kStart + kHour));
    EXPECT_EQ(lines[6], fmt::format("{},Cancellation,,1,alice,200,shortfall=0", kStart + kHour));
}

TEST_F(EventLoggerTest, FreeFormFieldsAreQuoted)
{
    const auto providers = harness->addProviders(3);
    harness->ledger->registry().registerProvider({"eve"}, "secret,key\nwith breaks", 100);
    harness->transfers.mint("carol, jr", 1000);
    harness->ledger->registry().registerSubscriber(
        {"carol, jr"}, 1000, "gold, \"annual\"", providers);

    const auto lines = readLines(logPath);
    ASSERT_EQ(lines.size(), 1 + 4 + 1);
    EXPECT_THAT(lines[4], StartsWith(fmt::format("{},ProviderRegistered,4,,eve,100,hash=", kStart)));
    EXPECT_THAT(lines[4], Not(HasSubstr("secret")));
    EXPECT_EQ(
        lines[5],
        fmt::format(
            "{},SubscriberRegistered,,1,\"carol, jr\",1000,\"plan=gold, \"\"annual\"\";providers=1 2 3\"",
            kStart));
}

//-------------------------------------------------------------------------
