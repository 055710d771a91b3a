/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "test-common/LedgerHarness.hpp"

#include "LedgerException.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace subledger;
using namespace subledger::config;
using namespace subledger::test;

using namespace testing;

//-------------------------------------------------------------------------

struct RegistryControllerTest : Test
{
    LedgerHarness harness;

    registry::RegistryController& registry() { return harness.ledger->registry(); }
};

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, ProvidersGetSequentialIds)
{
    EXPECT_EQ(registry().nextProviderId(), 1);
    EXPECT_EQ(harness.addProvider("bob", 100), 1);
    EXPECT_EQ(harness.addProvider("carol", 50), 2);
    EXPECT_EQ(registry().nextProviderId(), 3);

    const auto& provider = harness.provider(1);
    EXPECT_EQ(provider.owner(), "bob");
    EXPECT_EQ(provider.operatorId(), harness.ledger->config().custody);
    EXPECT_EQ(provider.fee(), 100);
    EXPECT_TRUE(provider.active());
    EXPECT_TRUE(provider.roster().empty());
    EXPECT_EQ(provider.registeredAt(), kStart);
}

TEST_F(RegistryControllerTest, ReusedKeyIsRejected)
{
    registry().registerProvider({"bob"}, "shared-key", 100);
    EXPECT_THROW(registry().registerProvider({"carol"}, "shared-key", 100), ValidationError);
    EXPECT_EQ(harness.ledger->state().providers().size(), 1);
    EXPECT_EQ(harness.keys.size(), 1);
    EXPECT_TRUE(harness.keys.contains(external::hashKey("shared-key")));
}

TEST_F(RegistryControllerTest, KeyIsNotConsumedByFailedRegistration)
{
    EXPECT_THROW(registry().registerProvider({"bob"}, "key", 49), ValidationError);
    EXPECT_EQ(harness.keys.size(), 0);
    EXPECT_EQ(registry().registerProvider({"bob"}, "key", 50), 1);
}

TEST_F(RegistryControllerTest, ProviderCapacityIsEnforced)
{
    auto config = makeTestConfig();
    config.maxProviders = 2;
    LedgerHarness capped{std::move(config)};
    capped.addProvider("a");
    capped.addProvider("b");
    EXPECT_THROW(capped.addProvider("c"), ValidationError);
    EXPECT_EQ(capped.ledger->state().providers().size(), 2);
}

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, SubscriberKeepsWholeDeposit)
{
    const auto providers = harness.addProviders(3);
    const auto id = harness.addSubscriber("alice", 1000, providers);

    EXPECT_EQ(id, 1);
    const auto& subscriber = harness.subscriber(id);
    EXPECT_EQ(subscriber.balance(), 1000);
    EXPECT_EQ(subscriber.owner(), "alice");
    EXPECT_EQ(subscriber.plan(), "basic");
    EXPECT_THAT(subscriber.subscriptions(), UnorderedElementsAreArray(providers));
    EXPECT_EQ(harness.custodyBalance(), 1000);
    EXPECT_EQ(harness.transfers.balanceOf("alice"), 0);
    for (const ProviderId providerId : providers) {
        EXPECT_EQ(harness.provider(providerId).roster().joinedAt(id), kStart);
    }
}

TEST_F(RegistryControllerTest, DepositMustCoverFeePeriods)
{
    const auto providers = harness.addProviders(3, 100);
    harness.transfers.mint("alice", 599);
    EXPECT_THROW(registry().registerSubscriber({"alice"}, 599, "basic", providers), ValidationError);
    EXPECT_EQ(harness.transfers.balanceOf("alice"), 599);
    EXPECT_NO_THROW(harness.addSubscriber("bob", 600, providers));
}

TEST_F(RegistryControllerTest, NegativeDepositIsRejected)
{
    auto config = makeTestConfig();
    config.depositPeriods = 0;
    LedgerHarness unfunded{std::move(config)};
    const auto providers = unfunded.addProviders(3);
    EXPECT_THROW(
        unfunded.ledger->registry().registerSubscriber({"alice"}, -1, "basic", providers),
        ValidationError);
}

TEST_F(RegistryControllerTest, DuplicateProviderIdsAreRejected)
{
    const auto providers = harness.addProviders(3);
    EXPECT_THROW(
        harness.addSubscriber("alice", 1000, {providers[0], providers[1], providers[0]}),
        ValidationError);
}

TEST_F(RegistryControllerTest, UnavailableProvidersAreSkipped)
{
    const auto providers = harness.addProviders(3);
    registry().setProviderStatus({"root"}, std::vector{providers[1]}, {false});

    const auto id = harness.addSubscriber("alice", 1000, {providers[0], providers[1], 99});

    EXPECT_THAT(harness.subscriber(id).subscriptions(), ElementsAre(providers[0]));
    EXPECT_FALSE(harness.provider(providers[1]).roster().contains(id));
}

TEST_F(RegistryControllerTest, SkippedProvidersDoNotCountTowardsDeposit)
{
    const auto providers = harness.addProviders(3, 100);
    registry().setProviderStatus({"root"}, std::vector{providers[1], providers[2]}, {false, false});
    EXPECT_NO_THROW(harness.addSubscriber("alice", 200, providers));
}

//-------------------------------------------------------------------------

struct ProviderListSizeTest : TestWithParam<size_t>
{
    LedgerHarness harness;
};

TEST_P(ProviderListSizeTest, WorksCorrectly)
{
    const size_t count = GetParam();
    const auto providers = harness.addProviders(count, 50);
    const auto& config = harness.ledger->config();

    if (count <= config.minProviders || count > config.maxProvidersPerSubscriber) {
        EXPECT_THROW(harness.addSubscriber("alice", 10'000, providers), ValidationError);
        return;
    }
    const auto id = harness.addSubscriber("alice", 10'000, providers);
    EXPECT_EQ(harness.subscriber(id).subscriptions().size(), count);
}

INSTANTIATE_TEST_SUITE_P(
    RegistryControllerTest, ProviderListSizeTest, Values(0, 1, 2, 3, 8, 14, 15));

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, StatusRequiresAdmin)
{
    const auto providers = harness.addProviders(1);
    EXPECT_THROW(
        registry().setProviderStatus({"bob"}, providers, {false}), AuthorizationError);
    EXPECT_TRUE(harness.provider(providers[0]).active());
}

TEST_F(RegistryControllerTest, StatusIsValidatedBeforeAnyChange)
{
    const auto providers = harness.addProviders(2);
    EXPECT_THROW(registry().setProviderStatus({"root"}, providers, {false}), ValidationError);
    EXPECT_THROW(
        registry().setProviderStatus({"root"}, std::vector<ProviderId>{providers[0], 77}, {false, false}),
        StateError);
    EXPECT_TRUE(harness.provider(providers[0]).active());

    registry().setProviderStatus({"root"}, providers, {false, true});
    EXPECT_FALSE(harness.provider(providers[0]).active());
    EXPECT_TRUE(harness.provider(providers[1]).active());
}

TEST_F(RegistryControllerTest, InactiveProviderKeepsAccruing)
{
    const auto providers = harness.addProviders(3, 100);
    const auto id = harness.addSubscriber("alice", 10'000, providers);
    registry().setProviderStatus({"root"}, std::vector{providers[0]}, {false});
    harness.clock.advanceHours(3);
    EXPECT_EQ(harness.ledger->providerEarnings(providers[0]), 300);
    EXPECT_EQ(harness.ledger->subscriberOwed(id), 900);
}

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, RemoveProviderSettlesAndDetaches)
{
    const auto providers = harness.addProviders(3, 100);
    const auto id = harness.addSubscriber("alice", 10'000, providers);
    const PrincipalId owner = harness.provider(providers[0]).owner();
    harness.clock.advanceHours(4);

    EXPECT_THROW(registry().removeProvider({"mallory"}, providers[0]), AuthorizationError);
    const auto receipt = registry().removeProvider({"root"}, providers[0]);

    EXPECT_EQ(receipt.amount, 400);
    EXPECT_EQ(harness.transfers.balanceOf(owner), 400);
    EXPECT_FALSE(harness.ledger->state().containsProvider(providers[0]));
    EXPECT_FALSE(harness.subscriber(id).isSubscribedTo(providers[0]));
    EXPECT_EQ(harness.subscriber(id).balance(), 10'000 - 400);
    EXPECT_THROW(registry().removeProvider({owner}, providers[0]), StateError);
}

TEST_F(RegistryControllerTest, OwnerMayRemoveInactiveProvider)
{
    const auto providers = harness.addProviders(3, 100);
    harness.addSubscriber("alice", 10'000, providers);
    const PrincipalId owner = harness.provider(providers[2]).owner();
    registry().setProviderStatus({"root"}, std::vector{providers[2]}, {false});
    harness.clock.advanceHours(2);

    EXPECT_EQ(registry().removeProvider({owner}, providers[2]).amount, 200);
}

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, FeeUpdateProratesEarnings)
{
    const auto providers = harness.addProviders(3, 100);
    const auto id = harness.addSubscriber("alice", 10'000, providers);
    const PrincipalId owner = harness.provider(providers[0]).owner();

    harness.clock.advanceHours(10);
    EXPECT_THROW(registry().updateProviderFee({"alice"}, providers[0], 200), AuthorizationError);
    EXPECT_THROW(registry().updateProviderFee({owner}, providers[0], 10), ValidationError);
    registry().updateProviderFee({owner}, providers[0], 200);
    harness.clock.advanceHours(5);

    EXPECT_EQ(harness.provider(providers[0]).fee(), 200);
    EXPECT_EQ(harness.ledger->providerEarnings(providers[0]), 10 * 100 + 5 * 200);
    EXPECT_EQ(harness.ledger->subscriberOwed(id), 2000 + 2 * 1500);
}

TEST_F(RegistryControllerTest, FeeUpdateAfterWithdrawalPrunesHistory)
{
    const auto providers = harness.addProviders(3, 100);
    harness.addSubscriber("alice", 10'000, providers);
    const PrincipalId owner = harness.provider(providers[0]).owner();

    harness.clock.advanceHours(1);
    registry().updateProviderFee({owner}, providers[0], 150);
    harness.clock.advanceHours(1);
    registry().updateProviderFee({owner}, providers[0], 200);
    EXPECT_EQ(harness.provider(providers[0]).schedule().size(), 3);

    harness.clock.advanceHours(1);
    harness.ledger->settlement().withdraw({owner}, providers[0]);
    EXPECT_EQ(harness.provider(providers[0]).schedule().size(), 1);
}

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, DepositCreditsBalance)
{
    const auto providers = harness.addProviders(3);
    const auto id = harness.addSubscriber("alice", 1000, providers);
    harness.transfers.mint("alice", 500);

    EXPECT_THROW(registry().deposit({"alice"}, id, 0), ValidationError);
    EXPECT_THROW(registry().deposit({"bob"}, id, 100), AuthorizationError);
    EXPECT_THROW(registry().deposit({"alice"}, id, 501), TransferFailure);
    registry().deposit({"alice"}, id, 500);

    EXPECT_EQ(harness.subscriber(id).balance(), 1500);
    EXPECT_EQ(harness.custodyBalance(), 1500);
}

TEST_F(RegistryControllerTest, DepositAfterCancellationThrows)
{
    const auto providers = harness.addProviders(3);
    const auto id = harness.addSubscriber("alice", 1000, providers);
    harness.ledger->settlement().cancel({"alice"}, id);
    harness.transfers.mint("alice", 100);
    EXPECT_THROW(registry().deposit({"alice"}, id, 100), StateError);
}

//-------------------------------------------------------------------------

TEST_F(RegistryControllerTest, EveryMutationIsSignalled)
{
    std::vector<ProviderId> registered;
    const auto conn = harness.ledger->signals().providerRegistered.connect(
        [&](const event::ProviderRegisteredEvent& ev) { registered.push_back(ev.providerId); });

    const auto providers = harness.addProviders(3);
    const auto id = harness.addSubscriber("alice", 1000, providers);
    harness.transfers.mint("alice", 10);
    registry().deposit({"alice"}, id, 10);
    registry().setProviderStatus({"root"}, std::vector{providers[0]}, {false});

    EXPECT_THAT(registered, ElementsAreArray(providers));
    EXPECT_EQ(harness.ledger->signals().eventCounter, 3 + 1 + 1 + 1);
}

//-------------------------------------------------------------------------
