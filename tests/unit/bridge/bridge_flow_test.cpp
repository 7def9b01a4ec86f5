/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "gateway/impl/source_gateway_impl.hpp"
#include "hub/hub_error.hpp"
#include "hub/impl/hub_ledger_impl.hpp"
#include "messaging/impl/local_message_bus.hpp"
#include "registry/impl/chain_registry_impl.hpp"
#include "registry/impl/token_registry_impl.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"
#include "token/impl/basic_token.hpp"
#include "token/impl/synthetic_token_factory_impl.hpp"

using bridge::Address;
using bridge::Amount;
using bridge::Domain;
using bridge::gateway::SourceGatewayImpl;
using bridge::hub::HubError;
using bridge::hub::HubLedgerImpl;
using bridge::messaging::LocalMessageBus;
using bridge::registry::ChainRegistryImpl;
using bridge::registry::TokenRegistryImpl;
using bridge::storage::InMemorySpacedStorage;
using bridge::token::BasicToken;
using bridge::token::SyntheticTokenFactoryImpl;

/**
 * Hub with two source chains connected through the in-process bus
 */
class BridgeFlowTest : public testing::Test {
 public:
  static constexpr Domain kHubDomain = 100;
  static constexpr Domain kDomainA = 1;
  static constexpr Domain kDomainB = 2;

  struct Chain {
    Domain domain;
    std::shared_ptr<BasicToken> token;
    std::shared_ptr<SourceGatewayImpl> gateway;
    Address synthetic;
  };

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    hub_transport =
        bus->openMailbox(kHubDomain, "hub mailbox"_addr).value();
    ASSERT_OUTCOME_SUCCESS(
        ledger->updateCrossChainConfig(owner, hub_transport, kHubDomain));
    ASSERT_OUTCOME_SUCCESS(ledger->setTokenRegistry(owner, token_registry));
    bus->attach(kHubDomain, hub_address, ledger);

    chain_a = connect(kDomainA, "gateway A"_addr, "token A"_addr);
    chain_b = connect(kDomainB, "gateway B"_addr, "token B"_addr);
  }

  Chain connect(Domain domain,
                const Address &gateway_address,
                const Address &token_address) {
    Chain chain{.domain = domain};
    chain.token = std::make_shared<BasicToken>(logsys,
                                               BasicToken::Params{
                                                   .address = token_address,
                                                   .name = "Collateral",
                                                   .symbol = "COL",
                                                   .decimals = 6,
                                                   .holder = alice,
                                                   .initial_supply = 1'000,
                                               });
    chain.gateway = std::make_shared<SourceGatewayImpl>(
        logsys,
        std::make_shared<InMemorySpacedStorage>(),
        owner,
        gateway_address);
    auto transport =
        bus->openMailbox(domain, Address{"mailbox"_addr}).value();
    bus->attach(domain, gateway_address, chain.gateway);

    chain.synthetic = factory
                          ->createSyntheticToken(
                              owner, domain, token_address, "Bridged", "bCOL", 6)
                          .value();
    EXPECT_OUTCOME_SUCCESS(token_registry->registerTokenMapping(
        owner, domain, token_address, kHubDomain, chain.synthetic, 6));
    EXPECT_OUTCOME_SUCCESS(
        ledger->setChainEndpoint(owner, domain, gateway_address));

    EXPECT_OUTCOME_SUCCESS(chain.gateway->updateCrossChainConfig(
        owner, transport, domain, kHubDomain, hub_address));
    EXPECT_OUTCOME_SUCCESS(chain.gateway->addWhitelistedToken(owner, chain.token));
    EXPECT_OUTCOME_SUCCESS(
        chain.gateway->setTokenMapping(owner, token_address, chain.synthetic));
    return chain;
  }

  void deposit(Chain &chain, const Address &from, const Amount &amount) {
    ASSERT_OUTCOME_SUCCESS(
        chain.token->approve(from, chain.gateway->address(), amount));
    ASSERT_OUTCOME_SUCCESS(chain.gateway->deposit(
        from, chain.token->address(), amount, from));
  }

  Amount hubBalance(const Address &user, const Chain &chain) {
    return ledger->getBalance(user, chain.synthetic).value();
  }

  Amount supply(const Chain &chain) {
    return factory->getSyntheticAsset(chain.synthetic)->totalSupply();
  }

  Address owner{"owner"_addr};
  Address hub_address{"hub"_addr};
  Address alice{"alice"_addr};

  qtils::SharedRef<bridge::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<LocalMessageBus> bus =
      std::make_shared<LocalMessageBus>(logsys);
  std::shared_ptr<ChainRegistryImpl> chain_registry =
      std::make_shared<ChainRegistryImpl>(logsys, owner);
  std::shared_ptr<TokenRegistryImpl> token_registry =
      std::make_shared<TokenRegistryImpl>(logsys, owner);
  std::shared_ptr<InMemorySpacedStorage> hub_storage =
      std::make_shared<InMemorySpacedStorage>();
  std::shared_ptr<SyntheticTokenFactoryImpl> factory =
      std::make_shared<SyntheticTokenFactoryImpl>(
          logsys, hub_storage, owner, hub_address);
  std::shared_ptr<HubLedgerImpl> ledger =
      std::make_shared<HubLedgerImpl>(logsys,
                                      hub_storage,
                                      chain_registry,
                                      factory,
                                      owner,
                                      hub_address);
  std::shared_ptr<bridge::messaging::MessageTransport> hub_transport;
  Chain chain_a;
  Chain chain_b;
};

/**
 * @given deposits on two chains
 * @when all messages are delivered, then half is withdrawn back
 * @then each chain's collateral backs exactly its own synthetic supply
 */
TEST_F(BridgeFlowTest, RoundTripKeepsCollateralEqualToSupply) {
  deposit(chain_a, alice, 300);
  deposit(chain_b, alice, 500);
  EXPECT_EQ(bus->deliverAll(), 2u);

  EXPECT_EQ(hubBalance(alice, chain_a), 300);
  EXPECT_EQ(hubBalance(alice, chain_b), 500);

  ASSERT_OUTCOME_SUCCESS(
      ledger->requestWithdraw(alice, chain_a.synthetic, 150, kDomainA));
  ASSERT_OUTCOME_SUCCESS(
      ledger->requestWithdraw(alice, chain_b.synthetic, 250, kDomainB));
  EXPECT_EQ(bus->deliverAll(), 2u);

  for (auto *chain : {&chain_a, &chain_b}) {
    EXPECT_EQ(chain->gateway->getCustodyBalance(chain->token->address()),
              supply(*chain));
    EXPECT_EQ(hubBalance(alice, *chain), supply(*chain));
  }
  EXPECT_EQ(chain_a.token->balanceOf(alice), 850);
  EXPECT_EQ(chain_b.token->balanceOf(alice), 750);
}

/**
 * @given several deposits delivered newest first with duplicates
 * @when everything has been delivered
 * @then each deposit is credited exactly once
 */
TEST_F(BridgeFlowTest, ReorderedAndDuplicatedDeliveryCreditsOnce) {
  std::vector<bridge::MessageId> ids;
  for (Amount amount : {10, 20, 30}) {
    deposit(chain_a, alice, amount);
    ids.push_back(bus->pending().back().id);
  }

  EXPECT_EQ(bus->deliverAllReversed(), 3u);
  for (auto &id : ids) {
    ASSERT_OUTCOME_SUCCESS(bus->redeliver(id));
  }

  EXPECT_EQ(hubBalance(alice, chain_a), 60);
  EXPECT_EQ(supply(chain_a), 60);
  ASSERT_OUTCOME_SUCCESS(count, ledger->getUserProcessedCount(alice));
  EXPECT_EQ(count, 3u);
}

/**
 * @given a withdrawal whose release is delivered twice
 * @when the gateway handles both deliveries
 * @then the collateral is released once
 */
TEST_F(BridgeFlowTest, DuplicatedReleasePaysOnce) {
  deposit(chain_a, alice, 100);
  EXPECT_EQ(bus->deliverAll(), 1u);

  ASSERT_OUTCOME_SUCCESS(
      id, ledger->requestWithdraw(alice, chain_a.synthetic, 100, kDomainA));
  EXPECT_EQ(bus->deliverAll(), 1u);
  ASSERT_OUTCOME_SUCCESS(bus->redeliver(id));

  EXPECT_EQ(chain_a.token->balanceOf(alice), 1'000);
  EXPECT_EQ(chain_a.gateway->getCustodyBalance(chain_a.token->address()), 0);
  EXPECT_EQ(supply(chain_a), 0);
}

/**
 * @given a deposit held by the transport while its chain is deactivated
 * @when the chain is reactivated
 * @then the deposit is credited on the next delivery
 */
TEST_F(BridgeFlowTest, DepositWaitsForChainReactivation) {
  deposit(chain_a, alice, 40);
  ASSERT_OUTCOME_SUCCESS(chain_registry->setChainStatus(owner, kDomainA, false));

  EXPECT_EQ(bus->deliverAll(), 0u);
  EXPECT_EQ(bus->pendingCount(), 1u);

  ASSERT_OUTCOME_SUCCESS(chain_registry->setChainStatus(owner, kDomainA, true));
  EXPECT_EQ(bus->deliverAll(), 1u);
  EXPECT_EQ(hubBalance(alice, chain_a), 40);
}

/**
 * @given collateral of chain A bridged as S1, then the token remapped to a
 * new synthetic S2 on the hub and on the gateway
 * @when new deposits arrive and both synthetics are withdrawn
 * @then new deposits credit S2, S1 still withdraws to chain A only, and the
 * collateral left on chain A backs what remains of both
 */
TEST_F(BridgeFlowTest, RemappedTokenKeepsOldSyntheticRedeemable) {
  deposit(chain_a, alice, 100);
  EXPECT_EQ(bus->deliverAll(), 1u);

  auto token_a = chain_a.token->address();
  ASSERT_OUTCOME_SUCCESS(
      synthetic_2,
      factory->replaceSyntheticToken(
          owner, kDomainA, token_a, "Bridged v2", "bCOL2", 6));
  ASSERT_OUTCOME_SUCCESS(token_registry->updateTokenMapping(
      owner, kDomainA, token_a, kHubDomain, synthetic_2, 6));
  ASSERT_OUTCOME_SUCCESS(
      chain_a.gateway->setTokenMapping(owner, token_a, synthetic_2));
  ASSERT_OUTCOME_SUCCESS(
      chain_registry->registerChain(owner, kDomainB + 1, "gateway C"_addr, "C"));

  deposit(chain_a, alice, 50);
  EXPECT_EQ(bus->deliverAll(), 1u);
  EXPECT_EQ(hubBalance(alice, chain_a), 100);
  ASSERT_OUTCOME_SUCCESS(balance_2, ledger->getBalance(alice, synthetic_2));
  EXPECT_EQ(balance_2, 50);

  EXPECT_OUTCOME_ERROR(
      res,
      ledger->requestWithdraw(alice, chain_a.synthetic, 10, kDomainB + 1),
      HubError::WRONG_DESTINATION_CHAIN);

  ASSERT_OUTCOME_SUCCESS(
      ledger->requestWithdraw(alice, chain_a.synthetic, 60, kDomainA));
  ASSERT_OUTCOME_SUCCESS(
      ledger->requestWithdraw(alice, synthetic_2, 50, kDomainA));
  EXPECT_EQ(bus->deliverAll(), 2u);

  EXPECT_EQ(chain_a.token->balanceOf(alice), 960);
  EXPECT_EQ(chain_a.gateway->getCustodyBalance(token_a), 40);
  EXPECT_EQ(supply(chain_a), 40);
  EXPECT_EQ(factory->getSyntheticAsset(synthetic_2)->totalSupply(), 0);
}
