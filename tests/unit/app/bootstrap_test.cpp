/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/bootstrap.hpp"
#include "mock/app/configuration_mock.hpp"
#include "registry/impl/chain_registry_impl.hpp"
#include "registry/impl/token_registry_impl.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"
#include "token/impl/synthetic_token_factory_impl.hpp"
#include "token/token_error.hpp"

using bridge::Address;
using bridge::app::ConfigurationMock;
using ChainConfig = bridge::app::Configuration::ChainConfig;
using TokenConfig = bridge::app::Configuration::TokenConfig;
using HubConfig = bridge::app::Configuration::HubConfig;
using DatabaseConfig = bridge::app::Configuration::DatabaseConfig;
using testing::ReturnRef;

class BootstrapTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    hub_config = {
        .domain = 100,
        .address = "hub"_addr,
        .owner = "owner"_addr,
        .unmapped_token_policy = bridge::hub::UnmappedTokenPolicy::ABSORB,
    };
    chains = {
        {.domain = 1, .gateway = "gateway A"_addr, .name = "A"},
        {.domain = 2, .gateway = "gateway B"_addr, .name = "B", .active = false},
    };
    tokens = {
        {.source_domain = 1,
         .source_token = "token X"_addr,
         .name = "Bridged X",
         .symbol = "bX",
         .decimals = 6},
    };

    config = std::make_shared<ConfigurationMock>();
    EXPECT_CALL(*config, hub()).WillRepeatedly(ReturnRef(hub_config));
    EXPECT_CALL(*config, database()).WillRepeatedly(ReturnRef(db_config));
    EXPECT_CALL(*config, chains()).WillRepeatedly(ReturnRef(chains));
    EXPECT_CALL(*config, tokens()).WillRepeatedly(ReturnRef(tokens));
  }

  qtils::SharedRef<bridge::log::LoggingSystem> logsys =
      testutil::prepareLoggers();

  HubConfig hub_config;
  DatabaseConfig db_config;
  std::vector<ChainConfig> chains;
  std::vector<TokenConfig> tokens;
  std::shared_ptr<ConfigurationMock> config;
};

/**
 * @given a deployment config
 * @when the hub is assembled
 * @then chains, tokens and the ledger follow the config
 */
TEST_F(BootstrapTest, AssemblesHubFromConfig) {
  auto storage = bridge::app::openStorage(logsys, config);
  ASSERT_TRUE(storage);

  ASSERT_OUTCOME_SUCCESS(hub, bridge::app::assembleHub(logsys, config, storage));

  EXPECT_TRUE(hub.chain_registry->isTrustedSender(1, "gateway A"_addr));
  EXPECT_FALSE(hub.chain_registry->isTrustedSender(2, "gateway B"_addr));
  EXPECT_TRUE(hub.chain_registry->getChainEndpoint(2).has_value());

  auto synthetic = hub.token_factory->getSyntheticToken(1, "token X"_addr);
  ASSERT_TRUE(synthetic.has_value());
  EXPECT_EQ(hub.token_registry->getSyntheticToken(1, "token X"_addr, 100),
            synthetic.value());
  EXPECT_EQ(hub.token_factory->getSyntheticAsset(*synthetic)->minter(),
            hub_config.address);

  EXPECT_EQ(hub.ledger->address(), hub_config.address);
  EXPECT_EQ(hub.ledger->getUnmappedTokenPolicy(),
            bridge::hub::UnmappedTokenPolicy::ABSORB);
}

/**
 * @given components bootstrapped once
 * @when bootstrap is applied again with a changed config
 * @then existing entries are updated and nothing is duplicated
 */
TEST_F(BootstrapTest, ReapplicationUpdatesInPlace) {
  bridge::registry::ChainRegistryImpl chain_registry(logsys,
                                                     hub_config.owner);
  bridge::registry::TokenRegistryImpl token_registry(logsys,
                                                     hub_config.owner);
  bridge::token::SyntheticTokenFactoryImpl factory(
      logsys,
      std::make_shared<bridge::storage::InMemorySpacedStorage>(),
      hub_config.owner,
      hub_config.address);

  ASSERT_OUTCOME_SUCCESS(bridge::app::bootstrap(
      *config, chain_registry, token_registry, factory));
  auto synthetic = factory.getSyntheticToken(1, "token X"_addr);

  chains[0].gateway = "gateway A2"_addr;
  chains[1].active = true;
  ASSERT_OUTCOME_SUCCESS(bridge::app::bootstrap(
      *config, chain_registry, token_registry, factory));

  EXPECT_EQ(chain_registry.getAllChains().size(), 2u);
  EXPECT_FALSE(chain_registry.isTrustedSender(1, "gateway A"_addr));
  EXPECT_TRUE(chain_registry.isTrustedSender(1, "gateway A2"_addr));
  EXPECT_TRUE(chain_registry.isTrustedSender(2, "gateway B"_addr));

  EXPECT_EQ(factory.getAllSyntheticTokens().size(), 1u);
  EXPECT_EQ(factory.getSyntheticToken(1, "token X"_addr), synthetic);
}

/**
 * @given a hub assembled over a storage, with synthetic supply minted
 * @when the hub is assembled again over the same storage
 * @then the synthetic keeps its address and its supply, and no second
 * synthetic is created
 */
TEST_F(BootstrapTest, ReassemblyOverSameStorageKeepsSyntheticSupply) {
  auto storage = std::make_shared<bridge::storage::InMemorySpacedStorage>();

  ASSERT_OUTCOME_SUCCESS(first,
                         bridge::app::assembleHub(logsys, config, storage));
  auto synthetic = first.token_factory->getSyntheticToken(1, "token X"_addr);
  ASSERT_TRUE(synthetic.has_value());
  ASSERT_OUTCOME_SUCCESS(
      first.token_factory->getSyntheticAsset(*synthetic)->mint(
          hub_config.address, "alice"_addr, 42));

  ASSERT_OUTCOME_SUCCESS(second,
                         bridge::app::assembleHub(logsys, config, storage));
  EXPECT_EQ(second.token_factory->getAllSyntheticTokens().size(), 1u);
  EXPECT_EQ(second.token_factory->getSyntheticToken(1, "token X"_addr),
            synthetic);
  auto asset = second.token_factory->getSyntheticAsset(*synthetic);
  ASSERT_TRUE(asset);
  EXPECT_EQ(asset->totalSupply(), 42);
  EXPECT_EQ(asset->balanceOf("alice"_addr), 42);
}

/**
 * @given a token config with invalid decimals
 * @when the hub is assembled
 * @then assembly fails
 */
TEST_F(BootstrapTest, FailsOnInvalidTokenConfig) {
  tokens[0].decimals = 200;
  auto storage = std::make_shared<bridge::storage::InMemorySpacedStorage>();
  EXPECT_OUTCOME_ERROR(res,
                       bridge::app::assembleHub(logsys, config, storage),
                       bridge::token::TokenError::INVALID_DECIMALS);
}
