/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "access/access_error.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"
#include "token/impl/synthetic_token_factory_impl.hpp"
#include "token/impl/token_records.hpp"
#include "token/token_error.hpp"

using bridge::Address;
using bridge::access::AccessError;
using bridge::token::SyntheticTokenFactoryImpl;
using bridge::token::TokenError;

class SyntheticTokenFactoryTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  Address owner{"owner"_addr};
  Address hub{"hub"_addr};
  Address token_x{"token X"_addr};

  qtils::SharedRef<bridge::log::LoggingSystem> logsys =
      testutil::prepareLoggers();

  std::shared_ptr<bridge::storage::InMemorySpacedStorage> storage =
      std::make_shared<bridge::storage::InMemorySpacedStorage>();

  SyntheticTokenFactoryImpl factory{logsys, storage, owner, hub};
};

/**
 * @given a factory
 * @when a synthetic is created for a source token
 * @then it is found by its source coordinates, minted by the hub only, and
 * described by its info
 */
TEST_F(SyntheticTokenFactoryTest, CreatesSyntheticMintedByHub) {
  ASSERT_OUTCOME_SUCCESS(
      synthetic,
      factory.createSyntheticToken(owner, 1, token_x, "Bridged X", "bX", 6));

  EXPECT_EQ(factory.getSyntheticToken(1, token_x), synthetic);
  EXPECT_FALSE(factory.getSyntheticToken(2, token_x).has_value());

  auto asset = factory.getSyntheticAsset(synthetic);
  ASSERT_TRUE(asset);
  EXPECT_EQ(asset->minter(), hub);
  EXPECT_EQ(asset->decimals(), 6);
  EXPECT_EQ(factory.getSyntheticAsset(token_x), nullptr);

  auto info = factory.getTokenInfo(synthetic);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->source_domain, 1u);
  EXPECT_EQ(info->source_token, token_x);
  EXPECT_EQ(info->symbol, "bX");
  EXPECT_EQ(factory.getAllSyntheticTokens().size(), 1u);
}

/**
 * @given the same source token on two domains
 * @when synthetics are created for both
 * @then their addresses differ
 */
TEST_F(SyntheticTokenFactoryTest, AddressDependsOnSourceDomain) {
  ASSERT_OUTCOME_SUCCESS(
      first, factory.createSyntheticToken(owner, 1, token_x, "X", "X", 18));
  ASSERT_OUTCOME_SUCCESS(
      second, factory.createSyntheticToken(owner, 2, token_x, "X", "X", 18));
  EXPECT_NE(first, second);
}

/**
 * @given invalid creation requests
 * @when made
 * @then each one is rejected
 */
TEST_F(SyntheticTokenFactoryTest, ValidatesCreation) {
  EXPECT_OUTCOME_ERROR(
      res_owner,
      factory.createSyntheticToken(hub, 1, token_x, "X", "X", 18),
      AccessError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(
      res_zero,
      factory.createSyntheticToken(owner, 1, bridge::kZeroAddress, "X", "X", 18),
      TokenError::ZERO_ADDRESS);
  EXPECT_OUTCOME_ERROR(
      res_decimals,
      factory.createSyntheticToken(
          owner, 1, token_x, "X", "X", SyntheticTokenFactoryImpl::kMaxDecimals + 1),
      TokenError::INVALID_DECIMALS);
  EXPECT_OUTCOME_ERROR(
      res_symbol,
      factory.createSyntheticToken(
          owner,
          1,
          token_x,
          "X",
          std::string(bridge::token::kMaxSymbolLength + 1, 'X'),
          18),
      TokenError::INVALID_METADATA);

  ASSERT_OUTCOME_SUCCESS(
      factory.createSyntheticToken(owner, 1, token_x, "X", "X", 18));
  EXPECT_OUTCOME_ERROR(
      res_exists,
      factory.createSyntheticToken(owner, 1, token_x, "X", "X", 18),
      TokenError::TOKEN_ALREADY_EXISTS);
}

/**
 * @given a synthetic for a source token
 * @when the owner replaces it
 * @then a new synthetic of the next generation becomes the current one and
 * the superseded one stays available
 */
TEST_F(SyntheticTokenFactoryTest, ReplacementCreatesNextGeneration) {
  ASSERT_OUTCOME_SUCCESS(
      first, factory.createSyntheticToken(owner, 1, token_x, "X", "X", 6));
  ASSERT_OUTCOME_SUCCESS(
      second,
      factory.replaceSyntheticToken(owner, 1, token_x, "X v2", "X2", 6));

  EXPECT_NE(first, second);
  EXPECT_EQ(factory.getSyntheticToken(1, token_x), second);
  ASSERT_TRUE(factory.getSyntheticAsset(first));
  EXPECT_EQ(factory.getSourceDomain(first), 1u);
  EXPECT_EQ(factory.getSourceDomain(second), 1u);
  EXPECT_EQ(factory.getTokenInfo(first)->generation, 0u);
  EXPECT_EQ(factory.getTokenInfo(second)->generation, 1u);
  EXPECT_EQ(factory.getAllSyntheticTokens().size(), 2u);

  EXPECT_OUTCOME_ERROR(
      res_unknown,
      factory.replaceSyntheticToken(owner, 2, token_x, "X", "X", 6),
      TokenError::TOKEN_NOT_FOUND);
  EXPECT_OUTCOME_ERROR(
      res_owner,
      factory.replaceSyntheticToken(hub, 1, token_x, "X", "X", 6),
      AccessError::UNAUTHORIZED);
}

/**
 * @given a factory with a replaced synthetic holding minted supply
 * @when a new factory is built over the same storage
 * @then the directory, the current generation and the supply are restored
 */
TEST_F(SyntheticTokenFactoryTest, DirectoryAndSupplySurviveRestart) {
  ASSERT_OUTCOME_SUCCESS(
      first, factory.createSyntheticToken(owner, 1, token_x, "X", "X", 6));
  ASSERT_OUTCOME_SUCCESS(
      second,
      factory.replaceSyntheticToken(owner, 1, token_x, "X v2", "X2", 6));
  ASSERT_OUTCOME_SUCCESS(
      factory.getSyntheticAsset(first)->mint(hub, "alice"_addr, 70));
  ASSERT_OUTCOME_SUCCESS(
      factory.getSyntheticAsset(second)->mint(hub, "alice"_addr, 30));

  SyntheticTokenFactoryImpl restarted{logsys, storage, owner, hub};

  EXPECT_EQ(restarted.getAllSyntheticTokens().size(), 2u);
  EXPECT_EQ(restarted.getSyntheticToken(1, token_x), second);
  auto info = restarted.getTokenInfo(second);
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->symbol, "X2");
  EXPECT_EQ(info->generation, 1u);

  auto old_asset = restarted.getSyntheticAsset(first);
  ASSERT_TRUE(old_asset);
  EXPECT_EQ(old_asset->totalSupply(), 70);
  ASSERT_OUTCOME_SUCCESS(old_asset->burn(hub, "alice"_addr, 70));
  EXPECT_EQ(restarted.getSyntheticAsset(second)->balanceOf("alice"_addr), 30);

  EXPECT_OUTCOME_ERROR(
      res_exists,
      restarted.createSyntheticToken(owner, 1, token_x, "X", "X", 6),
      TokenError::TOKEN_ALREADY_EXISTS);
}
