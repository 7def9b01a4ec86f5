/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/keys.hpp"
#include "storage/storage_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"
#include "token/impl/basic_token.hpp"
#include "token/impl/synthetic_asset.hpp"
#include "token/token_error.hpp"

using bridge::Address;
using bridge::Amount;
using bridge::kMaxAmount;
using bridge::kZeroAddress;
using bridge::token::BasicToken;
using bridge::token::SyntheticAsset;
using bridge::token::TokenError;

class TokenTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  Address alice{"alice"_addr};
  Address bob{"bob"_addr};
  Address spender{"spender"_addr};
  Address minter{"minter"_addr};

  qtils::SharedRef<bridge::log::LoggingSystem> logsys =
      testutil::prepareLoggers();

  BasicToken token{logsys,
                   {
                       .address = "token"_addr,
                       .name = "Token",
                       .symbol = "TKN",
                       .decimals = 6,
                       .holder = alice,
                       .initial_supply = 1'000,
                   }};

  SyntheticAsset::Params asset_params{
      .address = "synthetic"_addr,
      .name = "Bridged Token",
      .symbol = "bTKN",
      .decimals = 6,
      .minter = minter,
      .source_domain = 1,
      .source_token = "token"_addr,
  };

  std::shared_ptr<bridge::storage::InMemoryStorage> space =
      std::make_shared<bridge::storage::InMemoryStorage>();

  SyntheticAsset asset{logsys, space, asset_params};
};

/**
 * @given a token with the whole supply held by alice
 * @when alice transfers to bob
 * @then balances move and the supply is kept
 */
TEST_F(TokenTest, TransferMovesBalance) {
  EXPECT_EQ(token.totalSupply(), 1'000);
  ASSERT_OUTCOME_SUCCESS(token.transfer(alice, bob, 400));
  EXPECT_EQ(token.balanceOf(alice), 600);
  EXPECT_EQ(token.balanceOf(bob), 400);
  EXPECT_EQ(token.totalSupply(), 1'000);

  EXPECT_OUTCOME_ERROR(res_balance,
                       token.transfer(bob, alice, 401),
                       TokenError::INSUFFICIENT_BALANCE);
  EXPECT_OUTCOME_ERROR(
      res_zero, token.transfer(bob, kZeroAddress, 1), TokenError::ZERO_ADDRESS);
}

/**
 * @given an allowance for a spender
 * @when the spender transfers on behalf of the owner
 * @then the allowance shrinks; exceeding it fails
 */
TEST_F(TokenTest, TransferFromSpendsAllowance) {
  ASSERT_OUTCOME_SUCCESS(token.approve(alice, spender, 300));
  EXPECT_EQ(token.allowance(alice, spender), 300);

  ASSERT_OUTCOME_SUCCESS(token.transferFrom(spender, alice, bob, 200));
  EXPECT_EQ(token.allowance(alice, spender), 100);
  EXPECT_EQ(token.balanceOf(bob), 200);

  EXPECT_OUTCOME_ERROR(res,
                       token.transferFrom(spender, alice, bob, 101),
                       TokenError::INSUFFICIENT_ALLOWANCE);
  EXPECT_EQ(token.balanceOf(bob), 200);
}

/**
 * @given an unlimited allowance
 * @when it is spent
 * @then it stays unlimited
 */
TEST_F(TokenTest, UnlimitedAllowanceIsNotDecreased) {
  ASSERT_OUTCOME_SUCCESS(token.approve(alice, spender, kMaxAmount));
  ASSERT_OUTCOME_SUCCESS(token.transferFrom(spender, alice, bob, 10));
  EXPECT_EQ(token.allowance(alice, spender), kMaxAmount);
}

/**
 * @given a synthetic asset
 * @when the minter mints and burns, and others try to
 * @then only the minter changes the supply
 */
TEST_F(TokenTest, OnlyMinterChangesSyntheticSupply) {
  EXPECT_EQ(asset.minter(), minter);
  EXPECT_EQ(asset.sourceDomain(), 1u);

  ASSERT_OUTCOME_SUCCESS(asset.mint(minter, alice, 50));
  EXPECT_EQ(asset.totalSupply(), 50);
  EXPECT_EQ(asset.balanceOf(alice), 50);

  EXPECT_OUTCOME_ERROR(
      res_mint, asset.mint(alice, alice, 1), TokenError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(
      res_burn, asset.burn(alice, alice, 1), TokenError::UNAUTHORIZED);

  ASSERT_OUTCOME_SUCCESS(asset.burn(minter, alice, 20));
  EXPECT_EQ(asset.totalSupply(), 30);
  EXPECT_OUTCOME_ERROR(res_over,
                       asset.burn(minter, alice, 31),
                       TokenError::INSUFFICIENT_BALANCE);
}

/**
 * @given a synthetic asset with the maximum supply
 * @when minting once more
 * @then the mint fails on overflow
 */
TEST_F(TokenTest, MintRefusesSupplyOverflow) {
  ASSERT_OUTCOME_SUCCESS(asset.mint(minter, alice, kMaxAmount));
  EXPECT_OUTCOME_ERROR(
      res, asset.mint(minter, bob, 1), TokenError::SUPPLY_OVERFLOW);
  EXPECT_EQ(asset.balanceOf(bob), 0);
}

/**
 * @given synthetic balances
 * @when transferred between holders
 * @then they behave as any fungible token
 */
TEST_F(TokenTest, SyntheticIsTransferable) {
  ASSERT_OUTCOME_SUCCESS(asset.mint(minter, alice, 10));
  ASSERT_OUTCOME_SUCCESS(asset.transfer(alice, bob, 4));
  ASSERT_OUTCOME_SUCCESS(asset.approve(bob, spender, 4));
  ASSERT_OUTCOME_SUCCESS(asset.transferFrom(spender, bob, alice, 3));
  EXPECT_EQ(asset.balanceOf(alice), 9);
  EXPECT_EQ(asset.balanceOf(bob), 1);
}

/**
 * @given a synthetic asset with minted, moved and approved amounts
 * @when another instance is built over the same storage space
 * @then it reads back supply, balances and allowances
 */
TEST_F(TokenTest, SyntheticBookIsRestoredFromStorage) {
  ASSERT_OUTCOME_SUCCESS(asset.mint(minter, alice, 100));
  ASSERT_OUTCOME_SUCCESS(asset.transfer(alice, bob, 30));
  ASSERT_OUTCOME_SUCCESS(asset.approve(bob, spender, 5));
  ASSERT_OUTCOME_SUCCESS(asset.burn(minter, alice, 10));

  SyntheticAsset restored{logsys, space, asset_params};
  EXPECT_EQ(restored.totalSupply(), 90);
  EXPECT_EQ(restored.balanceOf(alice), 60);
  EXPECT_EQ(restored.balanceOf(bob), 30);
  EXPECT_EQ(restored.allowance(bob, spender), 5);

  ASSERT_OUTCOME_SUCCESS(restored.burn(minter, bob, 30));
  EXPECT_EQ(restored.totalSupply(), 60);
}

/**
 * @given a storage space holding bytes that are not a balance book
 * @when a synthetic asset is built over it
 * @then construction fails with a corruption error
 */
TEST_F(TokenTest, UnreadableSyntheticBookIsRejected) {
  auto broken = std::make_shared<bridge::storage::InMemoryStorage>();
  ASSERT_OUTCOME_SUCCESS(broken->put(
      bridge::storage::assetBookKey(asset_params.address),
      qtils::ByteVec{0x01, 0x02, 0x03}));

  EXPECT_THROW_OUTCOME(SyntheticAsset(logsys, broken, asset_params),
                       bridge::storage::StorageError::CORRUPTION);
}
