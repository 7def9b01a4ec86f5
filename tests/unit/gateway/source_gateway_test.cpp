/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "access/access_error.hpp"
#include "gateway/gateway_error.hpp"
#include "gateway/impl/source_gateway_impl.hpp"
#include "messaging/message_codec.hpp"
#include "mock/messaging/message_transport_mock.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/injected_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"
#include "token/impl/basic_token.hpp"

using bridge::Address;
using bridge::Amount;
using bridge::Domain;
using bridge::Message;
using bridge::MessageId;
using bridge::MessageKind;
using bridge::access::AccessError;
using bridge::gateway::GatewayError;
using bridge::gateway::SourceGatewayImpl;
using bridge::messaging::MessageTransportMock;
using bridge::storage::InMemorySpacedStorage;
using bridge::token::BasicToken;
using testing::_;
using testing::DoAll;
using testing::Return;
using testing::ReturnRef;
using testing::SaveArg;

class SourceGatewayTest : public testing::Test {
 public:
  static constexpr Domain kHubDomain = 100;
  static constexpr Domain kLocalDomain = 1;

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    EXPECT_CALL(*transport, address())
        .WillRepeatedly(ReturnRef(transport_address));

    token = std::make_shared<BasicToken>(logsys,
                                         BasicToken::Params{
                                             .address = token_x,
                                             .name = "Token X",
                                             .symbol = "X",
                                             .decimals = 6,
                                             .holder = user,
                                             .initial_supply = 1'000,
                                         });

    gateway = std::make_shared<SourceGatewayImpl>(
        logsys, storage, owner, gateway_address);
    ASSERT_OUTCOME_SUCCESS(gateway->updateCrossChainConfig(
        owner, transport, kLocalDomain, kHubDomain, hub_address));
    ASSERT_OUTCOME_SUCCESS(gateway->addWhitelistedToken(owner, token));
    ASSERT_OUTCOME_SUCCESS(
        gateway->setTokenMapping(owner, token_x, synthetic_x));
  }

  qtils::ByteVec releaseBody(const Amount &amount,
                             uint64_t sequence,
                             const Address &synthetic,
                             Domain origin = kHubDomain) {
    return bridge::messaging::encodeBody(Message{
                                             .kind = MessageKind::RELEASE,
                                             .origin_domain = origin,
                                             .sender = hub_address,
                                             .token = synthetic,
                                             .recipient = user_2,
                                             .amount = amount,
                                             .sequence = sequence,
                                         })
        .value();
  }

  outcome::result<void> deliver(qtils::ByteView body) {
    return gateway->handle(transport_address, kHubDomain, hub_address, body);
  }

  /// Deposits `amount` from user for user_2, the dispatch is accepted
  void depositOk(const Amount &amount) {
    ASSERT_OUTCOME_SUCCESS(token->approve(user, gateway_address, amount));
    EXPECT_CALL(*transport, dispatch(_, _, _, _))
        .WillOnce(Return(MessageId{}));
    ASSERT_OUTCOME_SUCCESS(gateway->deposit(user, token_x, amount, user_2));
  }

  Address owner{"owner"_addr};
  Address gateway_address{"gateway"_addr};
  Address transport_address{"mailbox"_addr};
  Address hub_address{"hub"_addr};
  Address token_x{"token X"_addr};
  Address synthetic_x{"synthetic X"_addr};
  Address user{"user"_addr};
  Address user_2{"user 2"_addr};

  qtils::SharedRef<bridge::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
  std::shared_ptr<InMemorySpacedStorage> storage =
      std::make_shared<InMemorySpacedStorage>();
  std::shared_ptr<MessageTransportMock> transport =
      std::make_shared<MessageTransportMock>();
  std::shared_ptr<BasicToken> token;
  std::shared_ptr<SourceGatewayImpl> gateway;
};

/**
 * @given a user with approved tokens
 * @when depositing
 * @then tokens move into custody and one DEPOSIT is dispatched to the hub
 */
TEST_F(SourceGatewayTest, DepositLocksTokensAndDispatches) {
  ASSERT_OUTCOME_SUCCESS(token->approve(user, gateway_address, 300));

  MessageId dispatched_id{"deposit"_addr};
  qtils::ByteVec body;
  EXPECT_CALL(*transport, dispatch(gateway_address, kHubDomain, hub_address, _))
      .WillOnce(DoAll(SaveArg<3>(&body), Return(dispatched_id)));

  ASSERT_OUTCOME_SUCCESS(id, gateway->deposit(user, token_x, 300, user_2));
  EXPECT_EQ(id, dispatched_id);

  EXPECT_EQ(token->balanceOf(user), 700);
  EXPECT_EQ(token->balanceOf(gateway_address), 300);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 300);
  EXPECT_EQ(token->allowance(user, gateway_address), 0);

  ASSERT_OUTCOME_SUCCESS(message,
                         bridge::messaging::decodeMessage(gateway_address, body));
  EXPECT_EQ(message.kind, MessageKind::DEPOSIT);
  EXPECT_EQ(message.origin_domain, kLocalDomain);
  EXPECT_EQ(message.token, token_x);
  EXPECT_EQ(message.recipient, user_2);
  EXPECT_EQ(message.amount, 300);
  EXPECT_EQ(message.sequence, 0u);

  ASSERT_OUTCOME_SUCCESS(nonce, gateway->getUserNonce(user_2));
  EXPECT_EQ(nonce, 1u);
}

/**
 * @given two identical deposits
 * @when both are made
 * @then their bodies differ by sequence, so the hub sees two messages
 */
TEST_F(SourceGatewayTest, IdenticalDepositsProduceDistinctMessages) {
  ASSERT_OUTCOME_SUCCESS(token->approve(user, gateway_address, 20));

  qtils::ByteVec first;
  qtils::ByteVec second;
  EXPECT_CALL(*transport, dispatch(_, _, _, _))
      .WillOnce(DoAll(SaveArg<3>(&first), Return(MessageId{})))
      .WillOnce(DoAll(SaveArg<3>(&second), Return(MessageId{})));

  ASSERT_OUTCOME_SUCCESS(gateway->deposit(user, token_x, 10, user_2));
  ASSERT_OUTCOME_SUCCESS(gateway->deposit(user, token_x, 10, user_2));

  EXPECT_NE(
      bridge::messaging::computeMessageId(kLocalDomain, gateway_address, first),
      bridge::messaging::computeMessageId(
          kLocalDomain, gateway_address, second));
}

/**
 * @given invalid deposits
 * @when made
 * @then each one is rejected without moving tokens or dispatching
 */
TEST_F(SourceGatewayTest, DepositValidatesRequest) {
  EXPECT_CALL(*transport, dispatch(_, _, _, _)).Times(0);
  ASSERT_OUTCOME_SUCCESS(token->approve(user, gateway_address, 100));

  EXPECT_OUTCOME_ERROR(res_zero,
                       gateway->deposit(user, token_x, 0, user_2),
                       GatewayError::ZERO_AMOUNT);
  EXPECT_OUTCOME_ERROR(res_recipient,
                       gateway->deposit(user, token_x, 1, bridge::kZeroAddress),
                       GatewayError::ZERO_ADDRESS);
  EXPECT_OUTCOME_ERROR(res_token,
                       gateway->deposit(user, synthetic_x, 1, user_2),
                       GatewayError::NOT_WHITELISTED);
  EXPECT_OUTCOME_ERROR(res_allowance,
                       gateway->deposit(user, token_x, 101, user_2),
                       GatewayError::INSUFFICIENT_FUNDS);
  EXPECT_OUTCOME_ERROR(res_balance,
                       gateway->deposit(user_2, token_x, 1, user),
                       GatewayError::INSUFFICIENT_FUNDS);

  EXPECT_EQ(token->balanceOf(user), 1'000);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 0);
}

/**
 * @given a gateway without cross-chain config
 * @when depositing
 * @then it is rejected
 */
TEST_F(SourceGatewayTest, DepositNeedsConfig) {
  auto bare = std::make_shared<SourceGatewayImpl>(
      logsys,
      std::make_shared<InMemorySpacedStorage>(),
      owner,
      gateway_address);
  EXPECT_OUTCOME_ERROR(res,
                       bare->deposit(user, token_x, 1, user_2),
                       GatewayError::NOT_CONFIGURED);
}

/**
 * @given an approved deposit
 * @when the transport fails to dispatch
 * @then the tokens are returned to the depositor and the sequence is kept
 */
TEST_F(SourceGatewayTest, DepositIsRefundedWhenDispatchFails) {
  ASSERT_OUTCOME_SUCCESS(token->approve(user, gateway_address, 100));
  EXPECT_CALL(*transport, dispatch(_, _, _, _))
      .WillOnce(Return(testutil::InjectedError::FAILURE));

  EXPECT_OUTCOME_ERROR(res,
                       gateway->deposit(user, token_x, 100, user_2),
                       testutil::InjectedError::FAILURE);

  EXPECT_EQ(token->balanceOf(user), 1'000);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 0);
  ASSERT_OUTCOME_SUCCESS(nonce, gateway->getUserNonce(user_2));
  EXPECT_EQ(nonce, 0u);
}

/**
 * @given a whitelisted token removed from the whitelist
 * @when depositing it and releasing its custody
 * @then deposits are rejected but releases still work
 */
TEST_F(SourceGatewayTest, DelistedTokenIsStillReleased) {
  depositOk(100);
  ASSERT_OUTCOME_SUCCESS(gateway->removeWhitelistedToken(owner, token_x));
  EXPECT_FALSE(gateway->isTokenWhitelisted(token_x));

  EXPECT_OUTCOME_ERROR(res,
                       gateway->deposit(user, token_x, 1, user_2),
                       GatewayError::NOT_WHITELISTED);

  ASSERT_OUTCOME_SUCCESS(deliver(releaseBody(40, 0, synthetic_x)));
  EXPECT_EQ(token->balanceOf(user_2), 40);
}

/**
 * @given collateral in custody
 * @when a RELEASE from the hub is delivered twice
 * @then the recipient is paid once
 */
TEST_F(SourceGatewayTest, ReleasePaysRecipientOnce) {
  depositOk(100);

  auto body = releaseBody(60, 0, synthetic_x);
  auto id = bridge::messaging::computeMessageId(kHubDomain, hub_address, body);

  ASSERT_OUTCOME_SUCCESS(deliver(body));
  ASSERT_OUTCOME_SUCCESS(deliver(body));

  EXPECT_EQ(token->balanceOf(user_2), 60);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 40);
  ASSERT_OUTCOME_SUCCESS(processed, gateway->isMessageProcessed(id));
  EXPECT_TRUE(processed);
}

/**
 * @given collateral in custody
 * @when releases are delivered from the wrong caller, the wrong sender, with
 * a spoofed body origin or of the wrong kind
 * @then all of them are rejected and custody is untouched
 */
TEST_F(SourceGatewayTest, ReleaseRejectsUntrustedMessages) {
  depositOk(100);
  auto body = releaseBody(10, 0, synthetic_x);

  EXPECT_OUTCOME_ERROR(res_caller,
                       gateway->handle(user, kHubDomain, hub_address, body),
                       GatewayError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(
      res_sender,
      gateway->handle(transport_address, kHubDomain, user, body),
      GatewayError::UNTRUSTED_ORIGIN);
  EXPECT_OUTCOME_ERROR(
      res_domain,
      gateway->handle(transport_address, kLocalDomain, hub_address, body),
      GatewayError::UNTRUSTED_ORIGIN);
  EXPECT_OUTCOME_ERROR(res_origin,
                       deliver(releaseBody(10, 1, synthetic_x, kLocalDomain)),
                       GatewayError::UNTRUSTED_ORIGIN);

  auto deposit_kind = body;
  deposit_kind[0] = static_cast<uint8_t>(MessageKind::DEPOSIT);
  EXPECT_OUTCOME_ERROR(res_kind,
                       deliver(deposit_kind),
                       GatewayError::UNEXPECTED_MESSAGE_KIND);

  qtils::ByteVec truncated(body.begin(), std::prev(body.end()));
  EXPECT_OUTCOME_ERROR(
      res_malformed, deliver(truncated), GatewayError::MALFORMED_MESSAGE);

  EXPECT_EQ(gateway->getCustodyBalance(token_x), 100);
}

/**
 * @given a release of an unknown synthetic and a release exceeding custody
 * @when delivered
 * @then both fail and stay retryable
 */
TEST_F(SourceGatewayTest, ReleaseNeedsMappingAndCustody) {
  depositOk(100);

  EXPECT_OUTCOME_ERROR(res_mapping,
                       deliver(releaseBody(1, 0, token_x)),
                       GatewayError::TOKEN_MAPPING_NOT_FOUND);

  auto body = releaseBody(101, 1, synthetic_x);
  auto id = bridge::messaging::computeMessageId(kHubDomain, hub_address, body);
  EXPECT_OUTCOME_ERROR(
      res_custody, deliver(body), GatewayError::INSUFFICIENT_CUSTODY);
  ASSERT_OUTCOME_SUCCESS(processed, gateway->isMessageProcessed(id));
  EXPECT_FALSE(processed);
}

/**
 * @given a gateway
 * @when its admin surface is used by a stranger and by the owner
 * @then only the owner succeeds and mappings are visible both ways
 */
TEST_F(SourceGatewayTest, AdminOperationsAreOwnerOnly) {
  EXPECT_OUTCOME_ERROR(res_whitelist,
                       gateway->addWhitelistedToken(user, token),
                       AccessError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(res_mapping,
                       gateway->setTokenMapping(user, token_x, synthetic_x),
                       AccessError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(res_config,
                       gateway->updateCrossChainConfig(
                           user, transport, kLocalDomain, kHubDomain, hub_address),
                       AccessError::UNAUTHORIZED);
  EXPECT_OUTCOME_ERROR(res_invalid,
                       gateway->updateCrossChainConfig(
                           owner, transport, kLocalDomain, kHubDomain,
                           bridge::kZeroAddress),
                       GatewayError::INVALID_CONFIG);

  EXPECT_EQ(gateway->getTokenMapping(token_x), synthetic_x);
  EXPECT_EQ(gateway->getReverseTokenMapping(synthetic_x), token_x);
  EXPECT_EQ(gateway->getWhitelistedTokens(), std::vector<Address>{token_x});

  auto config = gateway->getCrossChainConfig();
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->destination_gateway, hub_address);
  EXPECT_EQ(config->transport, transport_address);
}

/**
 * @given a token remapped from one synthetic to another on the hub
 * @when releases of both synthetics arrive
 * @then both are paid in the same local token
 */
TEST_F(SourceGatewayTest, RemappedTokenReleasesBothSynthetics) {
  depositOk(500);

  Address synthetic_x2{"synthetic X v2"_addr};
  ASSERT_OUTCOME_SUCCESS(
      gateway->setTokenMapping(owner, token_x, synthetic_x2));
  EXPECT_EQ(gateway->getTokenMapping(token_x), synthetic_x2);
  EXPECT_EQ(gateway->getReverseTokenMapping(synthetic_x), token_x);
  EXPECT_EQ(gateway->getReverseTokenMapping(synthetic_x2), token_x);

  ASSERT_OUTCOME_SUCCESS(deliver(releaseBody(100, 0, synthetic_x)));
  ASSERT_OUTCOME_SUCCESS(deliver(releaseBody(150, 1, synthetic_x2)));

  EXPECT_EQ(token->balanceOf(user_2), 250);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 250);
}

/**
 * @given collateral in custody and releases delivered on one thread
 * @when another thread reads custody and processed flags meanwhile
 * @then custody only decreases, a processed release stays processed and
 * every release is paid
 */
TEST_F(SourceGatewayTest, ReadsRunAlongsideReleases) {
  constexpr uint64_t kReleases = 200;
  depositOk(kReleases);

  std::vector<MessageId> ids;
  std::vector<qtils::ByteVec> bodies;
  for (uint64_t sequence = 0; sequence < kReleases; ++sequence) {
    bodies.emplace_back(releaseBody(1, sequence, synthetic_x));
    ids.emplace_back(bridge::messaging::computeMessageId(
        kHubDomain, hub_address, bodies.back()));
  }

  std::thread writer([&] {
    for (const auto &body : bodies) {
      EXPECT_OUTCOME_SUCCESS(deliver(body));
    }
  });

  Amount last_custody = kReleases;
  bool custody_decreasing = true;
  bool last_processed = false;
  bool processed_kept = true;
  for (uint64_t round = 0; round < kReleases; ++round) {
    auto custody = gateway->getCustodyBalance(token_x);
    custody_decreasing = custody_decreasing and custody <= last_custody;
    last_custody = custody;

    auto processed = gateway->isMessageProcessed(ids.front());
    auto nonce = gateway->getUserNonce(user_2);
    if (processed.has_error() or nonce.has_error()) {
      ADD_FAILURE() << "read failed during releases";
      break;
    }
    processed_kept =
        processed_kept and (processed.value() or not last_processed);
    last_processed = processed.value();
  }
  writer.join();

  EXPECT_TRUE(custody_decreasing);
  EXPECT_TRUE(processed_kept);
  EXPECT_EQ(gateway->getCustodyBalance(token_x), 0);
  EXPECT_EQ(token->balanceOf(user_2), kReleases);
  ASSERT_OUTCOME_SUCCESS(nonce, gateway->getUserNonce(user_2));
  EXPECT_EQ(nonce, 1u);
}
