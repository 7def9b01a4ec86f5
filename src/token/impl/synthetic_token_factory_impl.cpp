/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "token/impl/synthetic_token_factory_impl.hpp"

#include <boost/endian/conversion.hpp>
#include <qtils/error_throw.hpp>

#include "crypto/sha/sha256.hpp"
#include "serde/serialization.hpp"
#include "storage/codec.hpp"
#include "token/impl/token_records.hpp"
#include "token/token_error.hpp"

namespace bridge::token {

  namespace {
    constexpr std::string_view kAddressDomainTag = "bridge.synthetic";

    std::string toString(const auto &list) {
      return {list.data().begin(), list.data().end()};
    }
  }  // namespace

  SyntheticTokenFactoryImpl::SyntheticTokenFactoryImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage,
      const Address &owner,
      const Address &minter)
      : Ownable(owner),
        logger_(logsys->getLogger("SyntheticTokenFactory", "token")),
        logsys_(std::move(logsys)),
        space_(storage->getSpace(storage::Space::SyntheticAssets)),
        minter_(minter) {
    if (isZero(minter_)) {
      qtils::raise(TokenError::ZERO_ADDRESS);
    }
    if (auto res = storage::ensureSchemaVersion(*space_, kSchemaVersion);
        res.has_error()) {
      SL_CRITICAL(
          logger_, "Can't open synthetic assets storage: {}", res.error());
      qtils::raise(res.error());
    }
    if (auto res = load(); res.has_error()) {
      SL_CRITICAL(logger_, "Can't load synthetic assets: {}", res.error());
      qtils::raise(res.error());
    }
  }

  outcome::result<void> SyntheticTokenFactoryImpl::load() {
    OUTCOME_TRY(count,
                storage::readU64(*space_, storage::syntheticCountKey()));
    for (uint64_t index = 0; index < count; ++index) {
      OUTCOME_TRY(raw, space_->get(storage::syntheticRecordKey(index)));
      auto record = decode<SyntheticRecord>(raw.view());
      if (record.has_error()) {
        return storage::StorageError::CORRUPTION;
      }
      auto &r = record.value();
      add(std::make_shared<SyntheticAsset>(
          logsys_,
          space_,
          SyntheticAsset::Params{
              .address = r.synthetic,
              .name = toString(r.name),
              .symbol = toString(r.symbol),
              .decimals = r.decimals,
              .minter = minter_,
              .source_domain = r.source_domain,
              .source_token = r.source_token,
              .generation = r.generation,
          }));
    }
    if (count != 0) {
      SL_INFO(logger_, "{} synthetic assets loaded", count);
    }
    return outcome::success();
  }

  void SyntheticTokenFactoryImpl::add(std::shared_ptr<SyntheticAsset> asset) {
    auto address = asset->address();
    latest_[{asset->sourceDomain(), asset->sourceToken()}] = address;
    order_.push_back(address);
    assets_.emplace(address, std::move(asset));
  }

  Address SyntheticTokenFactoryImpl::deriveAddress(Domain source_domain,
                                                   const Address &source_token,
                                                   uint32_t generation) {
    qtils::ByteVec preimage{kAddressDomainTag.begin(),
                            kAddressDomainTag.end()};
    uint8_t domain_be[sizeof(Domain)];
    boost::endian::store_big_u32(domain_be, source_domain);
    preimage.insert(preimage.end(), std::begin(domain_be), std::end(domain_be));
    preimage.insert(preimage.end(), source_token.begin(), source_token.end());
    uint8_t generation_be[sizeof(generation)];
    boost::endian::store_big_u32(generation_be, generation);
    preimage.insert(
        preimage.end(), std::begin(generation_be), std::end(generation_be));
    return crypto::sha256(preimage);
  }

  outcome::result<Address> SyntheticTokenFactoryImpl::createSyntheticToken(
      const Address &caller,
      Domain source_domain,
      const Address &source_token,
      std::string name,
      std::string symbol,
      uint8_t decimals) {
    OUTCOME_TRY(onlyOwner(caller));
    std::lock_guard lock{mutex_};
    if (latest_.contains({source_domain, source_token})) {
      return TokenError::TOKEN_ALREADY_EXISTS;
    }
    return create(source_domain,
                  source_token,
                  0,
                  std::move(name),
                  std::move(symbol),
                  decimals);
  }

  outcome::result<Address> SyntheticTokenFactoryImpl::replaceSyntheticToken(
      const Address &caller,
      Domain source_domain,
      const Address &source_token,
      std::string name,
      std::string symbol,
      uint8_t decimals) {
    OUTCOME_TRY(onlyOwner(caller));
    std::lock_guard lock{mutex_};
    auto it = latest_.find({source_domain, source_token});
    if (it == latest_.end()) {
      return TokenError::TOKEN_NOT_FOUND;
    }
    auto generation = assets_.at(it->second)->generation() + 1;
    return create(source_domain,
                  source_token,
                  generation,
                  std::move(name),
                  std::move(symbol),
                  decimals);
  }

  outcome::result<Address> SyntheticTokenFactoryImpl::create(
      Domain source_domain,
      const Address &source_token,
      uint32_t generation,
      std::string name,
      std::string symbol,
      uint8_t decimals) {
    if (isZero(source_token)) {
      return TokenError::ZERO_ADDRESS;
    }
    if (decimals > kMaxDecimals) {
      return TokenError::INVALID_DECIMALS;
    }
    if (name.size() > kMaxNameLength or symbol.size() > kMaxSymbolLength) {
      return TokenError::INVALID_METADATA;
    }

    auto address = deriveAddress(source_domain, source_token, generation);
    if (assets_.contains(address)) {
      return TokenError::TOKEN_ALREADY_EXISTS;
    }

    SyntheticRecord record;
    record.synthetic = address;
    record.source_domain = source_domain;
    record.source_token = source_token;
    record.generation = generation;
    record.decimals = decimals;
    record.name.data().assign(name.begin(), name.end());
    record.symbol.data().assign(symbol.begin(), symbol.end());
    OUTCOME_TRY(encoded, encode(record));

    auto index = order_.size();
    auto batch = space_->batch();
    OUTCOME_TRY(
        batch->put(storage::syntheticRecordKey(index), std::move(encoded)));
    OUTCOME_TRY(batch->put(storage::syntheticCountKey(),
                           storage::encodeU64(index + 1)));
    OUTCOME_TRY(batch->commit());

    auto asset = std::make_shared<SyntheticAsset>(
        logsys_,
        space_,
        SyntheticAsset::Params{
            .address = address,
            .name = std::move(name),
            .symbol = std::move(symbol),
            .decimals = decimals,
            .minter = minter_,
            .source_domain = source_domain,
            .source_token = source_token,
            .generation = generation,
        });
    SL_INFO(logger_,
            "Synthetic token {} created at {:0x} for {:0x} of domain {} "
            "(generation {})",
            asset->symbol(),
            address,
            source_token,
            source_domain,
            generation);
    add(std::move(asset));
    return address;
  }

  std::optional<Address> SyntheticTokenFactoryImpl::getSyntheticToken(
      Domain source_domain, const Address &source_token) const {
    std::lock_guard lock{mutex_};
    auto it = latest_.find({source_domain, source_token});
    if (it == latest_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<SyntheticTokenFactory::TokenInfo>
  SyntheticTokenFactoryImpl::getTokenInfo(const Address &synthetic) const {
    std::lock_guard lock{mutex_};
    auto it = assets_.find(synthetic);
    if (it == assets_.end()) {
      return std::nullopt;
    }
    auto &asset = *it->second;
    return TokenInfo{
        .synthetic = asset.address(),
        .source_domain = asset.sourceDomain(),
        .source_token = asset.sourceToken(),
        .name = asset.name(),
        .symbol = asset.symbol(),
        .decimals = asset.decimals(),
        .generation = asset.generation(),
    };
  }

  std::vector<SyntheticTokenFactory::TokenInfo>
  SyntheticTokenFactoryImpl::getAllSyntheticTokens() const {
    std::vector<Address> addresses;
    {
      std::lock_guard lock{mutex_};
      addresses = order_;
    }
    std::vector<TokenInfo> result;
    for (auto &address : addresses) {
      if (auto info = getTokenInfo(address)) {
        result.emplace_back(std::move(info.value()));
      }
    }
    return result;
  }

  std::shared_ptr<MintableToken> SyntheticTokenFactoryImpl::getSyntheticAsset(
      const Address &synthetic) const {
    std::lock_guard lock{mutex_};
    auto it = assets_.find(synthetic);
    if (it == assets_.end()) {
      return nullptr;
    }
    return it->second;
  }

  std::optional<Domain> SyntheticTokenFactoryImpl::getSourceDomain(
      const Address &synthetic) const {
    std::lock_guard lock{mutex_};
    auto it = assets_.find(synthetic);
    if (it == assets_.end()) {
      return std::nullopt;
    }
    return it->second->sourceDomain();
  }

}  // namespace bridge::token
