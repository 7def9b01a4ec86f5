/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/token_registry_impl.hpp"

#include <algorithm>

#include "registry/registry_error.hpp"

namespace bridge::registry {

  TokenRegistryImpl::TokenRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logsys, const Address &owner)
      : Ownable(owner),
        logger_(logsys->getLogger("TokenRegistry", "registry")) {}

  outcome::result<void> TokenRegistryImpl::validate(
      const TokenMapping &mapping) {
    if (mapping.source_domain == kInvalidDomain
        or mapping.target_domain == kInvalidDomain) {
      return RegistryError::INVALID_DOMAIN;
    }
    if (isZero(mapping.source_token) or isZero(mapping.synthetic)) {
      return RegistryError::ZERO_ADDRESS;
    }
    return outcome::success();
  }

  void TokenRegistryImpl::store(TokenMapping mapping) {
    auto key = mapping.key();
    if (auto it = mappings_.find(key); it != mappings_.end()) {
      auto old_reverse = ReverseKey{key.target_domain, it->second.synthetic};
      if (auto rit = reverse_.find(old_reverse);
          rit != reverse_.end() and rit->second == key) {
        reverse_.erase(rit);
      }
    }
    reverse_[{key.target_domain, mapping.synthetic}] = key;
    mappings_[key] = std::move(mapping);
  }

  outcome::result<void> TokenRegistryImpl::registerTokenMapping(
      const Address &caller,
      Domain source_domain,
      const Address &source_token,
      Domain target_domain,
      const Address &synthetic,
      uint8_t synthetic_decimals) {
    OUTCOME_TRY(onlyOwner(caller));
    TokenMapping mapping{
        .source_domain = source_domain,
        .source_token = source_token,
        .target_domain = target_domain,
        .synthetic = synthetic,
        .synthetic_decimals = synthetic_decimals,
        .active = true,
    };
    OUTCOME_TRY(validate(mapping));

    std::lock_guard lock{mutex_};
    store(std::move(mapping));
    SL_INFO(logger_,
            "Token {:0x} of domain {} mapped to {:0x} on domain {}",
            source_token,
            source_domain,
            synthetic,
            target_domain);
    return outcome::success();
  }

  outcome::result<void> TokenRegistryImpl::updateTokenMapping(
      const Address &caller,
      Domain source_domain,
      const Address &source_token,
      Domain target_domain,
      const Address &synthetic,
      uint8_t synthetic_decimals) {
    OUTCOME_TRY(onlyOwner(caller));
    TokenMapping mapping{
        .source_domain = source_domain,
        .source_token = source_token,
        .target_domain = target_domain,
        .synthetic = synthetic,
        .synthetic_decimals = synthetic_decimals,
        .active = true,
    };
    OUTCOME_TRY(validate(mapping));

    std::lock_guard lock{mutex_};
    auto it = mappings_.find(mapping.key());
    if (it == mappings_.end()) {
      return RegistryError::TOKEN_MAPPING_NOT_FOUND;
    }
    auto previous = it->second.synthetic;
    mapping.active = it->second.active;
    store(std::move(mapping));
    SL_INFO(logger_,
            "Mapping of token {:0x} of domain {} changed from {:0x} to {:0x}",
            source_token,
            source_domain,
            previous,
            synthetic);
    return outcome::success();
  }

  outcome::result<void> TokenRegistryImpl::setTokenMappingStatus(
      const Address &caller, const TokenMappingKey &key, bool active) {
    OUTCOME_TRY(onlyOwner(caller));

    std::lock_guard lock{mutex_};
    auto it = mappings_.find(key);
    if (it == mappings_.end()) {
      return RegistryError::TOKEN_MAPPING_NOT_FOUND;
    }
    it->second.active = active;
    SL_INFO(logger_,
            "Mapping of token {:0x} of domain {} {}",
            key.source_token,
            key.source_domain,
            active ? "activated" : "deactivated");
    return outcome::success();
  }

  outcome::result<void> TokenRegistryImpl::removeTokenMapping(
      const Address &caller, const TokenMappingKey &key) {
    OUTCOME_TRY(onlyOwner(caller));

    std::lock_guard lock{mutex_};
    auto it = mappings_.find(key);
    if (it == mappings_.end()) {
      return RegistryError::TOKEN_MAPPING_NOT_FOUND;
    }
    if (auto rit = reverse_.find({key.target_domain, it->second.synthetic});
        rit != reverse_.end() and rit->second == key) {
      reverse_.erase(rit);
    }
    mappings_.erase(it);
    SL_INFO(logger_,
            "Mapping of token {:0x} of domain {} removed",
            key.source_token,
            key.source_domain);
    return outcome::success();
  }

  Address TokenRegistryImpl::getSyntheticToken(Domain source_domain,
                                               const Address &source_token,
                                               Domain target_domain) const {
    std::lock_guard lock{mutex_};
    auto it = mappings_.find({source_domain, source_token, target_domain});
    if (it == mappings_.end() or not it->second.active) {
      return kZeroAddress;
    }
    return it->second.synthetic;
  }

  std::optional<TokenMapping> TokenRegistryImpl::getTokenMapping(
      const TokenMappingKey &key) const {
    std::lock_guard lock{mutex_};
    auto it = mappings_.find(key);
    if (it == mappings_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool TokenRegistryImpl::isTokenMappingActive(
      const TokenMappingKey &key) const {
    std::lock_guard lock{mutex_};
    auto it = mappings_.find(key);
    return it != mappings_.end() and it->second.active;
  }

  std::vector<Address> TokenRegistryImpl::getChainTokens(
      Domain source_domain) const {
    std::lock_guard lock{mutex_};
    std::vector<Address> result;
    for (auto &[key, _] : mappings_) {
      if (key.source_domain == source_domain
          and std::ranges::find(result, key.source_token) == result.end()) {
        result.push_back(key.source_token);
      }
    }
    return result;
  }

  std::optional<TokenMappingKey> TokenRegistryImpl::getSourceToken(
      Domain target_domain, const Address &synthetic) const {
    std::lock_guard lock{mutex_};
    auto it = reverse_.find({target_domain, synthetic});
    if (it == reverse_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

}  // namespace bridge::registry
