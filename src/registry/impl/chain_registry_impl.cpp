/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/impl/chain_registry_impl.hpp"

#include "registry/registry_error.hpp"

namespace bridge::registry {

  ChainRegistryImpl::ChainRegistryImpl(
      qtils::SharedRef<log::LoggingSystem> logsys, const Address &owner)
      : Ownable(owner),
        logger_(logsys->getLogger("ChainRegistry", "registry")) {}

  outcome::result<void> ChainRegistryImpl::validate(Domain domain,
                                                    const Address &gateway) {
    if (domain == kInvalidDomain) {
      return RegistryError::INVALID_DOMAIN;
    }
    if (isZero(gateway)) {
      return RegistryError::ZERO_ADDRESS;
    }
    return outcome::success();
  }

  outcome::result<void> ChainRegistryImpl::registerChain(
      const Address &caller,
      Domain domain,
      const Address &gateway,
      std::string name) {
    OUTCOME_TRY(onlyOwner(caller));
    OUTCOME_TRY(validate(domain, gateway));

    std::lock_guard lock{mutex_};
    if (chains_.contains(domain)) {
      return RegistryError::CHAIN_ALREADY_EXISTS;
    }
    chains_.emplace(domain,
                    ChainEndpoint{
                        .domain = domain,
                        .gateway = gateway,
                        .name = std::move(name),
                        .active = true,
                    });
    SL_INFO(logger_,
            "Chain {} registered, gateway {:0x}",
            domain,
            gateway);
    return outcome::success();
  }

  outcome::result<void> ChainRegistryImpl::updateChain(const Address &caller,
                                                       Domain domain,
                                                       const Address &gateway,
                                                       std::string name) {
    OUTCOME_TRY(onlyOwner(caller));
    OUTCOME_TRY(validate(domain, gateway));

    std::lock_guard lock{mutex_};
    auto it = chains_.find(domain);
    if (it == chains_.end()) {
      return RegistryError::CHAIN_NOT_FOUND;
    }
    it->second.gateway = gateway;
    it->second.name = std::move(name);
    SL_INFO(logger_, "Chain {} updated, gateway {:0x}", domain, gateway);
    return outcome::success();
  }

  outcome::result<void> ChainRegistryImpl::setChainEndpoint(
      const Address &caller, Domain domain, const Address &gateway) {
    OUTCOME_TRY(onlyOwner(caller));
    OUTCOME_TRY(validate(domain, gateway));

    std::lock_guard lock{mutex_};
    auto [it, inserted] = chains_.try_emplace(domain,
                                              ChainEndpoint{
                                                  .domain = domain,
                                                  .gateway = gateway,
                                              });
    if (not inserted) {
      it->second.gateway = gateway;
    }
    SL_INFO(logger_, "Chain {} endpoint set to {:0x}", domain, gateway);
    return outcome::success();
  }

  outcome::result<void> ChainRegistryImpl::setChainStatus(
      const Address &caller, Domain domain, bool active) {
    OUTCOME_TRY(onlyOwner(caller));

    std::lock_guard lock{mutex_};
    auto it = chains_.find(domain);
    if (it == chains_.end()) {
      return RegistryError::CHAIN_NOT_FOUND;
    }
    it->second.active = active;
    SL_INFO(logger_,
            "Chain {} {}",
            domain,
            active ? "activated" : "deactivated");
    return outcome::success();
  }

  outcome::result<void> ChainRegistryImpl::removeChain(const Address &caller,
                                                       Domain domain) {
    OUTCOME_TRY(onlyOwner(caller));

    std::lock_guard lock{mutex_};
    if (chains_.erase(domain) == 0) {
      return RegistryError::CHAIN_NOT_FOUND;
    }
    SL_INFO(logger_, "Chain {} removed", domain);
    return outcome::success();
  }

  std::optional<ChainEndpoint> ChainRegistryImpl::getChainEndpoint(
      Domain domain) const {
    std::lock_guard lock{mutex_};
    auto it = chains_.find(domain);
    if (it == chains_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool ChainRegistryImpl::isTrustedSender(Domain domain,
                                          const Address &sender) const {
    std::lock_guard lock{mutex_};
    auto it = chains_.find(domain);
    return it != chains_.end() and it->second.active
       and it->second.gateway == sender;
  }

  std::vector<ChainEndpoint> ChainRegistryImpl::getAllChains() const {
    std::lock_guard lock{mutex_};
    std::vector<ChainEndpoint> result;
    result.reserve(chains_.size());
    for (auto &[_, endpoint] : chains_) {
      result.push_back(endpoint);
    }
    return result;
  }

  std::vector<ChainEndpoint> ChainRegistryImpl::getActiveChains() const {
    std::lock_guard lock{mutex_};
    std::vector<ChainEndpoint> result;
    for (auto &[_, endpoint] : chains_) {
      if (endpoint.active) {
        result.push_back(endpoint);
      }
    }
    return result;
  }

}  // namespace bridge::registry
