/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/bootstrap.hpp"

#include "app/configuration.hpp"
#include "hub/impl/hub_ledger_impl.hpp"
#include "registry/impl/chain_registry_impl.hpp"
#include "registry/impl/token_registry_impl.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "token/impl/synthetic_token_factory_impl.hpp"

namespace bridge::app {

  std::shared_ptr<storage::SpacedStorage> openStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config) {
    auto logger = logsys->getLogger("Bootstrap", "bridge");
    if (config->database().directory.empty()) {
      SL_WARN(logger, "No database directory set; state is kept in memory");
      return std::make_shared<storage::InMemorySpacedStorage>();
    }
    SL_INFO(logger,
            "Opening database at {}",
            config->database().directory.string());
    return std::make_shared<storage::RocksDb>(logsys, config);
  }

  outcome::result<void> bootstrap(const Configuration &config,
                                  registry::ChainRegistry &chain_registry,
                                  registry::TokenRegistry &token_registry,
                                  token::SyntheticTokenFactory &token_factory) {
    const auto &hub = config.hub();

    for (const auto &chain : config.chains()) {
      if (chain_registry.getChainEndpoint(chain.domain).has_value()) {
        OUTCOME_TRY(chain_registry.updateChain(
            hub.owner, chain.domain, chain.gateway, chain.name));
      } else {
        OUTCOME_TRY(chain_registry.registerChain(
            hub.owner, chain.domain, chain.gateway, chain.name));
      }
      OUTCOME_TRY(
          chain_registry.setChainStatus(hub.owner, chain.domain, chain.active));
    }

    for (const auto &token : config.tokens()) {
      auto synthetic = token_factory.getSyntheticToken(token.source_domain,
                                                       token.source_token);
      if (not synthetic.has_value()) {
        OUTCOME_TRY(created,
                    token_factory.createSyntheticToken(hub.owner,
                                                       token.source_domain,
                                                       token.source_token,
                                                       token.name,
                                                       token.symbol,
                                                       token.decimals));
        synthetic = created;
      }
      OUTCOME_TRY(token_registry.registerTokenMapping(hub.owner,
                                                      token.source_domain,
                                                      token.source_token,
                                                      hub.domain,
                                                      synthetic.value(),
                                                      token.decimals));
    }

    return outcome::success();
  }

  outcome::result<HubComponents> assembleHub(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      std::shared_ptr<storage::SpacedStorage> storage) {
    const auto &hub = config->hub();

    HubComponents components;
    components.storage = std::move(storage);

    auto chain_registry =
        std::make_shared<registry::ChainRegistryImpl>(logsys, hub.owner);
    auto token_registry =
        std::make_shared<registry::TokenRegistryImpl>(logsys, hub.owner);
    auto token_factory = std::make_shared<token::SyntheticTokenFactoryImpl>(
        logsys, components.storage, hub.owner, hub.address);

    OUTCOME_TRY(
        bootstrap(*config, *chain_registry, *token_registry, *token_factory));

    auto ledger = std::make_shared<hub::HubLedgerImpl>(
        logsys,
        components.storage,
        chain_registry,
        token_factory,
        hub.owner,
        hub.address,
        hub.unmapped_token_policy);
    OUTCOME_TRY(ledger->setTokenRegistry(hub.owner, token_registry));

    components.chain_registry = std::move(chain_registry);
    components.token_registry = std::move(token_registry);
    components.token_factory = std::move(token_factory);
    components.ledger = std::move(ledger);
    return components;
  }

}  // namespace bridge::app
