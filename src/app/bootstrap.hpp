/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "hub/hub_ledger.hpp"
#include "log/logger.hpp"
#include "registry/chain_registry.hpp"
#include "registry/token_registry.hpp"
#include "storage/spaced_storage.hpp"
#include "token/synthetic_token_factory.hpp"

namespace bridge::app {
  class Configuration;

  /// Hub side of the bridge, wired together
  struct HubComponents {
    std::shared_ptr<storage::SpacedStorage> storage;
    std::shared_ptr<registry::ChainRegistry> chain_registry;
    std::shared_ptr<registry::TokenRegistry> token_registry;
    std::shared_ptr<token::SyntheticTokenFactory> token_factory;
    std::shared_ptr<hub::HubLedger> ledger;
  };

  /**
   * Opens RocksDB in the configured directory, or an in-memory store when
   * no directory is configured.
   * @throws std::system_error if the database can not be opened
   */
  std::shared_ptr<storage::SpacedStorage> openStorage(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config);

  /**
   * Registers the configured chains and creates the synthetic assets of the
   * configured tokens, mapping each of them to the hub domain. Entries which
   * already exist are brought in line with the config, so applying the same
   * config twice is harmless.
   */
  outcome::result<void> bootstrap(const Configuration &config,
                                  registry::ChainRegistry &chain_registry,
                                  registry::TokenRegistry &token_registry,
                                  token::SyntheticTokenFactory &token_factory);

  /**
   * Creates the hub components over `storage` and applies the config.
   * The ledger has no transport yet; it is set by updateCrossChainConfig.
   */
  outcome::result<HubComponents> assembleHub(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<Configuration> config,
      std::shared_ptr<storage::SpacedStorage> storage);

}  // namespace bridge::app
