/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @file in_memory_spaced_storage.hpp
 * @brief Implements an in-memory version of SpacedStorage.
 */

#pragma once

#include <map>
#include <memory>

#include "storage/buffer_storage.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace bridge::storage {

  /**
   * @class InMemorySpacedStorage
   * @brief In-memory implementation of the SpacedStorage interface.
   *
   * Maps Space identifiers to corresponding instances of InMemoryStorage.
   */
  class InMemorySpacedStorage : public storage::SpacedStorage {
   public:
    /**
     * @brief Retrieve or create an in-memory storage for a given space.
     * @param space The logical storage space to retrieve.
     * @return A shared pointer to the corresponding BufferStorage.
     */
    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      auto it = spaces_.find(space);
      if (it != spaces_.end()) {
        return it->second;
      }
      return spaces_.emplace(space, std::make_shared<InMemoryStorage>())
          .first->second;
    }

   private:
    /// Map of storage spaces to their corresponding in-memory storages
    std::map<Space, std::shared_ptr<InMemoryStorage>> spaces_;
  };

}  // namespace bridge::storage
