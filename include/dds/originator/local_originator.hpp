/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <unordered_set>

#include <dds/log/logger.hpp>
#include <dds/originator/originator.hpp>

namespace dds::originator {

  /// Remembers which manifests were seeded by this process
  class LocalOriginator : public Originator {
   public:
    LocalOriginator();

    outcome::result<void> advertiseContent(
        const ContentHash &manifest_id) override;

    bool isAdvertised(const ContentHash &manifest_id) const;

    size_t advertisedCount() const;

   private:
    mutable std::mutex mutex_;
    std::unordered_set<ContentHash> advertised_;
    log::Logger log_;
  };

}  // namespace dds::originator
