/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/originator/local_originator.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dds::originator, OriginatorError, e) {
  using dds::originator::OriginatorError;
  switch (e) {
    case OriginatorError::ADVERTISEMENT_FAILED:
      return "content could not be seeded";
  }
  return "unknown originator error";
}

namespace dds::originator {

  LocalOriginator::LocalOriginator()
      : log_{log::createLogger("LocalOriginator")} {}

  outcome::result<void> LocalOriginator::advertiseContent(
      const ContentHash &manifest_id) {
    std::lock_guard lock(mutex_);
    if (advertised_.insert(manifest_id).second) {
      log_->debug("seeding {}", manifest_id);
    }
    return outcome::success();
  }

  bool LocalOriginator::isAdvertised(const ContentHash &manifest_id) const {
    std::lock_guard lock(mutex_);
    return advertised_.contains(manifest_id);
  }

  size_t LocalOriginator::advertisedCount() const {
    std::lock_guard lock(mutex_);
    return advertised_.size();
  }

}  // namespace dds::originator
