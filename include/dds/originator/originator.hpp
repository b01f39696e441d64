/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/content/content_hash.hpp>

namespace dds::originator {

  using content::ContentHash;

  enum class OriginatorError {
    ADVERTISEMENT_FAILED = 1,
  };

  /**
   * Seeds freshly published content before any peer asks for it. Failures
   * are reported but publishing does not depend on them
   */
  class Originator {
   public:
    virtual ~Originator() = default;

    virtual outcome::result<void> advertiseContent(
        const ContentHash &manifest_id) = 0;
  };

}  // namespace dds::originator

OUTCOME_HPP_DECLARE_ERROR(dds::originator, OriginatorError)
