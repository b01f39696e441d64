/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <dds/outcome/outcome.hpp>

namespace dds::crypto {
  enum class HashError {
    CONTEXT_UNAVAILABLE = 1,  ///< OpenSSL could not set up a digest context
    UPDATE_FAILED,
    FINALIZE_FAILED,
    ALREADY_FINISHED,  ///< hasher was used after its digest was taken
  };
}  // namespace dds::crypto

OUTCOME_HPP_DECLARE_ERROR(dds::crypto, HashError);
