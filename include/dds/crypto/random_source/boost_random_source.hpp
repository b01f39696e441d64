/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/nondet_random.hpp>

#include <dds/crypto/random_source.hpp>

namespace dds::crypto::random {

  /// Reads the system entropy device through Boost.Random
  class BoostRandomSource : public RandomSource {
   public:
    ~BoostRandomSource() override = default;

    void fill(BytesOut out) override;

   private:
    boost::random_device device_;
  };

}  // namespace dds::crypto::random
