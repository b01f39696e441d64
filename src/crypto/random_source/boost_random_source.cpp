/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <dds/crypto/random_source/boost_random_source.hpp>

#include <boost/random/uniform_int_distribution.hpp>

namespace dds::crypto::random {

  void BoostRandomSource::fill(BytesOut out) {
    boost::random::uniform_int_distribution<uint16_t> byte{0, 0xff};
    for (auto &b : out) {
      b = static_cast<uint8_t>(byte(device_));
    }
  }

}  // namespace dds::crypto::random
