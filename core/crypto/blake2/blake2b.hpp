/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace ps::crypto::blake2b {

  constexpr size_t kBlake2b256HashLength = 32;

  using Blake2b256Hash = common::Blob<kBlake2b256HashLength>;

  /// Incremental BLAKE2b state (RFC 7693), unkeyed
  class Ctx {
   public:
    explicit Ctx(size_t outlen);

    void update(BytesIn in);

    /// Write digest of everything updated so far, the state is consumed
    void final(BytesOut hash);

   private:
    void compress(bool last);

    std::array<uint8_t, 128> b_{};
    std::array<uint64_t, 8> h_{};
    std::array<uint64_t, 2> t_{};
    size_t c_{};
    size_t outlen_{};
  };

  Blake2b256Hash blake2b_256(BytesIn to_hash);

}  // namespace ps::crypto::blake2b
