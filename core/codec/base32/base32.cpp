/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/base32/base32.hpp"

#include <algorithm>

#include <cppcodec/base32_rfc4648.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(ps::codec::base32, Base32Error, e) {
  using ps::codec::base32::Base32Error;
  switch (e) {
    case Base32Error::kInvalidCharacter:
      return "Base32: input contains characters outside of the alphabet";
    case Base32Error::kInvalidLength:
      return "Base32: input length is not a valid unpadded length";
  }
  return "Base32: unknown error";
}

namespace ps::codec::base32 {
  using Codec = cppcodec::base32_rfc4648;

  namespace {
    /// Unpadded lengths modulo 8 that end a 5-byte group correctly
    bool validTailLength(size_t size) {
      switch (size % 8) {
        case 0:
        case 2:
        case 4:
        case 5:
        case 7:
          return true;
      }
      return false;
    }
  }  // namespace

  std::string encode(BytesIn bytes) {
    auto encoded{Codec::encode(bytes.data(), bytes.size())};
    encoded.erase(std::find(encoded.begin(), encoded.end(), '='),
                  encoded.end());
    return encoded;
  }

  std::string encodeLower(BytesIn bytes) {
    auto encoded{encode(bytes)};
    std::transform(encoded.begin(),
                   encoded.end(),
                   encoded.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return encoded;
  }

  outcome::result<Bytes> decode(std::string_view str) {
    if (!validTailLength(str.size())) {
      return Base32Error::kInvalidLength;
    }
    std::string padded{str};
    std::transform(padded.begin(),
                   padded.end(),
                   padded.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if (std::find(padded.begin(), padded.end(), '=') != padded.end()) {
      return Base32Error::kInvalidCharacter;
    }
    // Pad with '=' on the right to make the length a multiple of 8
    if (const auto tail{padded.size() % 8}; tail != 0) {
      padded.append(8 - tail, '=');
    }
    try {
      return Codec::decode(padded);
    } catch (const cppcodec::symbol_error &) {
      return Base32Error::kInvalidCharacter;
    } catch (const cppcodec::parse_error &) {
      return Base32Error::kInvalidLength;
    }
  }
}  // namespace ps::codec::base32
