/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"

namespace ps::common::span {
  template <typename To, typename From>
  constexpr auto cast(From *ptr) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<To *>(ptr);
  }

  template <typename To, typename From>
  constexpr auto cast(gsl::span<From> span) {
    static_assert(sizeof(To) == 1);
    return gsl::make_span(cast<To>(span.data()), span.size_bytes());
  }

  constexpr auto cbytes(gsl::span<const char> span) {
    return cast<const uint8_t>(span);
  }

  constexpr auto cstring(BytesIn span) {
    return cast<const char>(span);
  }

  constexpr auto bytestr(BytesIn span) {
    return std::string_view(cstring(span).data(), span.size());
  }

  /// Protobuf keeps `bytes` fields in std::string
  inline BytesIn cbytes(const std::string &str) {
    return cbytes(gsl::make_span(str.data(), str.size()));
  }

  inline std::string toString(BytesIn span) {
    return std::string{bytestr(span)};
  }
}  // namespace ps::common::span
