/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <istream>

#include <boost/filesystem/path.hpp>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "piecestore/trust/trusted_satellites.hpp"

namespace ps::piecestore {
  enum class ConfigError {
    kCannotRead = 1,
    kInvalidValue,
  };

  enum class RetainStatus {
    kEnabled,
    kDebug,
    kDisabled,
  };

  outcome::result<RetainStatus> retainStatusFromString(const std::string &str);

  std::string retainStatusToString(RetainStatus status);

  struct RetainConfig {
    RetainStatus status{RetainStatus::kEnabled};
    /** Subtracted from the creation threshold of a retain request */
    std::chrono::seconds time_buffer{0};
  };

  struct Config {
    static constexpr uint64_t kTiB{uint64_t{1} << 40};

    boost::filesystem::path storage_path;
    uint64_t allocated_space{kTiB};
    /** Largest payload of a single download response */
    size_t max_chunk_size{256 << 10};
    std::chrono::seconds order_limit_grace_period{std::chrono::hours{1}};
    /** Unsent orders kept for settlement, the first to expire is dropped */
    size_t max_unsent_orders{10000};
    RetainConfig retain;
    std::chrono::hours trash_expiry{168};
    spdlog::level::level_enum log_level{spdlog::level::info};
    std::vector<trust::SatelliteInfo> trusted_satellites;

    /**
     * Defaults overridden by "<storage>/config.cfg" when it exists
     * @param storage_path - piece storage root
     */
    static outcome::result<Config> read(
        const boost::filesystem::path &storage_path);

    /**
     * Parse config file contents
     * @param input - "key=value" lines, [retain] section for retain options
     */
    static outcome::result<Config> parse(
        std::istream &input, const boost::filesystem::path &storage_path);

    std::string join(const std::string &path) const;
    std::string configFile() const;
  };
}  // namespace ps::piecestore

OUTCOME_HPP_DECLARE_ERROR(ps::piecestore, ConfigError);
