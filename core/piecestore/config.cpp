/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "piecestore/config.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <fstream>

namespace ps::piecestore {
  namespace po = boost::program_options;

  outcome::result<RetainStatus> retainStatusFromString(const std::string &str) {
    if (str == "enabled") {
      return RetainStatus::kEnabled;
    }
    if (str == "debug") {
      return RetainStatus::kDebug;
    }
    if (str == "disabled") {
      return RetainStatus::kDisabled;
    }
    return ConfigError::kInvalidValue;
  }

  std::string retainStatusToString(RetainStatus status) {
    switch (status) {
      case RetainStatus::kEnabled:
        return "enabled";
      case RetainStatus::kDebug:
        return "debug";
      case RetainStatus::kDisabled:
        return "disabled";
    }
    return "unknown";
  }

  outcome::result<Config> Config::read(
      const boost::filesystem::path &storage_path) {
    Config config;
    config.storage_path = storage_path;
    std::ifstream config_file{config.configFile()};
    if (!config_file.good()) {
      if (boost::filesystem::exists(config.configFile())) {
        return ConfigError::kCannotRead;
      }
      return config;
    }
    return parse(config_file, storage_path);
  }

  outcome::result<Config> Config::parse(
      std::istream &input, const boost::filesystem::path &storage_path) {
    auto log{common::createLogger("config")};
    Config config;
    config.storage_path = storage_path;
    struct {
      char log_level{};
      int64_t grace_period{};
      int64_t trash_expiry{};
      std::string retain_status;
      int64_t retain_time_buffer{};
      std::vector<std::string> satellites;
    } raw;

    po::options_description desc("Piece store options");
    auto option{desc.add_options()};
    option("allocated-space",
           po::value(&config.allocated_space)
               ->default_value(config.allocated_space),
           "bytes available for pieces");
    option("max-chunk-size",
           po::value(&config.max_chunk_size)
               ->default_value(config.max_chunk_size),
           "largest download response payload");
    option("max-unsent-orders",
           po::value(&config.max_unsent_orders)
               ->default_value(config.max_unsent_orders),
           "unsent orders kept for settlement");
    option("order-limit-grace-period",
           po::value(&raw.grace_period)
               ->default_value(config.order_limit_grace_period.count()),
           "accepted order limit age (seconds)");
    option("trash-expiry",
           po::value(&raw.trash_expiry)
               ->default_value(config.trash_expiry.count()),
           "trash retention (hours)");
    option("log",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("trusted-satellite",
           po::value(&raw.satellites)->composing(),
           "<public key hex>@<address>");

    po::options_description retain_desc("Retain options");
    auto retain_option{retain_desc.add_options()};
    retain_option("retain.status",
                  po::value(&raw.retain_status)->default_value("enabled"),
                  "enabled, debug or disabled");
    retain_option("retain.time-buffer",
                  po::value(&raw.retain_time_buffer)->default_value(0),
                  "subtracted from retain threshold (seconds)");
    desc.add(retain_desc);

    try {
      po::variables_map vm;
      po::store(po::parse_config_file(input, desc), vm);
      po::notify(vm);
    } catch (const po::error &e) {
      log->error("invalid config: {}", e.what());
      return ConfigError::kInvalidValue;
    }

    if (raw.grace_period < 0 || raw.trash_expiry < 0
        || raw.retain_time_buffer < 0 || config.max_chunk_size == 0
        || config.max_unsent_orders == 0) {
      return ConfigError::kInvalidValue;
    }
    config.order_limit_grace_period = std::chrono::seconds{raw.grace_period};
    config.trash_expiry = std::chrono::hours{raw.trash_expiry};
    config.retain.time_buffer = std::chrono::seconds{raw.retain_time_buffer};
    OUTCOME_TRYA(config.retain.status,
                 retainStatusFromString(raw.retain_status));
    config.log_level = common::logLevelFromChar(raw.log_level);
    for (const auto &url : raw.satellites) {
      OUTCOME_TRY(satellite, trust::parseSatelliteUrl(url));
      config.trusted_satellites.push_back(std::move(satellite));
    }
    return config;
  }

  std::string Config::join(const std::string &path) const {
    return (storage_path / path).string();
  }

  std::string Config::configFile() const {
    return join("config.cfg");
  }
}  // namespace ps::piecestore

OUTCOME_CPP_DEFINE_CATEGORY(ps::piecestore, ConfigError, e) {
  using ps::piecestore::ConfigError;
  switch (e) {
    case ConfigError::kCannotRead:
      return "ConfigError: cannot read config file";
    case ConfigError::kInvalidValue:
      return "ConfigError: invalid config value";
  }
  return "ConfigError: unknown error";
}
