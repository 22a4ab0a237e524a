// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Config -- process configuration read from the environment.
//
// Environment variables:
//   SQLREQ_DEBUG_PARAM  -- "1"/"true" to include parameter values in
//                          request dumps (default off)
//   SQLREQ_LOG_LEVEL    -- spdlog level name, default "info"
//   SQLREQ_LOG_PATTERN  -- spdlog pattern

#pragma once

#include <cstdlib>
#include <string>

namespace sqlreq {

struct Config {
  bool debug_param = false;
  std::string log_level = "info";
  std::string log_pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%n] [%^%l%$] %v";
};

inline bool ParseFlag(const char* value) {
  if (value == nullptr) { return false; }
  std::string v(value);
  return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

inline Config LoadConfigFromEnv() {
  Config config;
  config.debug_param = ParseFlag(std::getenv("SQLREQ_DEBUG_PARAM"));
  if (const char* level = std::getenv("SQLREQ_LOG_LEVEL")) {
    if (level[0] != '\0') { config.log_level = level; }
  }
  if (const char* pattern = std::getenv("SQLREQ_LOG_PATTERN")) {
    if (pattern[0] != '\0') { config.log_pattern = pattern; }
  }
  return config;
}

/// Configuration of the running process, read once.
inline const Config& GlobalConfig() {
  static const Config config = LoadConfigFromEnv();
  return config;
}

}  // namespace sqlreq
