// Copyright (c) 2024 liudegui. MIT License.
//
// sqlreq::Logger() -- the library's spdlog logger.
//
// Design:
//   - One named logger "sqlreq", created on first use
//   - Level and pattern come from GlobalConfig()
//   - Reuses a logger registered under the same name by the application

#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "sqlreq/config.hpp"

namespace sqlreq {

inline std::shared_ptr<spdlog::logger> Logger() {
  static const std::shared_ptr<spdlog::logger> logger = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get("sqlreq");
    if (existing) { return existing; }
    auto created = spdlog::stderr_color_mt("sqlreq");
    const Config& config = GlobalConfig();
    created->set_level(spdlog::level::from_str(config.log_level));
    created->set_pattern(config.log_pattern);
    return created;
  }();
  return logger;
}

}  // namespace sqlreq
