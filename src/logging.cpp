// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include "logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <tuic/log_level.hpp>

namespace tuic::impl {

std::shared_ptr<spdlog::logger>& get_logger()
{
  static std::shared_ptr<spdlog::logger> logger = [] {
    auto l = spdlog::get("tuic");
    if (!l) {
      l = spdlog::stderr_color_mt("tuic");
      l->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      l->set_level(spdlog::level::info);
    }
    return l;
  }();
  return logger;
}

} // namespace tuic::impl

namespace tuic {

// LogLevel mirrors spdlog::level::level_enum value for value
TUIC_API void set_log_level(LogLevel level)
{
  impl::get_logger()->set_level(
      static_cast<spdlog::level::level_enum>(static_cast<int>(level)));
}

TUIC_API LogLevel log_level()
{
  return static_cast<LogLevel>(static_cast<int>(impl::get_logger()->level()));
}

} // namespace tuic
