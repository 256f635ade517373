// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <tuic/export.hpp>

namespace tuic {

enum class LogLevel {
  trace = 0,
  debug = 1,
  info = 2,
  warn = 3,
  error = 4,
  critical = 5,
  off = 6
};

TUIC_API void set_log_level(LogLevel level);
TUIC_API LogLevel log_level();

} // namespace tuic
