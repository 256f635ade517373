// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

// Internal logging header - do not expose in public API

#include <memory>

#include <spdlog/spdlog.h>

namespace tuic::impl {

// Shared "tuic" logger, created on first use.
std::shared_ptr<spdlog::logger>& get_logger();

} // namespace tuic::impl

#define TUIC_LOG_TRACE(...) tuic::impl::get_logger()->trace(__VA_ARGS__)
#define TUIC_LOG_DEBUG(...) tuic::impl::get_logger()->debug(__VA_ARGS__)
#define TUIC_LOG_INFO(...) tuic::impl::get_logger()->info(__VA_ARGS__)
#define TUIC_LOG_WARN(...) tuic::impl::get_logger()->warn(__VA_ARGS__)
#define TUIC_LOG_ERROR(...) tuic::impl::get_logger()->error(__VA_ARGS__)
#define TUIC_LOG_CRITICAL(...) tuic::impl::get_logger()->critical(__VA_ARGS__)
