// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#ifdef _MSC_VER
#ifdef TUIC_EXPORTS
#define TUIC_API __declspec(dllexport)
#else
#define TUIC_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) || defined(__clang__)
#define TUIC_API __attribute__((visibility("default")))
#else
#define TUIC_API
#endif
#endif
