// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <tuic/connect.hpp>
#include <tuic/connection.hpp>
#include <tuic/exception.hpp>
#include <tuic/log_level.hpp>
#include <tuic/model/address.hpp>
#include <tuic/model/connection.hpp>
#include <tuic/model/header.hpp>
#include <tuic/packet.hpp>
#include <tuic/quic/config.hpp>
#include <tuic/task.hpp>
#include <tuic/transport.hpp>

#ifdef TUIC_QUIC_ENABLED
#include <tuic/quic/transport.hpp>
#endif
