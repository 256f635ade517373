// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <variant>

#include <tuic/connect.hpp>
#include <tuic/model/header.hpp>
#include <tuic/packet.hpp>

namespace tuic {

struct AuthenticateTask {
  model::Token token;
};

struct DissociateTask {
  std::uint16_t assoc_id;
};

struct HeartbeatTask {
};

// One classified inbound command. Visit it exhaustively.
using Task = std::variant<AuthenticateTask,
                          Connect,
                          Packet,
                          DissociateTask,
                          HeartbeatTask>;

} // namespace tuic
