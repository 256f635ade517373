// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <memory>
#include <variant>

#include <tuic/export.hpp>
#include <tuic/model/connection.hpp>
#include <tuic/transport.hpp>

namespace tuic {

/**
 * Relayed TCP-style session over one bidirectional stream.
 *
 * The session owns both stream halves. close() finishes the write half
 * only; reads keep working until the peer finishes its half. Destroying
 * an open session finishes the write half and stops the read half.
 */
class TUIC_API Connect
{
  std::variant<model::ConnectTx, model::ConnectRx> model_;
  std::shared_ptr<SendStream> send_;
  std::shared_ptr<RecvStream> recv_;
  bool write_closed_ = false;

public:
  Connect(std::variant<model::ConnectTx, model::ConnectRx> model,
          std::shared_ptr<SendStream> send,
          std::shared_ptr<RecvStream> recv);
  ~Connect();

  Connect(Connect&& other) noexcept;
  Connect& operator=(Connect&& other) noexcept;
  Connect(const Connect&) = delete;
  Connect& operator=(const Connect&) = delete;

  const model::Address& addr() const noexcept;

  // Returns 0 once the peer finished its half.
  awaitable<std::size_t> read_some(net::mutable_buffer buf);
  awaitable<void> read_exact(net::mutable_buffer buf);

  awaitable<void> write(net::const_buffer buf);
  awaitable<void> close();

private:
  void release() noexcept;
};

} // namespace tuic
