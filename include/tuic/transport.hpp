// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>

#include <tuic/export.hpp>

namespace tuic {

namespace net = boost::asio;

template <typename T>
using awaitable = net::awaitable<T>;

using Bytes = std::vector<std::uint8_t>;

/**
 * Receive half of a QUIC stream.
 *
 * Implementations complete every operation on the executor the owning
 * transport was created with. read_some() returns 0 once the peer has
 * finished the stream and all data has been consumed; a reset by the peer
 * or a lost connection is reported by throwing.
 */
class RecvStream
{
public:
  virtual ~RecvStream() = default;

  virtual awaitable<std::size_t> read_some(net::mutable_buffer buf) = 0;

  // Tell the peer we are not interested in more data (STOP_SENDING).
  virtual void stop(std::uint64_t error_code) noexcept = 0;

  virtual std::uint64_t id() const noexcept = 0;
};

/**
 * Send half of a QUIC stream.
 */
class SendStream
{
public:
  virtual ~SendStream() = default;

  // Completes once the whole buffer has been handed to the transport.
  virtual awaitable<void> write(net::const_buffer buf) = 0;

  // Graceful FIN, completes when the transport has flushed the stream.
  virtual awaitable<void> finish() = 0;

  // Graceful FIN without waiting for it, safe to call from destructors.
  virtual void shutdown() noexcept = 0;

  virtual void reset(std::uint64_t error_code) noexcept = 0;

  virtual std::uint64_t id() const noexcept = 0;
};

struct BiStream {
  std::shared_ptr<SendStream> send;
  std::shared_ptr<RecvStream> recv;
};

/**
 * One QUIC connection as seen by the protocol adapter.
 *
 * The open_* and send_datagram members are used by the adapter itself.
 * The accept_* and read_datagram members exist for the caller's accept
 * loop, which hands every inbound channel to the adapter for dispatch.
 */
class TUIC_API Transport
{
public:
  virtual ~Transport() = default;

  virtual awaitable<std::shared_ptr<SendStream>> open_uni() = 0;
  virtual awaitable<BiStream> open_bi() = 0;

  // Throws ExceptionSendDatagram when the datagram cannot be queued.
  virtual void send_datagram(Bytes data) = 0;

  // Empty when the peer does not accept datagrams.
  virtual std::optional<std::size_t> max_datagram_size() const = 0;

  virtual awaitable<std::shared_ptr<RecvStream>> accept_uni() = 0;
  virtual awaitable<BiStream> accept_bi() = 0;
  virtual awaitable<Bytes> read_datagram() = 0;

  virtual void close(std::uint64_t error_code,
                     std::string_view reason) noexcept = 0;
};

// Reads exactly buf.size() bytes, throws ExceptionIo on a premature end.
TUIC_API awaitable<void> read_exact(RecvStream& stream,
                                    net::mutable_buffer buf);

TUIC_API awaitable<void> write_all(SendStream& stream,
                                   net::const_buffer buf);

} // namespace tuic
