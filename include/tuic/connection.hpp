// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include <tuic/connect.hpp>
#include <tuic/exception.hpp>
#include <tuic/export.hpp>
#include <tuic/model/connection.hpp>
#include <tuic/task.hpp>
#include <tuic/transport.hpp>

namespace tuic {

/**
 * Operations shared by both roles of a TUIC connection.
 *
 * A connection wraps one QUIC connection and the protocol model of that
 * connection. Copies are cheap and share both, so any number of
 * coroutines may send concurrently; each send opens its own channel.
 */
class TUIC_API ConnectionBase
{
public:
  // Relays a UDP payload over QUIC datagrams, one datagram per fragment.
  // Throws ExceptionSendDatagram when the peer does not accept datagrams.
  void packet_native(std::span<const std::uint8_t> payload,
                     const model::Address& addr,
                     std::uint16_t assoc_id) const;

  // Relays a UDP payload over unidirectional streams, one stream per
  // fragment of at most kQuicMaxPacketSize bytes.
  awaitable<void> packet_quic(std::span<const std::uint8_t> payload,
                              model::Address addr,
                              std::uint16_t assoc_id) const;

  // Best-effort liveness probe carried by one datagram.
  void heartbeat() const;

  std::size_t task_connect_count() const noexcept;
  std::size_t task_associate_count() const;

  // Drops fragment buffers that did not complete within `timeout`.
  void collect_garbage(std::chrono::steady_clock::duration timeout) const;

protected:
  explicit ConnectionBase(std::shared_ptr<Transport> conn);

  // Decoders keep the channel intact on failure and report it through
  // ExceptionUnmarshal.
  awaitable<model::Header> unmarshal_uni(std::shared_ptr<RecvStream>& recv) const;
  awaitable<model::Header> unmarshal_bi(BiStream& bi) const;
  model::Header unmarshal_datagram(Bytes& dg, std::size_t& pos) const;

  // Checks the declared fragment size against the datagram and builds
  // the packet task.
  Task native_packet_task(model::PacketRx pkt, Bytes dg, std::size_t pos) const;

  std::shared_ptr<Transport> conn_;
  model::Connection model_;
};

class TUIC_API ClientConnection : public ConnectionBase
{
public:
  explicit ClientConnection(std::shared_ptr<Transport> conn);

  awaitable<void> authenticate(const model::Token& token) const;

  // Opens a relay to `addr` without waiting for the server.
  awaitable<Connect> connect(model::Address addr) const;

  awaitable<void> dissociate(std::uint16_t assoc_id) const;

  awaitable<Task> accept_uni_stream(std::shared_ptr<RecvStream> recv) const;
  awaitable<Task> accept_bi_stream(BiStream bi) const;
  Task accept_datagram(Bytes dg) const;
};

class TUIC_API ServerConnection : public ConnectionBase
{
public:
  explicit ServerConnection(std::shared_ptr<Transport> conn);

  awaitable<Task> accept_uni_stream(std::shared_ptr<RecvStream> recv) const;
  awaitable<Task> accept_bi_stream(BiStream bi) const;
  Task accept_datagram(Bytes dg) const;
};

} // namespace tuic
