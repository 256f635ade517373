// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <variant>

#include <tuic/export.hpp>
#include <tuic/model/connection.hpp>
#include <tuic/transport.hpp>

namespace tuic {

/**
 * One received UDP relay fragment.
 *
 * The fragment body is not touched until accept(), which reads it (stream
 * source) or slices it out of the datagram (native source) and hands it to
 * the model for reassembly. accept() consumes the packet.
 */
class TUIC_API Packet
{
public:
  // Fragment body still on a unidirectional stream.
  struct QuicSource {
    std::shared_ptr<RecvStream> recv;
  };

  // Fragment body resident in the received datagram.
  struct NativeSource {
    Bytes datagram;
    std::size_t offset;
  };

  using Source = std::variant<QuicSource, NativeSource>;

  Packet(model::PacketRx model, Source src);
  ~Packet();

  Packet(Packet&& other) noexcept;
  Packet& operator=(Packet&& other) noexcept;
  Packet(const Packet&) = delete;
  Packet& operator=(const Packet&) = delete;

  std::uint16_t assoc_id() const noexcept { return model_.assoc_id(); }
  std::uint16_t pkt_id() const noexcept { return model_.pkt_id(); }
  std::uint8_t frag_total() const noexcept { return model_.frag_total(); }
  std::uint8_t frag_id() const noexcept { return model_.frag_id(); }
  std::uint16_t size() const noexcept { return model_.size(); }
  const model::Address& addr() const noexcept { return model_.addr(); }

  // Empty while other fragments of the same packet are still missing.
  awaitable<std::optional<model::Assembled>> accept() &&;

private:
  void discard() noexcept;

  model::PacketRx model_;
  std::optional<Source> src_;
};

} // namespace tuic
