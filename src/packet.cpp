// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <span>

#include <tuic/exception.hpp>
#include <tuic/impl/overloaded.hpp>
#include <tuic/packet.hpp>

#include "logging.hpp"

namespace tuic {

namespace {

// Fragment body is the next size() bytes of the stream.
awaitable<std::optional<model::Assembled>>
assemble_from(model::PacketRx& model, RecvStream& recv)
{
  Bytes body(model.size());
  co_await read_exact(recv, net::buffer(body));
  TUIC_LOG_TRACE("packet {}:{} fragment {}/{} read from stream {}",
                 model.assoc_id(), model.pkt_id(), model.frag_id(),
                 model.frag_total(), recv.id());
  co_return model.assemble(body);
}

awaitable<std::optional<model::Assembled>>
assemble_from(model::PacketRx& model, const Bytes& datagram, std::size_t offset)
{
  co_return model.assemble(
      std::span<const std::uint8_t>(datagram).subspan(offset, model.size()));
}

} // namespace

Packet::Packet(model::PacketRx model, Source src)
    : model_(std::move(model))
    , src_(std::move(src))
{
}

Packet::~Packet() { discard(); }

// An unaccepted stream fragment is dropped by stopping its stream.
void Packet::discard() noexcept
{
  if (src_) {
    if (auto* quic = std::get_if<QuicSource>(&*src_); quic && quic->recv) {
      quic->recv->stop(0);
    }
    src_.reset();
  }
}

Packet::Packet(Packet&& other) noexcept
    : model_(std::move(other.model_))
    , src_(std::move(other.src_))
{
  other.src_.reset();
}

Packet& Packet::operator=(Packet&& other) noexcept
{
  if (this != &other) {
    discard();
    model_ = std::move(other.model_);
    src_ = std::move(other.src_);
    other.src_.reset();
  }
  return *this;
}

awaitable<std::optional<model::Assembled>> Packet::accept() &&
{
  if (!src_) {
    throw Exception("packet already accepted");
  }
  auto src = std::move(*src_);
  src_.reset();

  auto assemble = impl::overloaded{
      [this](QuicSource& quic) { return assemble_from(model_, *quic.recv); },
      [this](NativeSource& native) {
        return assemble_from(model_, native.datagram, native.offset);
      },
  };
  co_return co_await std::visit(assemble, src);
}

} // namespace tuic
