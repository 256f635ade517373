// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <tuic/connection.hpp>
#include <tuic/impl/overloaded.hpp>
#include <tuic/model/header.hpp>

#include "logging.hpp"

namespace tuic {

using impl::overloaded;
namespace hdr = model::header;

namespace {

[[noreturn]] void reject(std::string_view command, Channel channel)
{
  TUIC_LOG_DEBUG("rejecting command `{}` received on {}", command,
                 to_string(kind_of(channel)));
  throw ExceptionBadCommand(command, std::move(channel));
}

// The declared fragment must fit in what is left of the datagram.
void check_native_size(const hdr::Packet& pkt,
                       const Bytes& dg,
                       std::size_t pos)
{
  if (pos + pkt.size > dg.size()) {
    throw ExceptionPayloadLength(pkt.size, dg.size() - pos);
  }
}

} // namespace

//==============================================================================
// ConnectionBase - operations shared by both roles
//==============================================================================

ConnectionBase::ConnectionBase(std::shared_ptr<Transport> conn)
    : conn_(std::move(conn))
{
}

void ConnectionBase::packet_native(std::span<const std::uint8_t> payload,
                                   const model::Address& addr,
                                   std::uint16_t assoc_id) const
{
  auto max_pkt_size = conn_->max_datagram_size();
  if (!max_pkt_size) {
    throw ExceptionSendDatagram(ExceptionSendDatagram::Reason::UnsupportedByPeer);
  }

  auto pkt = model_.send_packet(assoc_id, addr, *max_pkt_size);
  auto frags = pkt.fragments(payload);

  TUIC_LOG_TRACE("packet {}:{} to {}: {} bytes in {} datagram(s)", assoc_id,
                 pkt.pkt_id(), addr, payload.size(), frags.size());

  for (const auto& frag : frags) {
    Bytes buf;
    buf.reserve(model::header_len(frag.header) + frag.data.size());
    model::marshal(frag.header, buf);
    buf.insert(buf.end(), frag.data.begin(), frag.data.end());
    conn_->send_datagram(std::move(buf));
  }
}

awaitable<void>
ConnectionBase::packet_quic(std::span<const std::uint8_t> payload,
                            model::Address addr,
                            std::uint16_t assoc_id) const
{
  auto pkt = model_.send_packet(assoc_id, addr, model::kQuicMaxPacketSize);
  auto frags = pkt.fragments(payload);

  TUIC_LOG_TRACE("packet {}:{} to {}: {} bytes in {} stream(s)", assoc_id,
                 pkt.pkt_id(), addr, payload.size(), frags.size());

  for (const auto& frag : frags) {
    auto send = co_await conn_->open_uni();

    Bytes buf;
    buf.reserve(model::header_len(frag.header) + frag.data.size());
    model::marshal(frag.header, buf);
    buf.insert(buf.end(), frag.data.begin(), frag.data.end());

    co_await write_all(*send, net::buffer(buf));
    co_await send->finish();
  }
}

void ConnectionBase::heartbeat() const
{
  conn_->send_datagram(model::marshal(model_.send_heartbeat()));
}

std::size_t ConnectionBase::task_connect_count() const noexcept
{
  return model_.task_connect_count();
}

std::size_t ConnectionBase::task_associate_count() const
{
  return model_.task_associate_count();
}

void ConnectionBase::collect_garbage(
    std::chrono::steady_clock::duration timeout) const
{
  auto dropped = model_.collect_garbage(timeout);
  if (dropped) {
    TUIC_LOG_DEBUG("collected {} incomplete packet(s)", dropped);
  }
}

awaitable<model::Header>
ConnectionBase::unmarshal_uni(std::shared_ptr<RecvStream>& recv) const
{
  try {
    co_return co_await model::async_unmarshal(*recv);
  } catch (const model::UnmarshalError& e) {
    TUIC_LOG_DEBUG("uni_stream {}: {}", recv->id(), e.what());
    throw ExceptionUnmarshal(e.what(), UniChannel{recv});
  }
}

awaitable<model::Header> ConnectionBase::unmarshal_bi(BiStream& bi) const
{
  try {
    co_return co_await model::async_unmarshal(*bi.recv);
  } catch (const model::UnmarshalError& e) {
    TUIC_LOG_DEBUG("bi_stream {}: {}", bi.recv->id(), e.what());
    throw ExceptionUnmarshal(e.what(), BiChannel{bi.send, bi.recv});
  }
}

model::Header ConnectionBase::unmarshal_datagram(Bytes& dg,
                                                 std::size_t& pos) const
{
  try {
    return model::unmarshal(dg, pos);
  } catch (const model::UnmarshalError& e) {
    TUIC_LOG_DEBUG("datagram of {} bytes: {}", dg.size(), e.what());
    throw ExceptionUnmarshal(e.what(), DatagramChannel{std::move(dg)});
  }
}

Task ConnectionBase::native_packet_task(model::PacketRx pkt,
                                        Bytes dg,
                                        std::size_t pos) const
{
  return Packet(std::move(pkt), Packet::NativeSource{std::move(dg), pos});
}

//==============================================================================
// ClientConnection
//==============================================================================

ClientConnection::ClientConnection(std::shared_ptr<Transport> conn)
    : ConnectionBase(std::move(conn))
{
}

awaitable<void>
ClientConnection::authenticate(const model::Token& token) const
{
  auto buf = model::marshal(model_.send_authenticate(token));
  auto send = co_await conn_->open_uni();
  co_await write_all(*send, net::buffer(buf));
  co_await send->finish();
}

awaitable<Connect> ClientConnection::connect(model::Address addr) const
{
  auto model = model_.send_connect(std::move(addr));
  auto bi = co_await conn_->open_bi();
  auto buf = model::marshal(model.header());
  co_await write_all(*bi.send, net::buffer(buf));
  TUIC_LOG_TRACE("connect to {} on stream {}", model.addr(),
                 bi.send->id());
  co_return Connect(std::move(model), std::move(bi.send), std::move(bi.recv));
}

awaitable<void> ClientConnection::dissociate(std::uint16_t assoc_id) const
{
  auto buf = model::marshal(model_.send_dissociate(assoc_id));
  auto send = co_await conn_->open_uni();
  co_await write_all(*send, net::buffer(buf));
  co_await send->finish();
}

awaitable<Task>
ClientConnection::accept_uni_stream(std::shared_ptr<RecvStream> recv) const
{
  auto header = co_await unmarshal_uni(recv);

  co_return std::visit(
      overloaded{
          [&](hdr::Authenticate&) -> Task {
            reject("authenticate", UniChannel{recv});
          },
          [&](hdr::Connect&) -> Task { reject("connect", UniChannel{recv}); },
          [&](hdr::Packet& pkt) -> Task {
            auto assoc_id = pkt.assoc_id;
            auto model = model_.recv_packet(std::move(pkt));
            if (!model) {
              throw ExceptionInvalidUdpSession(assoc_id);
            }
            return Packet(std::move(*model),
                          Packet::QuicSource{std::move(recv)});
          },
          [&](hdr::Dissociate&) -> Task {
            reject("dissociate", UniChannel{recv});
          },
          [&](hdr::Heartbeat&) -> Task {
            reject("heartbeat", UniChannel{recv});
          },
      },
      header);
}

awaitable<Task> ClientConnection::accept_bi_stream(BiStream bi) const
{
  auto header = co_await unmarshal_bi(bi);

  co_return std::visit(
      overloaded{
          [&](hdr::Authenticate&) -> Task {
            reject("authenticate", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Connect&) -> Task {
            reject("connect", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Packet&) -> Task {
            reject("packet", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Dissociate&) -> Task {
            reject("dissociate", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Heartbeat&) -> Task {
            reject("heartbeat", BiChannel{bi.send, bi.recv});
          },
      },
      header);
}

Task ClientConnection::accept_datagram(Bytes dg) const
{
  std::size_t pos = 0;
  auto header = unmarshal_datagram(dg, pos);

  return std::visit(
      overloaded{
          [&](hdr::Authenticate&) -> Task {
            reject("authenticate", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Connect&) -> Task {
            reject("connect", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Packet& pkt) -> Task {
            check_native_size(pkt, dg, pos);
            auto assoc_id = pkt.assoc_id;
            auto model = model_.recv_packet(std::move(pkt));
            if (!model) {
              throw ExceptionInvalidUdpSession(assoc_id);
            }
            return native_packet_task(std::move(*model), std::move(dg), pos);
          },
          [&](hdr::Dissociate&) -> Task {
            reject("dissociate", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Heartbeat&) -> Task {
            reject("heartbeat", DatagramChannel{std::move(dg)});
          },
      },
      header);
}

//==============================================================================
// ServerConnection
//==============================================================================

ServerConnection::ServerConnection(std::shared_ptr<Transport> conn)
    : ConnectionBase(std::move(conn))
{
}

awaitable<Task>
ServerConnection::accept_uni_stream(std::shared_ptr<RecvStream> recv) const
{
  auto header = co_await unmarshal_uni(recv);

  co_return std::visit(
      overloaded{
          [&](hdr::Authenticate& auth) -> Task {
            return AuthenticateTask{model_.recv_authenticate(auth)};
          },
          [&](hdr::Connect&) -> Task { reject("connect", UniChannel{recv}); },
          [&](hdr::Packet& pkt) -> Task {
            auto model = model_.recv_packet_unrestricted(std::move(pkt));
            return Packet(std::move(model),
                          Packet::QuicSource{std::move(recv)});
          },
          [&](hdr::Dissociate& dissoc) -> Task {
            return DissociateTask{model_.recv_dissociate(dissoc)};
          },
          [&](hdr::Heartbeat&) -> Task {
            reject("heartbeat", UniChannel{recv});
          },
      },
      header);
}

awaitable<Task> ServerConnection::accept_bi_stream(BiStream bi) const
{
  auto header = co_await unmarshal_bi(bi);

  co_return std::visit(
      overloaded{
          [&](hdr::Authenticate&) -> Task {
            reject("authenticate", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Connect& conn) -> Task {
            auto model = model_.recv_connect(std::move(conn));
            return Connect(std::move(model), std::move(bi.send),
                           std::move(bi.recv));
          },
          [&](hdr::Packet&) -> Task {
            reject("packet", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Dissociate&) -> Task {
            reject("dissociate", BiChannel{bi.send, bi.recv});
          },
          [&](hdr::Heartbeat&) -> Task {
            reject("heartbeat", BiChannel{bi.send, bi.recv});
          },
      },
      header);
}

Task ServerConnection::accept_datagram(Bytes dg) const
{
  std::size_t pos = 0;
  auto header = unmarshal_datagram(dg, pos);

  return std::visit(
      overloaded{
          [&](hdr::Authenticate&) -> Task {
            reject("authenticate", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Connect&) -> Task {
            reject("connect", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Packet& pkt) -> Task {
            check_native_size(pkt, dg, pos);
            auto model = model_.recv_packet_unrestricted(std::move(pkt));
            return native_packet_task(std::move(model), std::move(dg), pos);
          },
          [&](hdr::Dissociate&) -> Task {
            reject("dissociate", DatagramChannel{std::move(dg)});
          },
          [&](hdr::Heartbeat& hb) -> Task {
            model_.recv_heartbeat(hb);
            return HeartbeatTask{};
          },
      },
      header);
}

} // namespace tuic
