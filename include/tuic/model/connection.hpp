// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <tuic/exception.hpp>
#include <tuic/export.hpp>
#include <tuic/model/address.hpp>
#include <tuic/model/header.hpp>

namespace tuic::model {

namespace detail {
struct State;
}

class TUIC_API AssembleError : public Error
{
public:
  enum class Reason {
    InvalidFragmentId,
    DuplicatedFragment,
    FragmentTotalMismatch,
    SizeMismatch,
  };

  AssembleError(Reason reason, std::string const& msg)
      : Error(ErrorKind::Assemble, msg)
      , reason_(reason)
  {
  }

  Reason reason() const noexcept { return reason_; }

private:
  Reason reason_;
};

// Keeps one outstanding connect task counted while alive.
class TUIC_API TaskCountGuard
{
  std::shared_ptr<std::atomic<std::size_t>> count_;

public:
  explicit TaskCountGuard(std::shared_ptr<std::atomic<std::size_t>> count);
  ~TaskCountGuard();

  TaskCountGuard(TaskCountGuard&& other) noexcept = default;
  TaskCountGuard& operator=(TaskCountGuard&& other) noexcept;
  TaskCountGuard(const TaskCountGuard&) = delete;
  TaskCountGuard& operator=(const TaskCountGuard&) = delete;
};

class ConnectTx
{
  header::Connect header_;
  TaskCountGuard guard_;

public:
  ConnectTx(header::Connect header, TaskCountGuard guard)
      : header_(std::move(header))
      , guard_(std::move(guard))
  {
  }

  Header header() const { return header_; }
  const Address& addr() const noexcept { return header_.addr; }
};

class ConnectRx
{
  Address addr_;
  TaskCountGuard guard_;

public:
  ConnectRx(Address addr, TaskCountGuard guard)
      : addr_(std::move(addr))
      , guard_(std::move(guard))
  {
  }

  const Address& addr() const noexcept { return addr_; }
};

struct Fragment {
  header::Packet header;
  std::span<const std::uint8_t> data;
};

/**
 * Outgoing packet of one association.
 *
 * fragments() splits a payload so that every header plus fragment fits in
 * max_pkt_size bytes. Only the first fragment carries the target address,
 * the others carry Address::Type::None.
 */
class TUIC_API PacketTx
{
  std::uint16_t assoc_id_;
  std::uint16_t pkt_id_;
  Address addr_;
  std::size_t max_pkt_size_;

public:
  PacketTx(std::uint16_t assoc_id,
           std::uint16_t pkt_id,
           Address addr,
           std::size_t max_pkt_size)
      : assoc_id_(assoc_id)
      , pkt_id_(pkt_id)
      , addr_(std::move(addr))
      , max_pkt_size_(max_pkt_size)
  {
  }

  std::uint16_t assoc_id() const noexcept { return assoc_id_; }
  std::uint16_t pkt_id() const noexcept { return pkt_id_; }

  // Throws Exception when max_pkt_size cannot hold a header and one byte
  // or the payload needs more than kMaxFragments fragments.
  std::vector<Fragment> fragments(std::span<const std::uint8_t> payload) const;
};

struct Assembled {
  Bytes payload;
  Address addr;
  std::uint16_t assoc_id;
};

/**
 * One received fragment registered with the model, waiting for its bytes.
 */
class TUIC_API PacketRx
{
  std::shared_ptr<detail::State> state_;
  header::Packet header_;

public:
  PacketRx(std::shared_ptr<detail::State> state, header::Packet header)
      : state_(std::move(state))
      , header_(std::move(header))
  {
  }

  std::uint16_t assoc_id() const noexcept { return header_.assoc_id; }
  std::uint16_t pkt_id() const noexcept { return header_.pkt_id; }
  std::uint8_t frag_total() const noexcept { return header_.frag_total; }
  std::uint8_t frag_id() const noexcept { return header_.frag_id; }
  std::uint16_t size() const noexcept { return header_.size; }
  const Address& addr() const noexcept { return header_.addr; }

  // Returns the whole datagram once its last missing fragment arrives.
  std::optional<Assembled> assemble(std::span<const std::uint8_t> data) const;
};

/**
 * Protocol state shared by every channel of one QUIC connection.
 *
 * Copies are cheap and refer to the same state; all members are safe to
 * call concurrently.
 */
class TUIC_API Connection
{
  std::shared_ptr<detail::State> state_;

public:
  Connection();

  Header send_authenticate(const Token& token) const;
  Token recv_authenticate(const header::Authenticate& h) const;

  ConnectTx send_connect(Address addr) const;
  ConnectRx recv_connect(header::Connect h) const;

  // Creates the association on first use.
  PacketTx send_packet(std::uint16_t assoc_id,
                       Address addr,
                       std::size_t max_pkt_size) const;

  // Empty when the association is unknown.
  std::optional<PacketRx> recv_packet(header::Packet h) const;

  // Creates the association when it is unknown.
  PacketRx recv_packet_unrestricted(header::Packet h) const;

  Header send_dissociate(std::uint16_t assoc_id) const;
  std::uint16_t recv_dissociate(const header::Dissociate& h) const;

  Header send_heartbeat() const;
  void recv_heartbeat(const header::Heartbeat& h) const;

  std::size_t task_connect_count() const noexcept;
  std::size_t task_associate_count() const;

  // Drops reassembly buffers at least `timeout` old, returns how many.
  std::size_t collect_garbage(std::chrono::steady_clock::duration timeout) const;
};

} // namespace tuic::model
