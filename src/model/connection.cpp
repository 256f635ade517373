// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <mutex>
#include <unordered_map>

#include <fmt/format.h>

#include <tuic/model/connection.hpp>

namespace tuic::model {

namespace detail {

struct PacketBuffer {
  std::vector<std::optional<Bytes>> frags;
  std::size_t received = 0;
  std::size_t bytes = 0;
  Address addr;
  std::chrono::steady_clock::time_point created;
};

struct UdpSession {
  std::uint16_t next_pkt_id = 0;
  std::unordered_map<std::uint16_t, PacketBuffer> buffers;
};

struct State {
  std::mutex mutex;
  std::unordered_map<std::uint16_t, UdpSession> sessions;
  std::shared_ptr<std::atomic<std::size_t>> connect_count =
      std::make_shared<std::atomic<std::size_t>>(0);
};

} // namespace detail

//==============================================================================
// TaskCountGuard
//==============================================================================

TaskCountGuard::TaskCountGuard(std::shared_ptr<std::atomic<std::size_t>> count)
    : count_(std::move(count))
{
  count_->fetch_add(1, std::memory_order_relaxed);
}

TaskCountGuard::~TaskCountGuard()
{
  if (count_) {
    count_->fetch_sub(1, std::memory_order_relaxed);
  }
}

TaskCountGuard& TaskCountGuard::operator=(TaskCountGuard&& other) noexcept
{
  if (this != &other) {
    if (count_) {
      count_->fetch_sub(1, std::memory_order_relaxed);
    }
    count_ = std::move(other.count_);
  }
  return *this;
}

//==============================================================================
// PacketTx
//==============================================================================

std::vector<Fragment>
PacketTx::fragments(std::span<const std::uint8_t> payload) const
{
  header::Packet first;
  first.addr = addr_;
  const std::size_t first_header_len = header_len(first);
  const std::size_t rest_header_len = header_len(header::Packet{});

  if (max_pkt_size_ <= first_header_len) {
    throw Exception(fmt::format(
        "maximum packet size {} cannot hold a {} byte header and payload",
        max_pkt_size_, first_header_len));
  }

  // A fragment's SIZE field is 16 bits wide.
  const std::size_t first_cap =
      std::min<std::size_t>(max_pkt_size_ - first_header_len, 0xffff);
  const std::size_t rest_cap =
      std::min<std::size_t>(max_pkt_size_ - rest_header_len, 0xffff);

  std::size_t frag_total = 1;
  if (payload.size() > first_cap) {
    frag_total += (payload.size() - first_cap + rest_cap - 1) / rest_cap;
  }

  if (frag_total > kMaxFragments) {
    throw Exception(fmt::format(
        "payload of {} bytes needs {} fragments, at most {} allowed",
        payload.size(), frag_total, kMaxFragments));
  }

  std::vector<Fragment> frags;
  frags.reserve(frag_total);

  std::size_t offset = 0;
  for (std::size_t i = 0; i < frag_total; ++i) {
    const std::size_t cap = i == 0 ? first_cap : rest_cap;
    const std::size_t len = std::min(cap, payload.size() - offset);

    Fragment f;
    f.header.assoc_id = assoc_id_;
    f.header.pkt_id = pkt_id_;
    f.header.frag_total = static_cast<std::uint8_t>(frag_total);
    f.header.frag_id = static_cast<std::uint8_t>(i);
    f.header.size = static_cast<std::uint16_t>(len);
    if (i == 0) {
      f.header.addr = addr_;
    }
    f.data = payload.subspan(offset, len);
    frags.push_back(std::move(f));

    offset += len;
  }

  return frags;
}

//==============================================================================
// PacketRx
//==============================================================================

std::optional<Assembled>
PacketRx::assemble(std::span<const std::uint8_t> data) const
{
  if (data.size() != header_.size) {
    throw AssembleError(AssembleError::Reason::SizeMismatch,
                        fmt::format("fragment declares {} bytes but carries {}",
                                    header_.size, data.size()));
  }

  if (header_.frag_id >= header_.frag_total) {
    throw AssembleError(
        AssembleError::Reason::InvalidFragmentId,
        fmt::format("invalid fragment id {} with fragment total {}",
                    header_.frag_id, header_.frag_total));
  }

  if (header_.frag_total == 1) {
    return Assembled{Bytes(data.begin(), data.end()), header_.addr,
                     header_.assoc_id};
  }

  std::lock_guard lock(state_->mutex);

  auto session = state_->sessions.find(header_.assoc_id);
  if (session == state_->sessions.end()) {
    // dissociated while the fragment was in flight
    throw ExceptionInvalidUdpSession(header_.assoc_id);
  }

  auto& buffers = session->second.buffers;
  auto [it, inserted] = buffers.try_emplace(header_.pkt_id);
  auto& buf = it->second;

  if (inserted) {
    buf.frags.resize(header_.frag_total);
    buf.created = std::chrono::steady_clock::now();
  } else if (buf.frags.size() != header_.frag_total) {
    throw AssembleError(
        AssembleError::Reason::FragmentTotalMismatch,
        fmt::format("fragment total {} does not match buffered total {}",
                    header_.frag_total, buf.frags.size()));
  }

  auto& slot = buf.frags[header_.frag_id];
  if (slot) {
    throw AssembleError(AssembleError::Reason::DuplicatedFragment,
                        fmt::format("duplicated fragment {}", header_.frag_id));
  }

  slot.emplace(data.begin(), data.end());
  buf.received++;
  buf.bytes += data.size();
  if (!header_.addr.is_none()) {
    buf.addr = header_.addr;
  }

  if (buf.received < buf.frags.size()) {
    return std::nullopt;
  }

  Assembled result{Bytes{}, std::move(buf.addr), header_.assoc_id};
  result.payload.reserve(buf.bytes);
  for (auto& frag : buf.frags) {
    result.payload.insert(result.payload.end(), frag->begin(), frag->end());
  }
  buffers.erase(it);

  return result;
}

//==============================================================================
// Connection
//==============================================================================

Connection::Connection()
    : state_(std::make_shared<detail::State>())
{
}

Header Connection::send_authenticate(const Token& token) const
{
  return header::Authenticate{token};
}

Token Connection::recv_authenticate(const header::Authenticate& h) const
{
  return h.token;
}

ConnectTx Connection::send_connect(Address addr) const
{
  return ConnectTx(header::Connect{std::move(addr)},
                   TaskCountGuard(state_->connect_count));
}

ConnectRx Connection::recv_connect(header::Connect h) const
{
  return ConnectRx(std::move(h.addr), TaskCountGuard(state_->connect_count));
}

PacketTx Connection::send_packet(std::uint16_t assoc_id,
                                 Address addr,
                                 std::size_t max_pkt_size) const
{
  std::uint16_t pkt_id;
  {
    std::lock_guard lock(state_->mutex);
    auto& session = state_->sessions[assoc_id];
    pkt_id = session.next_pkt_id++;
  }
  return PacketTx(assoc_id, pkt_id, std::move(addr), max_pkt_size);
}

std::optional<PacketRx> Connection::recv_packet(header::Packet h) const
{
  {
    std::lock_guard lock(state_->mutex);
    if (state_->sessions.find(h.assoc_id) == state_->sessions.end()) {
      return std::nullopt;
    }
  }
  return PacketRx(state_, std::move(h));
}

PacketRx Connection::recv_packet_unrestricted(header::Packet h) const
{
  {
    std::lock_guard lock(state_->mutex);
    state_->sessions.try_emplace(h.assoc_id);
  }
  return PacketRx(state_, std::move(h));
}

Header Connection::send_dissociate(std::uint16_t assoc_id) const
{
  std::lock_guard lock(state_->mutex);
  state_->sessions.erase(assoc_id);
  return header::Dissociate{assoc_id};
}

std::uint16_t Connection::recv_dissociate(const header::Dissociate& h) const
{
  std::lock_guard lock(state_->mutex);
  state_->sessions.erase(h.assoc_id);
  return h.assoc_id;
}

Header Connection::send_heartbeat() const { return header::Heartbeat{}; }

void Connection::recv_heartbeat(const header::Heartbeat&) const {}

std::size_t Connection::task_connect_count() const noexcept
{
  return state_->connect_count->load(std::memory_order_relaxed);
}

std::size_t Connection::task_associate_count() const
{
  std::lock_guard lock(state_->mutex);
  return state_->sessions.size();
}

std::size_t
Connection::collect_garbage(std::chrono::steady_clock::duration timeout) const
{
  const auto now = std::chrono::steady_clock::now();
  std::size_t dropped = 0;

  std::lock_guard lock(state_->mutex);
  for (auto& [assoc_id, session] : state_->sessions) {
    dropped += std::erase_if(session.buffers, [&](const auto& entry) {
      return now - entry.second.created >= timeout;
    });
  }
  return dropped;
}

} // namespace tuic::model
