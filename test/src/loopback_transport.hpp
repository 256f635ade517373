#pragma once

#include <algorithm>
#include <cstring>
#include <memory>
#include <optional>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <fmt/format.h>

#include <tuic/exception.hpp>
#include <tuic/impl/async_queue.hpp>
#include <tuic/transport.hpp>

// In-memory QUIC stand-in: a pair of transports wired back to back on one
// io_context. Streams are pipes of byte chunks, datagrams are delivered
// whole and in order.
namespace tuic::test {

struct Pipe {
  explicit Pipe(net::any_io_executor ex, std::uint64_t stream_id)
      : chunks(ex)
      , id(stream_id)
  {
  }

  impl::AsyncQueue<Bytes> chunks;
  std::uint64_t id;
  std::optional<std::uint64_t> stop_code;
  std::optional<std::uint64_t> reset_code;
  bool finished = false;
};

class LoopRecvStream final : public RecvStream
{
public:
  explicit LoopRecvStream(std::shared_ptr<Pipe> pipe)
      : pipe_(std::move(pipe))
  {
  }

  awaitable<std::size_t> read_some(net::mutable_buffer buf) override
  {
    if (buf.size() == 0) {
      co_return 0;
    }
    while (offset_ == chunk_.size()) {
      auto next = co_await pipe_->chunks.pop();
      if (!next) {
        co_return 0;
      }
      chunk_ = std::move(*next);
      offset_ = 0;
    }
    auto n = std::min(buf.size(), chunk_.size() - offset_);
    std::memcpy(buf.data(), chunk_.data() + offset_, n);
    offset_ += n;
    co_return n;
  }

  void stop(std::uint64_t error_code) noexcept override
  {
    if (!pipe_->stop_code) {
      pipe_->stop_code = error_code;
    }
  }

  std::uint64_t id() const noexcept override { return pipe_->id; }

  const Pipe& pipe() const noexcept { return *pipe_; }

private:
  std::shared_ptr<Pipe> pipe_;
  Bytes chunk_;
  std::size_t offset_ = 0;
};

class LoopSendStream final : public SendStream
{
public:
  explicit LoopSendStream(std::shared_ptr<Pipe> pipe)
      : pipe_(std::move(pipe))
  {
  }

  awaitable<void> write(net::const_buffer buf) override
  {
    if (pipe_->stop_code) {
      throw ExceptionIo(fmt::format("stream {} stopped by peer", pipe_->id));
    }
    if (pipe_->finished) {
      throw ExceptionIo(fmt::format("stream {} already finished", pipe_->id));
    }
    auto p = static_cast<const std::uint8_t*>(buf.data());
    pipe_->chunks.push(Bytes(p, p + buf.size()));
    co_return;
  }

  awaitable<void> finish() override
  {
    shutdown();
    co_return;
  }

  void shutdown() noexcept override
  {
    pipe_->finished = true;
    pipe_->chunks.close();
  }

  void reset(std::uint64_t error_code) noexcept override
  {
    pipe_->reset_code = error_code;
    pipe_->chunks.close(std::make_exception_ptr(ExceptionIo(
        fmt::format("stream {} reset, code {}", pipe_->id, error_code))));
  }

  std::uint64_t id() const noexcept override { return pipe_->id; }

  const Pipe& pipe() const noexcept { return *pipe_; }

private:
  std::shared_ptr<Pipe> pipe_;
};

class LoopbackTransport final : public Transport
{
public:
  LoopbackTransport(net::any_io_executor ex,
                    std::optional<std::size_t> max_datagram_size)
      : ex_(ex)
      , max_datagram_size_(max_datagram_size)
      , uni_(ex)
      , bi_(ex)
      , datagrams_(ex)
  {
  }

  static std::pair<std::shared_ptr<LoopbackTransport>,
                   std::shared_ptr<LoopbackTransport>>
  make_pair(net::any_io_executor ex,
            std::optional<std::size_t> max_datagram_size = 1200)
  {
    auto a = std::make_shared<LoopbackTransport>(ex, max_datagram_size);
    auto b = std::make_shared<LoopbackTransport>(ex, max_datagram_size);
    a->peer_ = b;
    b->peer_ = a;
    return {a, b};
  }

  awaitable<std::shared_ptr<SendStream>> open_uni() override
  {
    auto pipe = std::make_shared<Pipe>(ex_, next_id());
    peer()->uni_.push(std::make_shared<LoopRecvStream>(pipe));
    co_return std::make_shared<LoopSendStream>(pipe);
  }

  awaitable<BiStream> open_bi() override
  {
    auto id = next_id();
    auto out = std::make_shared<Pipe>(ex_, id);
    auto in = std::make_shared<Pipe>(ex_, id);
    peer()->bi_.push(BiStream{std::make_shared<LoopSendStream>(in),
                              std::make_shared<LoopRecvStream>(out)});
    co_return BiStream{std::make_shared<LoopSendStream>(out),
                       std::make_shared<LoopRecvStream>(in)};
  }

  void send_datagram(Bytes data) override
  {
    using Reason = ExceptionSendDatagram::Reason;
    if (closed_) {
      throw ExceptionSendDatagram(Reason::ConnectionLost);
    }
    if (!max_datagram_size_) {
      throw ExceptionSendDatagram(Reason::UnsupportedByPeer);
    }
    if (data.size() > *max_datagram_size_) {
      throw ExceptionSendDatagram(Reason::TooLarge);
    }
    ++datagrams_sent;
    peer()->datagrams_.push(std::move(data));
  }

  std::optional<std::size_t> max_datagram_size() const override
  {
    return max_datagram_size_;
  }

  awaitable<std::shared_ptr<RecvStream>> accept_uni() override
  {
    auto s = co_await uni_.pop();
    if (!s) {
      throw ExceptionConnection("loopback closed");
    }
    co_return std::move(*s);
  }

  awaitable<BiStream> accept_bi() override
  {
    auto s = co_await bi_.pop();
    if (!s) {
      throw ExceptionConnection("loopback closed");
    }
    co_return std::move(*s);
  }

  awaitable<Bytes> read_datagram() override
  {
    auto dg = co_await datagrams_.pop();
    if (!dg) {
      throw ExceptionConnection("loopback closed");
    }
    co_return std::move(*dg);
  }

  void close(std::uint64_t, std::string_view) noexcept override
  {
    closed_ = true;
    uni_.close();
    bi_.close();
    datagrams_.close();
  }

  std::size_t datagrams_sent = 0;

private:
  std::shared_ptr<LoopbackTransport> peer()
  {
    auto p = peer_.lock();
    if (!p) {
      throw ExceptionConnection("loopback peer is gone");
    }
    return p;
  }

  std::uint64_t next_id() { return id_ += 4; }

  net::any_io_executor ex_;
  std::optional<std::size_t> max_datagram_size_;
  std::weak_ptr<LoopbackTransport> peer_;
  impl::AsyncQueue<std::shared_ptr<RecvStream>> uni_;
  impl::AsyncQueue<BiStream> bi_;
  impl::AsyncQueue<Bytes> datagrams_;
  std::uint64_t id_ = 0;
  bool closed_ = false;
};

// Runs one coroutine to completion on `ioc` and returns its result.
template <typename T>
T run(net::io_context& ioc, net::awaitable<T> aw)
{
  auto fut = net::co_spawn(ioc, std::move(aw), net::use_future);
  ioc.restart();
  ioc.run();
  return fut.get();
}

} // namespace tuic::test
