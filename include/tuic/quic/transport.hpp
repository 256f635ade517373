// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#ifdef TUIC_QUIC_ENABLED

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/any_io_executor.hpp>
#include <msquic.h>

#include <tuic/export.hpp>
#include <tuic/impl/async_queue.hpp>
#include <tuic/quic/config.hpp>
#include <tuic/transport.hpp>

namespace tuic::quic {

/**
 * MsQuic API wrapper - manages the QUIC API handle
 *
 * This is a singleton that opens MsQuic once and owns the "tuic"
 * registration every connection and listener is created in.
 */
class TUIC_API QuicApi
{
public:
  static QuicApi& instance();

  const QUIC_API_TABLE* api() const { return api_; }
  HQUIC registration() const { return registration_; }

  // Throws ExceptionConnection if MsQuic rejects the settings or credentials.
  HQUIC create_configuration(const Config& cfg);

  ~QuicApi();

private:
  QuicApi();
  QuicApi(const QuicApi&) = delete;
  QuicApi& operator=(const QuicApi&) = delete;

  const QUIC_API_TABLE* api_ = nullptr;
  HQUIC registration_ = nullptr;
};

class StreamCore;

/**
 * One MsQuic connection exposed as a tuic::Transport.
 *
 * MsQuic delivers events on its own worker threads; every event is posted
 * onto the executor given at construction, so all Transport members must
 * be used from that executor. Use a strand or a single threaded io_context.
 */
class TUIC_API QuicConnection
    : public Transport
    , public std::enable_shared_from_this<QuicConnection>
{
public:
  // Client side: completes once the handshake is done.
  static awaitable<std::shared_ptr<QuicConnection>>
  connect(boost::asio::any_io_executor ex,
          const Config& cfg,
          std::string host,
          std::uint16_t port);

  ~QuicConnection() override;

  awaitable<std::shared_ptr<SendStream>> open_uni() override;
  awaitable<BiStream> open_bi() override;
  void send_datagram(Bytes data) override;
  std::optional<std::size_t> max_datagram_size() const override;

  awaitable<std::shared_ptr<RecvStream>> accept_uni() override;
  awaitable<BiStream> accept_bi() override;
  awaitable<Bytes> read_datagram() override;

  void close(std::uint64_t error_code, std::string_view reason) noexcept override;

  boost::asio::any_io_executor get_executor() const { return ex_; }

private:
  friend class QuicListener;

  QuicConnection(boost::asio::any_io_executor ex,
                 HQUIC connection,
                 HQUIC configuration);

  // Server side: installs the event handler on an accepted connection.
  void start();

  awaitable<std::shared_ptr<StreamCore>> open_stream(QUIC_STREAM_OPEN_FLAGS flags);

  static QUIC_STATUS QUIC_API connection_callback(HQUIC connection,
                                                  void* context,
                                                  QUIC_CONNECTION_EVENT* event);
  void handle_connection_event(QUIC_CONNECTION_EVENT* event);

  // Runs `fn` on the executor if the connection is still alive.
  template <typename Fn> void dispatch(Fn&& fn);

  void fail_all(std::exception_ptr error);

  boost::asio::any_io_executor ex_;
  HQUIC connection_ = nullptr;
  // Owned only on the client side, the listener owns the server one.
  HQUIC configuration_ = nullptr;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> datagram_send_enabled_{false};
  std::atomic<std::uint16_t> max_datagram_size_{0};

  impl::AsyncQueue<bool> connected_;
  impl::AsyncQueue<std::shared_ptr<RecvStream>> incoming_uni_;
  impl::AsyncQueue<BiStream> incoming_bi_;
  impl::AsyncQueue<Bytes> incoming_datagrams_;
};

/**
 * QUIC server endpoint. Accepted connections are handed to the callback
 * on the listener's executor.
 */
class TUIC_API QuicListener
{
public:
  using AcceptCallback = std::function<void(std::shared_ptr<QuicConnection>)>;

  // `cfg` must be a server configuration.
  QuicListener(boost::asio::any_io_executor ex, Config cfg);
  ~QuicListener();

  QuicListener(const QuicListener&) = delete;
  QuicListener& operator=(const QuicListener&) = delete;

  void start(std::uint16_t port, AcceptCallback callback);
  void stop();

private:
  static QUIC_STATUS QUIC_API listener_callback(HQUIC listener,
                                                void* context,
                                                QUIC_LISTENER_EVENT* event);
  QUIC_STATUS handle_listener_event(QUIC_LISTENER_EVENT* event);

  boost::asio::any_io_executor ex_;
  Config cfg_;
  HQUIC listener_ = nullptr;
  HQUIC configuration_ = nullptr;
  AcceptCallback accept_callback_;
};

} // namespace tuic::quic

#endif // TUIC_QUIC_ENABLED
