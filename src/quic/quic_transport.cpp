// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <tuic/quic/transport.hpp>

#ifdef TUIC_QUIC_ENABLED

#include <algorithm>
#include <cstring>

#include <boost/asio/post.hpp>
#include <fmt/format.h>

#include <tuic/exception.hpp>

#include "../logging.hpp"

namespace tuic::quic {

namespace {

// Heap copy of an outgoing buffer, released when MsQuic is done with it.
struct SendRequest {
  QUIC_BUFFER buf;
  Bytes data;

  explicit SendRequest(Bytes bytes)
      : data(std::move(bytes))
  {
    buf.Length = static_cast<std::uint32_t>(data.size());
    buf.Buffer = data.data();
  }
};

} // namespace

//==============================================================================
// QuicApi - Singleton for MsQuic initialization
//==============================================================================

QuicApi& QuicApi::instance()
{
  static QuicApi instance;
  return instance;
}

QuicApi::QuicApi()
{
  QUIC_STATUS status = MsQuicOpen2(&api_);
  if (QUIC_FAILED(status)) {
    throw ExceptionConnection(fmt::format("MsQuicOpen2 failed: {}", status));
  }

  QUIC_REGISTRATION_CONFIG reg_config = {"tuic",
                                         QUIC_EXECUTION_PROFILE_LOW_LATENCY};

  status = api_->RegistrationOpen(&reg_config, &registration_);
  if (QUIC_FAILED(status)) {
    MsQuicClose(api_);
    throw ExceptionConnection(
        fmt::format("RegistrationOpen failed: {}", status));
  }

  TUIC_LOG_INFO("[QUIC] MsQuic initialized");
}

QuicApi::~QuicApi()
{
  if (registration_) {
    api_->RegistrationClose(registration_);
  }
  if (api_) {
    MsQuicClose(api_);
  }
}

HQUIC QuicApi::create_configuration(const Config& cfg)
{
  QUIC_BUFFER alpn_buf = {static_cast<std::uint32_t>(cfg.alpn.size()),
                          (std::uint8_t*)cfg.alpn.data()};

  QUIC_SETTINGS settings = {};
  settings.IdleTimeoutMs = static_cast<std::uint64_t>(cfg.idle_timeout.count());
  settings.IsSet.IdleTimeoutMs = TRUE;
  settings.PeerBidiStreamCount = cfg.peer_bidi_stream_count;
  settings.IsSet.PeerBidiStreamCount = TRUE;
  settings.PeerUnidiStreamCount = cfg.peer_unidi_stream_count;
  settings.IsSet.PeerUnidiStreamCount = TRUE;
  settings.DatagramReceiveEnabled = cfg.datagram_receive_enabled;
  settings.IsSet.DatagramReceiveEnabled = TRUE;

  HQUIC configuration = nullptr;
  QUIC_STATUS status =
      api_->ConfigurationOpen(registration_, &alpn_buf, 1, &settings,
                              sizeof(settings), nullptr, &configuration);
  if (QUIC_FAILED(status)) {
    throw ExceptionConnection(
        fmt::format("ConfigurationOpen failed: {}", status));
  }

  QUIC_CREDENTIAL_CONFIG cred_config = {};
  QUIC_CERTIFICATE_FILE cert = {};

  if (cfg.role == Role::Server) {
    cert.CertificateFile = cfg.cert_file.c_str();
    cert.PrivateKeyFile = cfg.key_file.c_str();
    cred_config.Type = QUIC_CREDENTIAL_TYPE_CERTIFICATE_FILE;
    cred_config.CertificateFile = &cert;
  } else {
    cred_config.Type = QUIC_CREDENTIAL_TYPE_NONE;
    cred_config.Flags = QUIC_CREDENTIAL_FLAG_CLIENT;
    if (cfg.disable_certificate_validation) {
      cred_config.Flags |= QUIC_CREDENTIAL_FLAG_NO_CERTIFICATE_VALIDATION;
    }
  }

  status = api_->ConfigurationLoadCredential(configuration, &cred_config);
  if (QUIC_FAILED(status)) {
    api_->ConfigurationClose(configuration);
    throw ExceptionConnection(
        fmt::format("ConfigurationLoadCredential failed: {}", status));
  }

  return configuration;
}

//==============================================================================
// StreamCore - one MsQuic stream shared by its send and receive halves
//==============================================================================

class StreamCore : public std::enable_shared_from_this<StreamCore>
{
public:
  explicit StreamCore(boost::asio::any_io_executor ex)
      : ex_(ex)
      , incoming(ex)
      , started(ex)
      , send_done(ex)
      , send_shutdown(ex)
  {
  }

  ~StreamCore()
  {
    if (stream_) {
      QuicApi::instance().api()->StreamClose(stream_);
    }
  }

  // Keeps the core alive until MsQuic reports SHUTDOWN_COMPLETE.
  void hold() { self_ = shared_from_this(); }
  void release() { self_.reset(); }

  HQUIC& handle() noexcept { return stream_; }
  std::uint64_t id() const noexcept { return id_; }

  void read_id()
  {
    std::uint32_t len = sizeof(id_);
    QuicApi::instance().api()->GetParam(stream_, QUIC_PARAM_STREAM_ID, &len,
                                        &id_);
  }

  awaitable<void> send(net::const_buffer buf)
  {
    auto* req = new SendRequest(
        Bytes(static_cast<const std::uint8_t*>(buf.data()),
              static_cast<const std::uint8_t*>(buf.data()) + buf.size()));

    QUIC_STATUS status = QuicApi::instance().api()->StreamSend(
        stream_, &req->buf, 1, QUIC_SEND_FLAG_NONE, req);
    if (QUIC_FAILED(status)) {
      delete req;
      throw ExceptionIo(
          fmt::format("stream {}: StreamSend failed: {}", id_, status));
    }

    auto ok = co_await send_done.pop();
    if (!ok || !*ok) {
      throw ExceptionIo(fmt::format("stream {}: send canceled", id_));
    }
  }

  void shutdown(QUIC_STREAM_SHUTDOWN_FLAGS flags, std::uint64_t code) noexcept
  {
    if (complete_) {
      return;
    }
    QuicApi::instance().api()->StreamShutdown(stream_, flags, code);
  }

  static QUIC_STATUS QUIC_API callback(HQUIC, void* context,
                                       QUIC_STREAM_EVENT* event)
  {
    static_cast<StreamCore*>(context)->handle_event(event);
    return QUIC_STATUS_SUCCESS;
  }

  impl::AsyncQueue<Bytes> incoming;
  impl::AsyncQueue<bool> started;
  impl::AsyncQueue<bool> send_done;
  impl::AsyncQueue<bool> send_shutdown;

private:
  template <typename Fn> void post(Fn&& fn)
  {
    boost::asio::post(ex_, [self = shared_from_this(),
                            fn = std::forward<Fn>(fn)]() mutable { fn(*self); });
  }

  void handle_event(QUIC_STREAM_EVENT* event)
  {
    switch (event->Type) {
    case QUIC_STREAM_EVENT_START_COMPLETE: {
      bool ok = QUIC_SUCCEEDED(event->START_COMPLETE.Status);
      id_ = event->START_COMPLETE.ID;
      post([ok](StreamCore& self) { self.started.push(ok); });
      break;
    }

    case QUIC_STREAM_EVENT_RECEIVE: {
      if (event->RECEIVE.TotalBufferLength == 0) {
        break;
      }
      Bytes data;
      data.reserve(event->RECEIVE.TotalBufferLength);
      for (std::uint32_t i = 0; i < event->RECEIVE.BufferCount; ++i) {
        auto& buf = event->RECEIVE.Buffers[i];
        data.insert(data.end(), buf.Buffer, buf.Buffer + buf.Length);
      }
      post([data = std::move(data)](StreamCore& self) mutable {
        self.incoming.push(std::move(data));
      });
      break;
    }

    case QUIC_STREAM_EVENT_SEND_COMPLETE: {
      auto* req = static_cast<SendRequest*>(event->SEND_COMPLETE.ClientContext);
      delete req;
      bool ok = !event->SEND_COMPLETE.Canceled;
      post([ok](StreamCore& self) { self.send_done.push(ok); });
      break;
    }

    case QUIC_STREAM_EVENT_PEER_SEND_SHUTDOWN:
      post([](StreamCore& self) { self.incoming.close(); });
      break;

    case QUIC_STREAM_EVENT_PEER_SEND_ABORTED: {
      auto code = event->PEER_SEND_ABORTED.ErrorCode;
      TUIC_LOG_DEBUG("[QUIC] stream {} reset by peer, code {}", id_, code);
      post([code](StreamCore& self) {
        self.incoming.close(std::make_exception_ptr(ExceptionIo(
            fmt::format("stream {} reset by peer, code {}", self.id_, code))));
      });
      break;
    }

    case QUIC_STREAM_EVENT_PEER_RECEIVE_ABORTED:
      QuicApi::instance().api()->StreamShutdown(
          stream_, QUIC_STREAM_SHUTDOWN_FLAG_ABORT_SEND,
          event->PEER_RECEIVE_ABORTED.ErrorCode);
      break;

    case QUIC_STREAM_EVENT_SEND_SHUTDOWN_COMPLETE: {
      bool graceful = event->SEND_SHUTDOWN_COMPLETE.Graceful;
      post([graceful](StreamCore& self) { self.send_shutdown.push(graceful); });
      break;
    }

    case QUIC_STREAM_EVENT_SHUTDOWN_COMPLETE: {
      bool conn_lost = event->SHUTDOWN_COMPLETE.ConnectionShutdown;
      post([conn_lost](StreamCore& self) {
        self.complete_ = true;
        auto error = std::make_exception_ptr(ExceptionIo(fmt::format(
            "stream {} closed{}", self.id_,
            conn_lost ? " with the connection" : "")));
        self.incoming.close(error);
        self.started.close(error);
        self.send_done.close(error);
        self.send_shutdown.close(error);
        self.release();
      });
      break;
    }

    default:
      break;
    }
  }

  boost::asio::any_io_executor ex_;
  HQUIC stream_ = nullptr;
  std::uint64_t id_ = 0;
  bool complete_ = false;
  std::shared_ptr<StreamCore> self_;
};

namespace {

class QuicRecvStream final : public RecvStream
{
public:
  explicit QuicRecvStream(std::shared_ptr<StreamCore> core)
      : core_(std::move(core))
  {
  }

  ~QuicRecvStream() override { stop(0); }

  awaitable<std::size_t> read_some(net::mutable_buffer buf) override
  {
    if (buf.size() == 0) {
      co_return 0;
    }
    while (offset_ == chunk_.size()) {
      if (eof_) {
        co_return 0;
      }
      auto next = co_await core_->incoming.pop();
      if (!next) {
        eof_ = true;
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
    if (eof_) {
      return;
    }
    eof_ = true;
    core_->shutdown(QUIC_STREAM_SHUTDOWN_FLAG_ABORT_RECEIVE, error_code);
  }

  std::uint64_t id() const noexcept override { return core_->id(); }

private:
  std::shared_ptr<StreamCore> core_;
  Bytes chunk_;
  std::size_t offset_ = 0;
  bool eof_ = false;
};

class QuicSendStream final : public SendStream
{
public:
  explicit QuicSendStream(std::shared_ptr<StreamCore> core)
      : core_(std::move(core))
  {
  }

  ~QuicSendStream() override { shutdown(); }

  awaitable<void> write(net::const_buffer buf) override
  {
    if (done_) {
      throw ExceptionIo(fmt::format("stream {} already finished", id()));
    }
    co_await core_->send(buf);
  }

  awaitable<void> finish() override
  {
    if (done_) {
      co_return;
    }
    done_ = true;
    core_->shutdown(QUIC_STREAM_SHUTDOWN_FLAG_GRACEFUL, 0);
    auto graceful = co_await core_->send_shutdown.pop();
    if (!graceful || !*graceful) {
      throw ExceptionIo(fmt::format("stream {} aborted before finish", id()));
    }
  }

  void shutdown() noexcept override
  {
    if (!done_) {
      done_ = true;
      core_->shutdown(QUIC_STREAM_SHUTDOWN_FLAG_GRACEFUL, 0);
    }
  }

  void reset(std::uint64_t error_code) noexcept override
  {
    if (!done_) {
      done_ = true;
      core_->shutdown(QUIC_STREAM_SHUTDOWN_FLAG_ABORT_SEND, error_code);
    }
  }

  std::uint64_t id() const noexcept override { return core_->id(); }

private:
  std::shared_ptr<StreamCore> core_;
  bool done_ = false;
};

} // namespace

//==============================================================================
// QuicConnection
//==============================================================================

QuicConnection::QuicConnection(boost::asio::any_io_executor ex,
                               HQUIC connection,
                               HQUIC configuration)
    : ex_(ex)
    , connection_(connection)
    , configuration_(configuration)
    , connected_(ex)
    , incoming_uni_(ex)
    , incoming_bi_(ex)
    , incoming_datagrams_(ex)
{
}

QuicConnection::~QuicConnection()
{
  auto& quic = QuicApi::instance();

  if (connection_) {
    if (!shutdown_) {
      quic.api()->ConnectionShutdown(connection_,
                                     QUIC_CONNECTION_SHUTDOWN_FLAG_NONE, 0);
    }
    quic.api()->ConnectionClose(connection_);
  }

  if (configuration_) {
    quic.api()->ConfigurationClose(configuration_);
  }
}

awaitable<std::shared_ptr<QuicConnection>>
QuicConnection::connect(boost::asio::any_io_executor ex,
                        const Config& cfg,
                        std::string host,
                        std::uint16_t port)
{
  auto& quic = QuicApi::instance();

  auto conn = std::shared_ptr<QuicConnection>(
      new QuicConnection(ex, nullptr, quic.create_configuration(cfg)));

  QUIC_STATUS status = quic.api()->ConnectionOpen(
      quic.registration(), connection_callback, conn.get(), &conn->connection_);
  if (QUIC_FAILED(status)) {
    throw ExceptionConnection(fmt::format("ConnectionOpen failed: {}", status));
  }

  status = quic.api()->ConnectionStart(conn->connection_, conn->configuration_,
                                       QUIC_ADDRESS_FAMILY_UNSPEC, host.c_str(),
                                       port);
  if (QUIC_FAILED(status)) {
    throw ExceptionConnection(
        fmt::format("ConnectionStart to {}:{} failed: {}", host, port, status));
  }

  auto connected = co_await conn->connected_.pop();
  if (!connected) {
    throw ExceptionConnection(
        fmt::format("handshake with {}:{} failed", host, port));
  }

  TUIC_LOG_INFO("[QUIC] Connected to {}:{}", host, port);
  co_return conn;
}

void QuicConnection::start()
{
  QuicApi::instance().api()->SetCallbackHandler(
      connection_, reinterpret_cast<void*>(connection_callback), this);
}

template <typename Fn> void QuicConnection::dispatch(Fn&& fn)
{
  boost::asio::post(ex_, [weak = weak_from_this(),
                          fn = std::forward<Fn>(fn)]() mutable {
    if (auto self = weak.lock()) {
      fn(*self);
    }
  });
}

void QuicConnection::fail_all(std::exception_ptr error)
{
  connected_.close(error);
  incoming_uni_.close(error);
  incoming_bi_.close(error);
  incoming_datagrams_.close(error);
}

awaitable<std::shared_ptr<StreamCore>>
QuicConnection::open_stream(QUIC_STREAM_OPEN_FLAGS flags)
{
  if (shutdown_) {
    throw ExceptionConnection("connection is closed");
  }

  auto& quic = QuicApi::instance();
  auto core = std::make_shared<StreamCore>(ex_);

  QUIC_STATUS status = quic.api()->StreamOpen(
      connection_, flags, StreamCore::callback, core.get(), &core->handle());
  if (QUIC_FAILED(status)) {
    core->handle() = nullptr;
    throw ExceptionConnection(fmt::format("StreamOpen failed: {}", status));
  }

  core->hold();
  status = quic.api()->StreamStart(core->handle(), QUIC_STREAM_START_FLAG_NONE);
  if (QUIC_FAILED(status)) {
    core->release();
    throw ExceptionConnection(fmt::format("StreamStart failed: {}", status));
  }

  auto ok = co_await core->started.pop();
  if (!ok || !*ok) {
    throw ExceptionConnection("stream could not be started");
  }
  co_return core;
}

awaitable<std::shared_ptr<SendStream>> QuicConnection::open_uni()
{
  auto core = co_await open_stream(QUIC_STREAM_OPEN_FLAG_UNIDIRECTIONAL);
  co_return std::make_shared<QuicSendStream>(std::move(core));
}

awaitable<BiStream> QuicConnection::open_bi()
{
  auto core = co_await open_stream(QUIC_STREAM_OPEN_FLAG_NONE);
  co_return BiStream{std::make_shared<QuicSendStream>(core),
                     std::make_shared<QuicRecvStream>(core)};
}

void QuicConnection::send_datagram(Bytes data)
{
  using Reason = ExceptionSendDatagram::Reason;

  if (shutdown_) {
    throw ExceptionSendDatagram(Reason::ConnectionLost);
  }
  if (!datagram_send_enabled_) {
    throw ExceptionSendDatagram(Reason::UnsupportedByPeer);
  }
  if (data.size() > max_datagram_size_) {
    throw ExceptionSendDatagram(Reason::TooLarge);
  }

  auto* req = new SendRequest(std::move(data));
  QUIC_STATUS status = QuicApi::instance().api()->DatagramSend(
      connection_, &req->buf, 1, QUIC_SEND_FLAG_NONE, req);
  if (QUIC_FAILED(status)) {
    delete req;
    throw ExceptionSendDatagram(Reason::ConnectionLost);
  }
}

std::optional<std::size_t> QuicConnection::max_datagram_size() const
{
  if (!datagram_send_enabled_) {
    return std::nullopt;
  }
  return max_datagram_size_.load();
}

awaitable<std::shared_ptr<RecvStream>> QuicConnection::accept_uni()
{
  auto recv = co_await incoming_uni_.pop();
  if (!recv) {
    throw ExceptionConnection("connection is closed");
  }
  co_return std::move(*recv);
}

awaitable<BiStream> QuicConnection::accept_bi()
{
  auto bi = co_await incoming_bi_.pop();
  if (!bi) {
    throw ExceptionConnection("connection is closed");
  }
  co_return std::move(*bi);
}

awaitable<Bytes> QuicConnection::read_datagram()
{
  auto dg = co_await incoming_datagrams_.pop();
  if (!dg) {
    throw ExceptionConnection("connection is closed");
  }
  co_return std::move(*dg);
}

void QuicConnection::close(std::uint64_t error_code,
                           std::string_view reason) noexcept
{
  if (shutdown_.exchange(true)) {
    return;
  }
  TUIC_LOG_DEBUG("[QUIC] Closing connection, code {}: {}", error_code, reason);
  QuicApi::instance().api()->ConnectionShutdown(
      connection_, QUIC_CONNECTION_SHUTDOWN_FLAG_NONE, error_code);
}

QUIC_STATUS QUIC_API QuicConnection::connection_callback(
    HQUIC, void* context, QUIC_CONNECTION_EVENT* event)
{
  static_cast<QuicConnection*>(context)->handle_connection_event(event);
  return QUIC_STATUS_SUCCESS;
}

void QuicConnection::handle_connection_event(QUIC_CONNECTION_EVENT* event)
{
  switch (event->Type) {
  case QUIC_CONNECTION_EVENT_CONNECTED:
    dispatch([](QuicConnection& self) { self.connected_.push(true); });
    break;

  case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_TRANSPORT: {
    auto status = event->SHUTDOWN_INITIATED_BY_TRANSPORT.Status;
    TUIC_LOG_INFO("[QUIC] Connection shutdown by transport: {}", status);
    shutdown_ = true;
    dispatch([status](QuicConnection& self) {
      self.fail_all(std::make_exception_ptr(ExceptionConnection(
          fmt::format("connection lost, status {}", status))));
    });
    break;
  }

  case QUIC_CONNECTION_EVENT_SHUTDOWN_INITIATED_BY_PEER: {
    auto code = event->SHUTDOWN_INITIATED_BY_PEER.ErrorCode;
    TUIC_LOG_INFO("[QUIC] Connection shutdown by peer, code {}", code);
    shutdown_ = true;
    dispatch([code](QuicConnection& self) {
      self.fail_all(std::make_exception_ptr(ExceptionConnection(
          fmt::format("connection closed by peer, code {}", code))));
    });
    break;
  }

  case QUIC_CONNECTION_EVENT_SHUTDOWN_COMPLETE:
    shutdown_ = true;
    datagram_send_enabled_ = false;
    dispatch([](QuicConnection& self) {
      self.fail_all(std::make_exception_ptr(
          ExceptionConnection("connection is closed")));
    });
    break;

  case QUIC_CONNECTION_EVENT_PEER_STREAM_STARTED: {
    auto core = std::make_shared<StreamCore>(ex_);
    core->handle() = event->PEER_STREAM_STARTED.Stream;
    core->read_id();
    core->hold();
    QuicApi::instance().api()->SetCallbackHandler(
        core->handle(), reinterpret_cast<void*>(StreamCore::callback),
        core.get());

    bool uni = event->PEER_STREAM_STARTED.Flags &
               QUIC_STREAM_OPEN_FLAG_UNIDIRECTIONAL;
    dispatch([core, uni](QuicConnection& self) {
      if (uni) {
        self.incoming_uni_.push(std::make_shared<QuicRecvStream>(core));
      } else {
        self.incoming_bi_.push(BiStream{std::make_shared<QuicSendStream>(core),
                                        std::make_shared<QuicRecvStream>(core)});
      }
    });
    break;
  }

  case QUIC_CONNECTION_EVENT_DATAGRAM_STATE_CHANGED:
    datagram_send_enabled_ = event->DATAGRAM_STATE_CHANGED.SendEnabled;
    max_datagram_size_ = event->DATAGRAM_STATE_CHANGED.MaxSendLength;
    TUIC_LOG_DEBUG("[QUIC] Datagram send enabled: {}, max size: {}",
                   static_cast<bool>(datagram_send_enabled_),
                   max_datagram_size_.load());
    break;

  case QUIC_CONNECTION_EVENT_DATAGRAM_RECEIVED: {
    auto& buf = event->DATAGRAM_RECEIVED.Buffer;
    Bytes data(buf->Buffer, buf->Buffer + buf->Length);
    dispatch([data = std::move(data)](QuicConnection& self) mutable {
      self.incoming_datagrams_.push(std::move(data));
    });
    break;
  }

  case QUIC_CONNECTION_EVENT_DATAGRAM_SEND_STATE_CHANGED: {
    // Only free on terminal states
    auto state = event->DATAGRAM_SEND_STATE_CHANGED.State;
    if (state == QUIC_DATAGRAM_SEND_ACKNOWLEDGED ||
        state == QUIC_DATAGRAM_SEND_ACKNOWLEDGED_SPURIOUS ||
        state == QUIC_DATAGRAM_SEND_LOST_DISCARDED ||
        state == QUIC_DATAGRAM_SEND_CANCELED) {
      delete static_cast<SendRequest*>(
          event->DATAGRAM_SEND_STATE_CHANGED.ClientContext);
    }
    break;
  }

  default:
    break;
  }
}

//==============================================================================
// QuicListener
//==============================================================================

QuicListener::QuicListener(boost::asio::any_io_executor ex, Config cfg)
    : ex_(ex)
    , cfg_(std::move(cfg))
{
}

QuicListener::~QuicListener() { stop(); }

void QuicListener::start(std::uint16_t port, AcceptCallback callback)
{
  auto& quic = QuicApi::instance();

  accept_callback_ = std::move(callback);
  configuration_ = quic.create_configuration(cfg_);

  QUIC_STATUS status = quic.api()->ListenerOpen(
      quic.registration(), listener_callback, this, &listener_);
  if (QUIC_FAILED(status)) {
    quic.api()->ConfigurationClose(configuration_);
    configuration_ = nullptr;
    throw ExceptionConnection(fmt::format("ListenerOpen failed: {}", status));
  }

  QUIC_ADDR addr = {};
  QuicAddrSetFamily(&addr, QUIC_ADDRESS_FAMILY_UNSPEC);
  QuicAddrSetPort(&addr, port);

  QUIC_BUFFER alpn = {static_cast<std::uint32_t>(cfg_.alpn.size()),
                      (std::uint8_t*)cfg_.alpn.data()};

  status = quic.api()->ListenerStart(listener_, &alpn, 1, &addr);
  if (QUIC_FAILED(status)) {
    quic.api()->ListenerClose(listener_);
    listener_ = nullptr;
    quic.api()->ConfigurationClose(configuration_);
    configuration_ = nullptr;
    throw ExceptionConnection(fmt::format("ListenerStart failed: {}", status));
  }

  TUIC_LOG_INFO("[QUIC] Listener started on port {}", port);
}

void QuicListener::stop()
{
  auto& quic = QuicApi::instance();

  if (listener_) {
    quic.api()->ListenerClose(listener_);
    listener_ = nullptr;
  }

  if (configuration_) {
    quic.api()->ConfigurationClose(configuration_);
    configuration_ = nullptr;
  }
}

QUIC_STATUS QUIC_API QuicListener::listener_callback(HQUIC,
                                                     void* context,
                                                     QUIC_LISTENER_EVENT* event)
{
  return static_cast<QuicListener*>(context)->handle_listener_event(event);
}

QUIC_STATUS QuicListener::handle_listener_event(QUIC_LISTENER_EVENT* event)
{
  switch (event->Type) {
  case QUIC_LISTENER_EVENT_NEW_CONNECTION: {
    auto& quic = QuicApi::instance();

    QUIC_STATUS status = quic.api()->ConnectionSetConfiguration(
        event->NEW_CONNECTION.Connection, configuration_);
    if (QUIC_FAILED(status)) {
      TUIC_LOG_ERROR("[QUIC] Failed to set connection configuration: {}",
                     status);
      return status;
    }

    auto conn = std::shared_ptr<QuicConnection>(
        new QuicConnection(ex_, event->NEW_CONNECTION.Connection, nullptr));
    conn->start();

    TUIC_LOG_INFO("[QUIC] New connection from client");
    boost::asio::post(ex_, [cb = accept_callback_, conn]() {
      if (cb) {
        cb(conn);
      }
    });
    break;
  }

  case QUIC_LISTENER_EVENT_STOP_COMPLETE:
    TUIC_LOG_INFO("[QUIC] Listener stopped");
    break;

  default:
    break;
  }
  return QUIC_STATUS_SUCCESS;
}

} // namespace tuic::quic

#endif // TUIC_QUIC_ENABLED
