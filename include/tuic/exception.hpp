// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <tuic/export.hpp>
#include <tuic/transport.hpp>

namespace tuic {

class TUIC_API Exception : public std::runtime_error
{
public:
  explicit Exception(char const* const msg) noexcept : std::runtime_error(msg)
  {
  }

  explicit Exception(std::string const& msg) noexcept : std::runtime_error(msg)
  {
  }
};

enum class ErrorKind {
  Io,
  Connection,
  SendDatagram,
  PayloadLength,
  InvalidUdpSession,
  Assemble,
  Unmarshal,
  BadCommand,
};

TUIC_API std::string_view to_string(ErrorKind kind) noexcept;

class TUIC_API Error : public Exception
{
  ErrorKind kind_;

public:
  Error(ErrorKind kind, std::string const& msg)
      : Exception(msg)
      , kind_(kind)
  {
  }

  ErrorKind kind() const noexcept { return kind_; }
};

// Stream read/write failure: reset by peer, premature end, aborted write.
class TUIC_API ExceptionIo : public Error
{
public:
  explicit ExceptionIo(std::string const& msg)
      : Error(ErrorKind::Io, msg)
  {
  }
};

// The QUIC connection is gone or refused to open a stream.
class TUIC_API ExceptionConnection : public Error
{
public:
  explicit ExceptionConnection(std::string const& msg)
      : Error(ErrorKind::Connection, msg)
  {
  }
};

class TUIC_API ExceptionSendDatagram : public Error
{
public:
  enum class Reason {
    UnsupportedByPeer, // peer did not negotiate datagrams
    TooLarge,
    ConnectionLost,
  };

  explicit ExceptionSendDatagram(Reason reason);

  Reason reason() const noexcept { return reason_; }

private:
  Reason reason_;
};

class TUIC_API ExceptionPayloadLength : public Error
{
  std::size_t expected_;
  std::size_t actual_;

public:
  ExceptionPayloadLength(std::size_t expected, std::size_t actual);

  std::size_t expected() const noexcept { return expected_; }
  std::size_t actual() const noexcept { return actual_; }
};

class TUIC_API ExceptionInvalidUdpSession : public Error
{
  std::uint16_t assoc_id_;

public:
  explicit ExceptionInvalidUdpSession(std::uint16_t assoc_id);

  std::uint16_t assoc_id() const noexcept { return assoc_id_; }
};

enum class ChannelKind { UniStream, BiStream, Datagram };

TUIC_API std::string_view to_string(ChannelKind kind) noexcept;

struct UniChannel {
  std::shared_ptr<RecvStream> recv;
};

struct BiChannel {
  std::shared_ptr<SendStream> send;
  std::shared_ptr<RecvStream> recv;
};

struct DatagramChannel {
  Bytes data;
};

// The untouched inbound channel, handed back so the caller decides how to
// dispose of it.
using Channel = std::variant<UniChannel, BiChannel, DatagramChannel>;

TUIC_API ChannelKind kind_of(const Channel& channel) noexcept;

class TUIC_API ExceptionUnmarshal : public Error
{
  Channel channel_;

public:
  ExceptionUnmarshal(std::string const& reason, Channel channel);

  ChannelKind channel_kind() const noexcept { return kind_of(channel_); }
  Channel& channel() noexcept { return channel_; }
  const Channel& channel() const noexcept { return channel_; }
};

class TUIC_API ExceptionBadCommand : public Error
{
  std::string_view command_;
  Channel channel_;

public:
  ExceptionBadCommand(std::string_view command, Channel channel);

  // Static string: "authenticate", "connect", "packet", ...
  std::string_view command() const noexcept { return command_; }
  ChannelKind channel_kind() const noexcept { return kind_of(channel_); }
  Channel& channel() noexcept { return channel_; }
  const Channel& channel() const noexcept { return channel_; }
};

} // namespace tuic
