// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fmt/format.h>

#include <tuic/exception.hpp>

namespace tuic {

namespace {

std::string_view reason_text(ExceptionSendDatagram::Reason reason) noexcept
{
  switch (reason) {
  case ExceptionSendDatagram::Reason::UnsupportedByPeer:
    return "datagrams not supported by peer";
  case ExceptionSendDatagram::Reason::TooLarge:
    return "datagram too large";
  case ExceptionSendDatagram::Reason::ConnectionLost:
    return "connection lost";
  }
  return "unknown";
}

} // namespace

TUIC_API std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Connection:
    return "connection";
  case ErrorKind::SendDatagram:
    return "send_datagram";
  case ErrorKind::PayloadLength:
    return "payload_length";
  case ErrorKind::InvalidUdpSession:
    return "invalid_udp_session";
  case ErrorKind::Assemble:
    return "assemble";
  case ErrorKind::Unmarshal:
    return "unmarshal";
  case ErrorKind::BadCommand:
    return "bad_command";
  }
  return "unknown";
}

TUIC_API std::string_view to_string(ChannelKind kind) noexcept
{
  switch (kind) {
  case ChannelKind::UniStream:
    return "uni_stream";
  case ChannelKind::BiStream:
    return "bi_stream";
  case ChannelKind::Datagram:
    return "datagram";
  }
  return "unknown";
}

TUIC_API ChannelKind kind_of(const Channel& channel) noexcept
{
  switch (channel.index()) {
  case 0:
    return ChannelKind::UniStream;
  case 1:
    return ChannelKind::BiStream;
  default:
    return ChannelKind::Datagram;
  }
}

ExceptionSendDatagram::ExceptionSendDatagram(Reason reason)
    : Error(ErrorKind::SendDatagram,
            fmt::format("failed to send datagram: {}", reason_text(reason)))
    , reason_(reason)
{
}

ExceptionPayloadLength::ExceptionPayloadLength(std::size_t expected,
                                               std::size_t actual)
    : Error(ErrorKind::PayloadLength,
            fmt::format("expecting payload length {} but got {}", expected,
                        actual))
    , expected_(expected)
    , actual_(actual)
{
}

ExceptionInvalidUdpSession::ExceptionInvalidUdpSession(std::uint16_t assoc_id)
    : Error(ErrorKind::InvalidUdpSession,
            fmt::format("invalid udp session {}", assoc_id))
    , assoc_id_(assoc_id)
{
}

ExceptionUnmarshal::ExceptionUnmarshal(std::string const& reason,
                                       Channel channel)
    : Error(ErrorKind::Unmarshal,
            fmt::format("error unmarshaling {}: {}",
                        to_string(kind_of(channel)), reason))
    , channel_(std::move(channel))
{
}

ExceptionBadCommand::ExceptionBadCommand(std::string_view command,
                                         Channel channel)
    : Error(ErrorKind::BadCommand,
            fmt::format("bad command `{}` from {}", command,
                        to_string(kind_of(channel))))
    , command_(command)
    , channel_(std::move(channel))
{
}

} // namespace tuic
