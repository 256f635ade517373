// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

#include <tuic/exception.hpp>
#include <tuic/export.hpp>
#include <tuic/model/address.hpp>
#include <tuic/transport.hpp>

namespace tuic::model {

static constexpr std::uint8_t kVersion = 0x05;

// Largest packet written to a dedicated unidirectional stream.
static constexpr std::size_t kQuicMaxPacketSize = 65535;

// At most this many fragments per packet, FRAG_TOTAL is one byte.
static constexpr std::size_t kMaxFragments = 255;

using Token = std::array<std::uint8_t, 32>;

enum class CommandType : std::uint8_t {
  Authenticate = 0x00,
  Connect = 0x01,
  Packet = 0x02,
  Dissociate = 0x03,
  Heartbeat = 0x04,
};

namespace header {

struct Authenticate {
  Token token{};
};

struct Connect {
  Address addr;
};

struct Packet {
  std::uint16_t assoc_id = 0;
  std::uint16_t pkt_id = 0;
  std::uint8_t frag_total = 1;
  std::uint8_t frag_id = 0;
  std::uint16_t size = 0;
  Address addr;
};

struct Dissociate {
  std::uint16_t assoc_id = 0;
};

struct Heartbeat {
};

} // namespace header

// Alternative order must follow CommandType.
using Header = std::variant<header::Authenticate,
                            header::Connect,
                            header::Packet,
                            header::Dissociate,
                            header::Heartbeat>;

/**
 * Header decode failure. The adapter turns it into ExceptionUnmarshal with
 * the original channel attached.
 */
class TUIC_API UnmarshalError : public Exception
{
public:
  enum class Reason {
    UnexpectedEnd,
    InvalidVersion,
    InvalidCommand,
    InvalidAddressType,
    AddressParse,
    Io,
  };

  UnmarshalError(Reason reason, std::string const& msg)
      : Exception(msg)
      , reason_(reason)
  {
  }

  Reason reason() const noexcept { return reason_; }

private:
  Reason reason_;
};

TUIC_API CommandType command_type(const Header& h) noexcept;

// "authenticate", "connect", "packet", "dissociate" or "heartbeat"
TUIC_API std::string_view command_name(const Header& h) noexcept;

// Total encoded size, VER and TYPE included.
TUIC_API std::size_t header_len(const Header& h) noexcept;

// Appends the encoded header to out.
TUIC_API void marshal(const Header& h, Bytes& out);

TUIC_API Bytes marshal(const Header& h);

// Decodes a header starting at pos and advances pos past it.
TUIC_API Header unmarshal(std::span<const std::uint8_t> buf, std::size_t& pos);

// Pulls exactly the bytes the header needs off the stream.
TUIC_API awaitable<Header> async_unmarshal(RecvStream& stream);

} // namespace tuic::model
