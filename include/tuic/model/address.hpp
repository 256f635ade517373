// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/asio/ip/address.hpp>
#include <fmt/format.h>

#include <tuic/export.hpp>

namespace tuic::model {

/**
 * Relay target carried by connect and packet headers.
 *
 * None is only legal on the non-first fragments of a packet.
 */
class TUIC_API Address
{
public:
  enum class Type : std::uint8_t {
    Domain = 0x00,
    Ipv4 = 0x01,
    Ipv6 = 0x02,
    None = 0xff,
  };

  Address() = default;

  static Address domain(std::string_view host, std::uint16_t port);
  static Address socket(const boost::asio::ip::address& ip,
                        std::uint16_t port);

  // "example.com:443", "1.2.3.4:53" or "[::1]:53"
  static Address parse(std::string_view str);

  Type type() const noexcept { return type_; }
  bool is_none() const noexcept { return type_ == Type::None; }

  // Domain name for domain addresses, textual IP otherwise.
  const std::string& host() const noexcept { return host_; }
  const boost::asio::ip::address& ip() const noexcept { return ip_; }
  std::uint16_t port() const noexcept { return port_; }

  // Bytes this address takes on the wire, type byte included.
  std::size_t encoded_len() const noexcept;

  std::string to_string() const;

  bool operator==(const Address& other) const noexcept;
  bool operator!=(const Address& other) const noexcept
  {
    return !(*this == other);
  }

private:
  Type type_ = Type::None;
  std::string host_;
  boost::asio::ip::address ip_;
  std::uint16_t port_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const Address& addr)
{
  return os << addr.to_string();
}

} // namespace tuic::model

// Formats as to_string() does, only when the message is actually emitted.
template <>
struct fmt::formatter<tuic::model::Address> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const tuic::model::Address& addr, FormatContext& ctx) const
  {
    return fmt::formatter<std::string_view>::format(addr.to_string(), ctx);
  }
};
