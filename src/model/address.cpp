// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <charconv>
#include <stdexcept>

#include <tuic/model/address.hpp>

namespace tuic::model {

Address Address::domain(std::string_view host, std::uint16_t port)
{
  if (host.empty() || host.size() > 255) {
    throw std::invalid_argument("Domain name must be 1..255 bytes long");
  }
  Address addr;
  addr.type_ = Type::Domain;
  addr.host_ = host;
  addr.port_ = port;
  return addr;
}

Address Address::socket(const boost::asio::ip::address& ip,
                        std::uint16_t port)
{
  Address addr;
  addr.type_ = ip.is_v4() ? Type::Ipv4 : Type::Ipv6;
  addr.ip_ = ip;
  addr.host_ = ip.to_string();
  addr.port_ = port;
  return addr;
}

Address Address::parse(std::string_view str)
{
  if (str.empty()) {
    throw std::invalid_argument("Address cannot be empty");
  }

  auto to_uint16 = [](std::string_view s) {
    std::uint16_t port;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), port);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
      throw std::invalid_argument("Invalid port number");
    }
    return port;
  };

  std::string_view host;
  std::uint16_t port;

  if (str.front() == '[') {
    auto end = str.find("]:");
    if (end == std::string_view::npos) {
      throw std::invalid_argument("Missing port number");
    }
    host = str.substr(1, end - 1);
    port = to_uint16(str.substr(end + 2));
  } else {
    auto end = str.rfind(':');
    if (end == std::string_view::npos) {
      throw std::invalid_argument("Missing port number");
    }
    host = str.substr(0, end);
    port = to_uint16(str.substr(end + 1));
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(std::string(host), ec);
  if (!ec) {
    return socket(ip, port);
  }
  if (str.front() == '[') {
    throw std::invalid_argument("Invalid IPv6 address");
  }
  return domain(host, port);
}

std::size_t Address::encoded_len() const noexcept
{
  switch (type_) {
  case Type::Domain:
    return 1 + 1 + host_.size() + 2;
  case Type::Ipv4:
    return 1 + 4 + 2;
  case Type::Ipv6:
    return 1 + 16 + 2;
  case Type::None:
    return 1;
  }
  return 1;
}

std::string Address::to_string() const
{
  switch (type_) {
  case Type::Domain:
  case Type::Ipv4:
    return host_ + ":" + std::to_string(port_);
  case Type::Ipv6:
    return "[" + host_ + "]:" + std::to_string(port_);
  case Type::None:
    return "none";
  }
  return "none";
}

bool Address::operator==(const Address& other) const noexcept
{
  if (type_ != other.type_) {
    return false;
  }
  switch (type_) {
  case Type::Domain:
    return host_ == other.host_ && port_ == other.port_;
  case Type::Ipv4:
  case Type::Ipv6:
    return ip_ == other.ip_ && port_ == other.port_;
  case Type::None:
    return true;
  }
  return false;
}

} // namespace tuic::model
