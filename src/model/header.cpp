// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <cstring>

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <fmt/format.h>

#include <tuic/impl/overloaded.hpp>
#include <tuic/model/header.hpp>

namespace tuic::model {

namespace {

using impl::overloaded;

void put_u16(Bytes& out, std::uint16_t v)
{
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xff));
}

std::uint16_t get_u16(const std::uint8_t* p) noexcept
{
  return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

void put_address(Bytes& out, const Address& addr)
{
  out.push_back(static_cast<std::uint8_t>(addr.type()));
  switch (addr.type()) {
  case Address::Type::Domain:
    out.push_back(static_cast<std::uint8_t>(addr.host().size()));
    out.insert(out.end(), addr.host().begin(), addr.host().end());
    put_u16(out, addr.port());
    break;
  case Address::Type::Ipv4: {
    auto b = addr.ip().to_v4().to_bytes();
    out.insert(out.end(), b.begin(), b.end());
    put_u16(out, addr.port());
    break;
  }
  case Address::Type::Ipv6: {
    auto b = addr.ip().to_v6().to_bytes();
    out.insert(out.end(), b.begin(), b.end());
    put_u16(out, addr.port());
    break;
  }
  case Address::Type::None:
    break;
  }
}

UnmarshalError unexpected_end()
{
  return UnmarshalError(UnmarshalError::Reason::UnexpectedEnd,
                        "unexpected end of header");
}

void check_version(std::uint8_t ver)
{
  if (ver != kVersion) {
    throw UnmarshalError(UnmarshalError::Reason::InvalidVersion,
                         fmt::format("invalid version: {}", ver));
  }
}

CommandType check_command(std::uint8_t type)
{
  if (type > static_cast<std::uint8_t>(CommandType::Heartbeat)) {
    throw UnmarshalError(UnmarshalError::Reason::InvalidCommand,
                         fmt::format("invalid command: {}", type));
  }
  return static_cast<CommandType>(type);
}

// Body bytes that follow TYPE and precede ADDR.
std::size_t fixed_body_len(CommandType type) noexcept
{
  switch (type) {
  case CommandType::Authenticate:
    return 32;
  case CommandType::Connect:
    return 0;
  case CommandType::Packet:
    return 8;
  case CommandType::Dissociate:
    return 2;
  case CommandType::Heartbeat:
    return 0;
  }
  return 0;
}

bool has_address(CommandType type) noexcept
{
  return type == CommandType::Connect || type == CommandType::Packet;
}

// Bytes after the address type byte; domain length is read separately.
std::size_t address_body_len(std::uint8_t type)
{
  switch (static_cast<Address::Type>(type)) {
  case Address::Type::Domain:
    return 1;
  case Address::Type::Ipv4:
    return 4 + 2;
  case Address::Type::Ipv6:
    return 16 + 2;
  case Address::Type::None:
    return 0;
  }
  throw UnmarshalError(UnmarshalError::Reason::InvalidAddressType,
                       fmt::format("invalid address type: {}", type));
}

Address make_ip_address(std::uint8_t type, const std::uint8_t* p)
{
  if (static_cast<Address::Type>(type) == Address::Type::Ipv4) {
    boost::asio::ip::address_v4::bytes_type b;
    std::memcpy(b.data(), p, b.size());
    return Address::socket(boost::asio::ip::address_v4(b), get_u16(p + 4));
  }
  boost::asio::ip::address_v6::bytes_type b;
  std::memcpy(b.data(), p, b.size());
  return Address::socket(boost::asio::ip::address_v6(b), get_u16(p + 16));
}

Address make_domain_address(const std::uint8_t* name,
                            std::size_t len,
                            const std::uint8_t* port)
{
  if (len == 0) {
    throw UnmarshalError(UnmarshalError::Reason::AddressParse,
                         "empty domain name");
  }
  return Address::domain(
      std::string_view(reinterpret_cast<const char*>(name), len),
      get_u16(port));
}

Header make_header(CommandType type, const std::uint8_t* body, Address addr)
{
  switch (type) {
  case CommandType::Authenticate: {
    header::Authenticate h;
    std::memcpy(h.token.data(), body, h.token.size());
    return h;
  }
  case CommandType::Connect:
    return header::Connect{std::move(addr)};
  case CommandType::Packet: {
    header::Packet h;
    h.assoc_id = get_u16(body);
    h.pkt_id = get_u16(body + 2);
    h.frag_total = body[4];
    h.frag_id = body[5];
    h.size = get_u16(body + 6);
    h.addr = std::move(addr);
    return h;
  }
  case CommandType::Dissociate:
    return header::Dissociate{get_u16(body)};
  case CommandType::Heartbeat:
    return header::Heartbeat{};
  }
  throw UnmarshalError(UnmarshalError::Reason::InvalidCommand,
                       "invalid command");
}

} // namespace

TUIC_API CommandType command_type(const Header& h) noexcept
{
  return static_cast<CommandType>(h.index());
}

TUIC_API std::string_view command_name(const Header& h) noexcept
{
  switch (command_type(h)) {
  case CommandType::Authenticate:
    return "authenticate";
  case CommandType::Connect:
    return "connect";
  case CommandType::Packet:
    return "packet";
  case CommandType::Dissociate:
    return "dissociate";
  case CommandType::Heartbeat:
    return "heartbeat";
  }
  return "unknown";
}

TUIC_API std::size_t header_len(const Header& h) noexcept
{
  return 2 + std::visit(overloaded{
                 [](const header::Authenticate&) -> std::size_t {
                   return 32;
                 },
                 [](const header::Connect& c) -> std::size_t {
                   return c.addr.encoded_len();
                 },
                 [](const header::Packet& p) -> std::size_t {
                   return 8 + p.addr.encoded_len();
                 },
                 [](const header::Dissociate&) -> std::size_t { return 2; },
                 [](const header::Heartbeat&) -> std::size_t { return 0; },
             },
             h);
}

TUIC_API void marshal(const Header& h, Bytes& out)
{
  out.reserve(out.size() + header_len(h));
  out.push_back(kVersion);
  out.push_back(static_cast<std::uint8_t>(command_type(h)));

  std::visit(overloaded{
                 [&](const header::Authenticate& a) {
                   out.insert(out.end(), a.token.begin(), a.token.end());
                 },
                 [&](const header::Connect& c) { put_address(out, c.addr); },
                 [&](const header::Packet& p) {
                   put_u16(out, p.assoc_id);
                   put_u16(out, p.pkt_id);
                   out.push_back(p.frag_total);
                   out.push_back(p.frag_id);
                   put_u16(out, p.size);
                   put_address(out, p.addr);
                 },
                 [&](const header::Dissociate& d) { put_u16(out, d.assoc_id); },
                 [](const header::Heartbeat&) {},
             },
             h);
}

TUIC_API Bytes marshal(const Header& h)
{
  Bytes out;
  marshal(h, out);
  return out;
}

TUIC_API Header unmarshal(std::span<const std::uint8_t> buf, std::size_t& pos)
{
  std::size_t p = pos;
  auto need = [&](std::size_t n) {
    if (p > buf.size() || buf.size() - p < n) {
      throw unexpected_end();
    }
  };

  need(2);
  check_version(buf[p]);
  auto type = check_command(buf[p + 1]);
  p += 2;

  auto body_len = fixed_body_len(type);
  need(body_len);
  const std::uint8_t* body = buf.data() + p;
  p += body_len;

  Address addr;
  if (has_address(type)) {
    need(1);
    std::uint8_t addr_type = buf[p++];
    auto len = address_body_len(addr_type);
    need(len);
    if (static_cast<Address::Type>(addr_type) == Address::Type::Domain) {
      std::size_t name_len = buf[p++];
      need(name_len + 2);
      addr = make_domain_address(buf.data() + p, name_len,
                                 buf.data() + p + name_len);
      p += name_len + 2;
    } else if (static_cast<Address::Type>(addr_type) != Address::Type::None) {
      addr = make_ip_address(addr_type, buf.data() + p);
      p += len;
    }
  }

  auto h = make_header(type, body, std::move(addr));
  pos = p;
  return h;
}

TUIC_API awaitable<Header> async_unmarshal(RecvStream& stream)
{
  try {
    std::uint8_t prefix[2];
    co_await read_exact(stream, net::buffer(prefix));
    check_version(prefix[0]);
    auto type = check_command(prefix[1]);

    std::array<std::uint8_t, 32> body{};
    co_await read_exact(stream,
                        net::buffer(body.data(), fixed_body_len(type)));

    Address addr;
    if (has_address(type)) {
      std::uint8_t addr_type;
      co_await read_exact(stream, net::buffer(&addr_type, 1));
      auto len = address_body_len(addr_type);
      std::array<std::uint8_t, 18> raw{};
      co_await read_exact(stream, net::buffer(raw.data(), len));

      if (static_cast<Address::Type>(addr_type) == Address::Type::Domain) {
        std::size_t name_len = raw[0];
        std::array<std::uint8_t, 255 + 2> name{};
        co_await read_exact(stream, net::buffer(name.data(), name_len + 2));
        addr = make_domain_address(name.data(), name_len,
                                   name.data() + name_len);
      } else if (static_cast<Address::Type>(addr_type) !=
                 Address::Type::None) {
        addr = make_ip_address(addr_type, raw.data());
      }
    }

    co_return make_header(type, body.data(), std::move(addr));
  } catch (const ExceptionIo& e) {
    throw UnmarshalError(UnmarshalError::Reason::UnexpectedEnd, e.what());
  } catch (const Error& e) {
    throw UnmarshalError(UnmarshalError::Reason::Io, e.what());
  }
}

} // namespace tuic::model
