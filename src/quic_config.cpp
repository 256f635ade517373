// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <tuic/exception.hpp>
#include <tuic/quic/config.hpp>

#include <fmt/format.h>

namespace tuic::quic {

ConfigBuilder& ConfigBuilder::with_role(Role role) noexcept
{
  cfg_.role = role;
  return *this;
}

ConfigBuilder& ConfigBuilder::with_alpn(std::string alpn)
{
  cfg_.alpn = std::move(alpn);
  return *this;
}

ConfigBuilder&
ConfigBuilder::with_idle_timeout(std::chrono::milliseconds timeout) noexcept
{
  cfg_.idle_timeout = timeout;
  return *this;
}

ConfigBuilder& ConfigBuilder::with_peer_stream_counts(std::uint16_t bidi,
                                                      std::uint16_t unidi) noexcept
{
  cfg_.peer_bidi_stream_count = bidi;
  cfg_.peer_unidi_stream_count = unidi;
  return *this;
}

ConfigBuilder& ConfigBuilder::with_datagram_receive(bool enabled) noexcept
{
  cfg_.datagram_receive_enabled = enabled;
  return *this;
}

ConfigBuilder& ConfigBuilder::with_certificate(std::string cert_file,
                                               std::string key_file)
{
  cfg_.cert_file = std::move(cert_file);
  cfg_.key_file = std::move(key_file);
  return *this;
}

ConfigBuilder& ConfigBuilder::with_certificate_validation(bool enabled) noexcept
{
  cfg_.disable_certificate_validation = !enabled;
  return *this;
}

Config ConfigBuilder::build() const
{
  if (cfg_.alpn.empty() || cfg_.alpn.size() > 255) {
    throw Exception(
        fmt::format("ALPN must be 1..255 bytes long, got {}", cfg_.alpn.size()));
  }

  if (cfg_.idle_timeout.count() < 0) {
    throw Exception("idle timeout cannot be negative");
  }

  if (cfg_.cert_file.empty() != cfg_.key_file.empty()) {
    throw Exception("certificate and key file must be given together");
  }

  if (cfg_.role == Role::Server) {
    if (cfg_.cert_file.empty()) {
      throw Exception("server enabled but certificate or key file not specified");
    }
    if (cfg_.disable_certificate_validation) {
      throw Exception("certificate validation can only be disabled on a client");
    }
  }

  return cfg_;
}

} // namespace tuic::quic
