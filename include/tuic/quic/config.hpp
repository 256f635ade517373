// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <tuic/export.hpp>

namespace tuic::quic {

enum class Role : std::uint8_t { Client, Server };

struct Config {
  Role                      role = Role::Client;
  std::string               alpn = "tuic";
  std::chrono::milliseconds idle_timeout{30000};
  std::uint16_t             peer_bidi_stream_count  = 100;
  std::uint16_t             peer_unidi_stream_count = 100;
  bool                      datagram_receive_enabled = true;
  std::string               cert_file;
  std::string               key_file;
  // Client only, skips server certificate checks
  bool                      disable_certificate_validation = false;
};

/**
 * Collects QUIC settings for a client or a server endpoint.
 *
 *   auto cfg = tuic::quic::ConfigBuilder()
 *                  .with_role(tuic::quic::Role::Server)
 *                  .with_certificate("server.crt", "server.key")
 *                  .build();
 */
class TUIC_API ConfigBuilder
{
public:
  ConfigBuilder& with_role(Role role) noexcept;
  ConfigBuilder& with_alpn(std::string alpn);
  ConfigBuilder& with_idle_timeout(std::chrono::milliseconds timeout) noexcept;
  ConfigBuilder& with_peer_stream_counts(std::uint16_t bidi,
                                         std::uint16_t unidi) noexcept;
  ConfigBuilder& with_datagram_receive(bool enabled) noexcept;
  ConfigBuilder& with_certificate(std::string cert_file, std::string key_file);
  ConfigBuilder& with_certificate_validation(bool enabled) noexcept;

  // Throws tuic::Exception when the settings are inconsistent.
  Config build() const;

private:
  Config cfg_;
};

} // namespace tuic::quic
