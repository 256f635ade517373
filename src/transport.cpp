// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <fmt/format.h>

#include <tuic/exception.hpp>
#include <tuic/transport.hpp>

namespace tuic {

TUIC_API awaitable<void> read_exact(RecvStream& stream,
                                    net::mutable_buffer buf)
{
  std::size_t total = 0;
  while (total < buf.size()) {
    auto n = co_await stream.read_some(buf + total);
    if (n == 0) {
      throw ExceptionIo(fmt::format(
          "stream {} finished after {} of {} bytes", stream.id(), total,
          buf.size()));
    }
    total += n;
  }
}

TUIC_API awaitable<void> write_all(SendStream& stream, net::const_buffer buf)
{
  if (buf.size() == 0) {
    co_return;
  }
  co_await stream.write(buf);
}

} // namespace tuic
