// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <deque>
#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace tuic::impl {

/**
 * Unbounded FIFO whose consumers suspend until an item or close arrives.
 *
 * Not thread safe: every member must run on the executor passed to the
 * constructor. Producers living on other threads post onto that executor.
 * The timer never expires, cancel() is only used to wake waiters.
 */
template <typename T>
class AsyncQueue
{
public:
  explicit AsyncQueue(boost::asio::any_io_executor ex)
      : signal_(ex, std::chrono::steady_clock::time_point::max())
  {
  }

  AsyncQueue(const AsyncQueue&) = delete;
  AsyncQueue& operator=(const AsyncQueue&) = delete;

  void push(T value)
  {
    if (closed_) {
      return;
    }
    items_.push_back(std::move(value));
    signal_.cancel();
  }

  // Items already queued are still delivered; afterwards pop() returns
  // nullopt, or rethrows `error` when one is given.
  void close(std::exception_ptr error = nullptr)
  {
    if (closed_) {
      return;
    }
    closed_ = true;
    error_ = error;
    signal_.cancel();
  }

  bool closed() const noexcept { return closed_; }
  bool empty() const noexcept { return items_.empty(); }

  std::optional<T> try_pop()
  {
    if (items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  boost::asio::awaitable<std::optional<T>> pop()
  {
    while (items_.empty()) {
      if (closed_) {
        if (error_) {
          std::rethrow_exception(error_);
        }
        co_return std::nullopt;
      }
      boost::system::error_code ec;
      co_await signal_.async_wait(
          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return try_pop();
  }

private:
  boost::asio::steady_timer signal_;
  std::deque<T> items_;
  bool closed_ = false;
  std::exception_ptr error_;
};

} // namespace tuic::impl
