// Copyright (c) 2021-2025, Nikita Pennie <nikitapnn1@gmail.com>
// SPDX-License-Identifier: MIT

#include <tuic/connect.hpp>
#include <tuic/exception.hpp>
#include <tuic/impl/overloaded.hpp>

#include "logging.hpp"

namespace tuic {

Connect::Connect(std::variant<model::ConnectTx, model::ConnectRx> model,
                 std::shared_ptr<SendStream> send,
                 std::shared_ptr<RecvStream> recv)
    : model_(std::move(model))
    , send_(std::move(send))
    , recv_(std::move(recv))
{
}

Connect::~Connect() { release(); }

Connect::Connect(Connect&& other) noexcept
    : model_(std::move(other.model_))
    , send_(std::move(other.send_))
    , recv_(std::move(other.recv_))
    , write_closed_(other.write_closed_)
{
}

Connect& Connect::operator=(Connect&& other) noexcept
{
  if (this != &other) {
    release();
    model_ = std::move(other.model_);
    send_ = std::move(other.send_);
    recv_ = std::move(other.recv_);
    write_closed_ = other.write_closed_;
  }
  return *this;
}

void Connect::release() noexcept
{
  if (send_ && !write_closed_) {
    send_->shutdown();
  }
  if (recv_) {
    recv_->stop(0);
  }
  send_.reset();
  recv_.reset();
}

const model::Address& Connect::addr() const noexcept
{
  return std::visit(
      impl::overloaded{
          [](const model::ConnectTx& m) -> const model::Address& {
            return m.addr();
          },
          [](const model::ConnectRx& m) -> const model::Address& {
            return m.addr();
          },
      },
      model_);
}

awaitable<std::size_t> Connect::read_some(net::mutable_buffer buf)
{
  co_return co_await recv_->read_some(buf);
}

awaitable<void> Connect::read_exact(net::mutable_buffer buf)
{
  co_await tuic::read_exact(*recv_, buf);
}

awaitable<void> Connect::write(net::const_buffer buf)
{
  if (write_closed_) {
    throw ExceptionIo("write on a closed connect session");
  }
  co_await write_all(*send_, buf);
}

awaitable<void> Connect::close()
{
  if (write_closed_) {
    co_return;
  }
  write_closed_ = true;
  TUIC_LOG_TRACE("connect to {}: finishing stream {}", addr(),
                 send_->id());
  co_await send_->finish();
}

} // namespace tuic
