#ifndef GRACEFUL_SHUTDOWN_DEMO_DRAINSERVICE_HPP
#define GRACEFUL_SHUTDOWN_DEMO_DRAINSERVICE_HPP
//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Graceful/Service/IGracefulService.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>

namespace Demo
{
  /// @brief Drains pending work on shutdown, the force signal cuts the drain short.
  class DrainService final : public Graceful::IGracefulService
  {
    std::chrono::milliseconds m_drainTime;

  public:
    explicit DrainService(std::chrono::milliseconds drainTime)
      : m_drainTime(drainTime)
    {
    }

    boost::asio::awaitable<void> ShutdownAsync(std::optional<Graceful::SharedSignal> force) override
    {
      auto executor = co_await boost::asio::this_coro::executor;
      auto timer = std::make_shared<boost::asio::steady_timer>(executor, m_drainTime);
      if (force)
      {
        boost::asio::co_spawn(executor, CancelOnForceAsync(*force, timer), boost::asio::detached);
      }

      spdlog::info("Draining pending work for up to {}ms", m_drainTime.count());
      boost::system::error_code error;
      co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error == boost::asio::error::operation_aborted)
      {
        spdlog::warn("Drain forced, dropping the remaining work");
        co_return;
      }
      spdlog::info("Drain complete");
    }

  private:
    static boost::asio::awaitable<void> CancelOnForceAsync(Graceful::SharedSignal force, std::weak_ptr<boost::asio::steady_timer> timer)
    {
      co_await force.WaitAsync();
      if (auto activeTimer = timer.lock())
      {
        activeTimer->cancel();
      }
    }
  };
}

#endif
