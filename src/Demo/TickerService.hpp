#ifndef GRACEFUL_SHUTDOWN_DEMO_TICKERSERVICE_HPP
#define GRACEFUL_SHUTDOWN_DEMO_TICKERSERVICE_HPP
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
#include <Graceful/Signal/SharedSignal.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>

namespace Demo
{
  /// @brief Does a unit of periodic work and stops after the tick that is in progress.
  class TickerService final : public Graceful::IGracefulService
  {
    boost::asio::any_io_executor m_executor;
    boost::asio::steady_timer m_timer;
    std::chrono::milliseconds m_interval;
    bool m_stopRequested{false};
    uint64_t m_ticks{0};
    Graceful::SharedSignal m_stopped = Graceful::SharedSignal::CreateManual();

  public:
    TickerService(boost::asio::any_io_executor executor, std::chrono::milliseconds interval)
      : m_executor(executor)
      , m_timer(executor)
      , m_interval(interval)
    {
    }

    void Start()
    {
      boost::asio::co_spawn(m_executor, RunAsync(), boost::asio::detached);
    }

    boost::asio::awaitable<void> ShutdownAsync(std::optional<Graceful::SharedSignal> force) override
    {
      m_stopRequested = true;
      if (force && force->IsFired())
      {
        // Forced from the start: abandon the running tick
        m_timer.cancel();
        spdlog::info("Ticker forced to stop after {} tick(s)", m_ticks);
        co_return;
      }

      spdlog::info("Ticker finishing its current tick");
      co_await m_stopped.WaitAsync();
      spdlog::info("Ticker stopped after {} tick(s)", m_ticks);
    }

  private:
    boost::asio::awaitable<void> RunAsync()
    {
      while (!m_stopRequested)
      {
        m_timer.expires_after(m_interval);
        boost::system::error_code error;
        co_await m_timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, error));
        if (error)
        {
          break;
        }
        ++m_ticks;
        spdlog::debug("Tick {}", m_ticks);
      }
      m_stopped.Fire();
    }
  };
}

#endif
