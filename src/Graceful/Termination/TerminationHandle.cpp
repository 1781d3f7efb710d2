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

#include <Common/SpdLogHelper.hpp>
#include <Graceful/Exception/TerminationHandleInstalledException.hpp>
#include <Graceful/Termination/TerminationSignalSource.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/signal_set.hpp>
#include <fmt/format.h>
#include <atomic>
#include <cstdlib>
#include <string_view>

namespace Graceful
{
  namespace
  {
    GRACEFUL_SHUTDOWN_LOGGER_NAME(TerminationSignal);

    std::atomic<bool> g_terminationHandleInstalled{false};

    std::shared_ptr<spdlog::logger> Logger()
    {
      return Common::SpdLogHelper::GetLogger<LoggerName_TerminationSignal>();
    }

    [[noreturn]] void TerminateProcess(std::string_view reason)
    {
      Logger()->critical("Termination signal bridge failed: {}. Exiting.", reason);
      Logger()->flush();
      std::exit(EXIT_FAILURE);
    }

    /// Owns the signal_set and re-arms it after each delivery. Kept alive by its own pending wait.
    class TerminationSignalBridge : public std::enable_shared_from_this<TerminationSignalBridge>
    {
      boost::asio::signal_set m_signals;
      std::shared_ptr<TerminationSignalSource> m_source;

    public:
      TerminationSignalBridge(const boost::asio::any_io_executor& executor, const TerminationSignalConfig& config,
                              std::shared_ptr<TerminationSignalSource> source)
        : m_signals(executor)
        , m_source(std::move(source))
      {
        for (const int signalNumber : config.Signals)
        {
          m_signals.add(signalNumber);
        }
      }

      void Arm()
      {
        m_signals.async_wait([self = shared_from_this()](const boost::system::error_code& error, int signalNumber)
                             { self->OnSignal(error, signalNumber); });
      }

    private:
      void OnSignal(const boost::system::error_code& error, int signalNumber)
      {
        if (error == boost::asio::error::operation_aborted)
        {
          Logger()->debug("Termination signal bridge cancelled");
          return;
        }
        if (error)
        {
          TerminateProcess(error.message());
        }

        Logger()->debug("Received OS signal {}", signalNumber);

        std::size_t receivers = 0;
        try
        {
          receivers = m_source->Notify();
        }
        catch (const std::exception& ex)
        {
          TerminateProcess(ex.what());
        }

        if (receivers == 0)
        {
          TerminateProcess(fmt::format("nobody is subscribed to receive signal {}", signalNumber));
        }

        Arm();
      }
    };
  }

  std::shared_ptr<TerminationSignalSource> InstallTerminationHandle(const boost::asio::any_io_executor& executor, const TerminationSignalConfig& config)
  {
    bool expected = false;
    if (!g_terminationHandleInstalled.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
      throw TerminationHandleInstalledException("A termination handle has already been installed in this process");
    }

    auto source = std::make_shared<TerminationSignalSource>();
    try
    {
      auto bridge = std::make_shared<TerminationSignalBridge>(executor, config, source);
      bridge->Arm();
    }
    catch (...)
    {
      g_terminationHandleInstalled.store(false, std::memory_order_release);
      throw;
    }

    Logger()->info("Termination handle installed for {} signal(s)", config.Signals.size());
    return source;
  }
}
