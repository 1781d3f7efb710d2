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

#include <Common/AggregateException.hpp>
#include <Common/SpdLogHelper.hpp>
#include <Graceful/Exception/AlreadyShuttingDownException.hpp>
#include <Graceful/Group/ShutdownGroup.hpp>
#include <Graceful/Termination/TerminationSignalSource.hpp>
#include <Graceful/Util/BlockOn.hpp>
#include <Graceful/Util/DropGuard.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace Graceful
{
  namespace
  {
    GRACEFUL_SHUTDOWN_LOGGER_NAME(ShutdownGroup);

    std::shared_ptr<spdlog::logger> Logger()
    {
      return Common::SpdLogHelper::GetLogger<LoggerName_ShutdownGroup>();
    }

    /// Collects the outcome of the concurrently running service shutdowns and fires when the last one is in.
    class ShutdownJoin
    {
      std::mutex m_mutex;
      std::vector<ServiceShutdownRecord> m_records;
      std::size_t m_remaining;
      SharedSignal m_allDone = SharedSignal::CreateManual();

    public:
      explicit ShutdownJoin(std::vector<ServiceShutdownRecord> records)
        : m_records(std::move(records))
        , m_remaining(m_records.size())
      {
        if (m_remaining == 0)
        {
          m_allDone.Fire();
        }
      }

      void Complete(std::size_t index, std::exception_ptr error, std::chrono::nanoseconds duration)
      {
        bool lastOne = false;
        {
          std::lock_guard lock(m_mutex);
          m_records[index].Error = std::move(error);
          m_records[index].Duration = duration;
          lastOne = --m_remaining == 0;
        }
        if (lastOne)
        {
          m_allDone.Fire();
        }
      }

      boost::asio::awaitable<void> WaitAsync() const
      {
        return m_allDone.WaitAsync();
      }

      std::vector<ServiceShutdownRecord> TakeRecords()
      {
        std::lock_guard lock(m_mutex);
        return std::move(m_records);
      }
    };

    boost::asio::awaitable<void> ReceiveNextAsync(std::shared_ptr<TerminationSubscription> subscription)
    {
      co_await subscription->ReceiveAsync();
    }

    /// Fires the force signal of a finished shutdown and closes its subscription, so neither the signal's
    /// waiters nor its producer are left suspended.
    void ReleaseForce(SharedSignal& force, TerminationSubscription& forceSubscription)
    {
      force.Fire();
      forceSubscription.Close();
    }

    void LogReport(const ShutdownReport& report)
    {
      auto logger = Logger();
      for (const auto& record : report.GetRecords())
      {
        const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(record.Duration).count();
        if (record.Succeeded())
        {
          logger->debug("Service '{}' shut down in {}ms", record.ServiceName, durationMs);
        }
        else
        {
          logger->warn("Service '{}' failed to shut down after {}ms: {}", record.ServiceName, durationMs,
                       Common::AggregateException::Describe(record.Error));
        }
      }

      if (report.HasFailures())
      {
        logger->warn("{} of {} service(s) failed to shut down", report.GetFailureCount(), report.GetServiceCount());
      }
      else
      {
        logger->info("All {} service(s) shut down", report.GetServiceCount());
      }
    }
  }

  class ShutdownGroup::State
  {
    struct ServiceEntry
    {
      std::string Name;
      std::unique_ptr<IGracefulService> Service;
    };

    ShutdownGroupConfig m_config;
    std::atomic<bool> m_shuttingDown{false};
    std::vector<ServiceEntry> m_services;

  public:
    explicit State(ShutdownGroupConfig config)
      : m_config(config)
    {
    }

    const ShutdownGroupConfig& GetConfig() const noexcept
    {
      return m_config;
    }

    std::size_t GetServiceCount() const noexcept
    {
      return m_services.size();
    }

    const std::string& GetServiceName(std::size_t index) const
    {
      return m_services[index].Name;
    }

    IGracefulService& GetService(std::size_t index)
    {
      return *m_services[index].Service;
    }

    void Push(std::unique_ptr<IGracefulService> service, std::string name)
    {
      m_services.push_back(ServiceEntry{std::move(name), std::move(service)});
    }

    bool IsShuttingDown() const noexcept
    {
      return m_shuttingDown.load(std::memory_order_acquire);
    }

    /// @brief Atomically flips the group into the shutting-down state.
    /// @return false if it already was shutting down.
    bool TryBeginShutdown() noexcept
    {
      bool expected = false;
      return m_shuttingDown.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    /// @brief Claims the shutdown sequence and returns the operation that runs it.
    /// @throws AlreadyShuttingDownException if a shutdown sequence was already started.
    static boost::asio::awaitable<ShutdownReport> BeginShutdownAll(const std::shared_ptr<State>& state, std::optional<SharedSignal> force)
    {
      if (!state->TryBeginShutdown())
      {
        throw AlreadyShuttingDownException();
      }
      return ShutdownGroup::RunShutdownAsync(state, std::move(force));
    }
  };

  ShutdownGroup::ShutdownGroup(ShutdownGroupConfig config)
    : m_state(std::make_shared<State>(config))
  {
  }

  ShutdownGroup::~ShutdownGroup() noexcept(false)
  {
    Util::DropGuard(
      [this]
      {
        if (!m_state->TryBeginShutdown())
        {
          return;
        }

        Logger()->debug("ShutdownGroup destroyed without a shutdown, forcing shutdown of {} service(s)", m_state->GetServiceCount());
        const ShutdownReport report = Util::BlockOn(RunShutdownAsync(m_state, SharedSignal::CreateFired()));
        LogReport(report);
      });
  }

  void ShutdownGroup::Push(std::unique_ptr<IGracefulService> service, std::string name)
  {
    if (!service)
    {
      throw std::invalid_argument("ShutdownGroup::Push: service can not be null");
    }
    if (name.empty())
    {
      name = fmt::format("service-{}", m_state->GetServiceCount());
    }
    Logger()->debug("Registered service '{}'", name);
    m_state->Push(std::move(service), std::move(name));
  }

  std::size_t ShutdownGroup::GetServiceCount() const noexcept
  {
    return m_state->GetServiceCount();
  }

  bool ShutdownGroup::IsShuttingDown() const noexcept
  {
    return m_state->IsShuttingDown();
  }

  const ShutdownGroupConfig& ShutdownGroup::GetConfig() const noexcept
  {
    return m_state->GetConfig();
  }

  boost::asio::awaitable<ShutdownReport> ShutdownGroup::ShutdownAll(std::optional<SharedSignal> force)
  {
    return State::BeginShutdownAll(m_state, std::move(force));
  }

  boost::asio::awaitable<void> ShutdownGroup::WaitToTerminate(std::shared_ptr<TerminationSignalSource> source)
  {
    if (!source)
    {
      throw std::invalid_argument("ShutdownGroup::WaitToTerminate: source can not be null");
    }
    auto subscription = source->Subscribe();
    return RunWaitToTerminateAsync(m_state, std::move(source), std::move(subscription));
  }

  boost::asio::awaitable<ShutdownReport> ShutdownGroup::RunShutdownAsync(std::shared_ptr<State> state, std::optional<SharedSignal> force)
  {
    auto executor = co_await boost::asio::this_coro::executor;
    const std::size_t serviceCount = state->GetServiceCount();
    Logger()->info("Shutting down {} service(s){}", serviceCount, force ? " with force signal" : "");

    std::vector<ServiceShutdownRecord> records(serviceCount);
    for (std::size_t i = 0; i < serviceCount; ++i)
    {
      records[i].ServiceName = state->GetServiceName(i);
    }
    auto join = std::make_shared<ShutdownJoin>(std::move(records));

    // Every service is invoked and spawned before we wait on any of them
    for (std::size_t i = 0; i < serviceCount; ++i)
    {
      Logger()->debug("Requesting shutdown of service '{}'", state->GetServiceName(i));

      const auto startTime = std::chrono::steady_clock::now();
      std::optional<boost::asio::awaitable<void>> operation;
      try
      {
        operation.emplace(state->GetService(i).ShutdownAsync(force));
      }
      catch (...)
      {
        join->Complete(i, std::current_exception(), std::chrono::nanoseconds::zero());
        continue;
      }

      boost::asio::co_spawn(executor, std::move(*operation),
                            [join, i, startTime](std::exception_ptr ex)
                            { join->Complete(i, std::move(ex), std::chrono::steady_clock::now() - startTime); });
    }

    co_await join->WaitAsync();

    ShutdownReport report(join->TakeRecords());
    if (state->GetConfig().FailurePolicy == ShutdownFailurePolicy::Throw)
    {
      report.ThrowIfFailed();
    }
    co_return report;
  }

  boost::asio::awaitable<void> ShutdownGroup::RunWaitToTerminateAsync(std::shared_ptr<State> state, std::shared_ptr<TerminationSignalSource> source,
                                                                     std::shared_ptr<TerminationSubscription> subscription)
  {
    co_await subscription->ReceiveAsync();

    Logger()->info("Received termination signal.");
    Logger()->info("Signal again (Ctrl + C) to force shutdown.");

    // The force subscription starts now, so only notifications after the first one count
    auto executor = co_await boost::asio::this_coro::executor;
    auto forceSubscription = source->Subscribe();
    SharedSignal force(executor, ReceiveNextAsync(forceSubscription));

    std::optional<boost::asio::awaitable<ShutdownReport>> shutdown;
    try
    {
      shutdown.emplace(State::BeginShutdownAll(state, force));
    }
    catch (const AlreadyShuttingDownException& ex)
    {
      Logger()->info("Shutdown already in progress: {}", ex.what());
    }

    if (!shutdown)
    {
      ReleaseForce(force, *forceSubscription);
      co_return;
    }

    ShutdownReport report;
    try
    {
      report = co_await std::move(*shutdown);
    }
    catch (...)
    {
      ReleaseForce(force, *forceSubscription);
      throw;
    }
    ReleaseForce(force, *forceSubscription);
    LogReport(report);
  }
}
