#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNGROUP_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNGROUP_HPP
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

#include <Graceful/Group/ShutdownGroupConfig.hpp>
#include <Graceful/Group/ShutdownReport.hpp>
#include <Graceful/Service/IGracefulService.hpp>
#include <Graceful/Signal/SharedSignal.hpp>
#include <boost/asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>

namespace Graceful
{
  class TerminationSignalSource;
  class TerminationSubscription;

  /// @brief Owns a set of services and shuts them all down together, at most once.
  ///
  /// Shutdown is two-phase when driven by WaitToTerminate: the first termination notification asks every
  /// service to stop gracefully, the second fires the shared force signal. Services are always stopped
  /// concurrently and the group waits for all of them.
  ///
  /// Destroying a group that was never shut down forces a shutdown of every service and blocks until
  /// they are done (see ~ShutdownGroup).
  ///
  /// The services and the shutting-down flag live in a state shared with the operations returned by
  /// ShutdownAll and WaitToTerminate, so those operations stay valid after the group itself is destroyed.
  ///
  /// Push() must complete before any shutdown starts; the group does not guard against concurrent Push
  /// during a shutdown. ShutdownAll itself may be raced from several threads.
  class ShutdownGroup
  {
    class State;

    std::shared_ptr<State> m_state;

  public:
    explicit ShutdownGroup(ShutdownGroupConfig config = {});

    /// @brief Forces a shutdown of every service if no shutdown was started.
    ///
    /// Runs ShutdownAll with an already fired force signal on a private io_context and blocks the calling
    /// thread until every service completed. Must not be called from a thread of the io_context the services
    /// depend on, or it deadlocks.
    ///
    /// A failure escapes to the caller, unless the group is destroyed while an exception is already
    /// propagating: then it is logged with a stack trace and the original exception continues.
    ~ShutdownGroup() noexcept(false);

    ShutdownGroup(const ShutdownGroup&) = delete;
    ShutdownGroup& operator=(const ShutdownGroup&) = delete;
    ShutdownGroup(ShutdownGroup&&) = delete;
    ShutdownGroup& operator=(ShutdownGroup&&) = delete;

    /// @brief Adds a service. Ownership is transferred to the group.
    /// @param service The service to add.
    /// @param name Name used in logs and in the ShutdownReport. Empty selects "service-<index>".
    /// @throws std::invalid_argument if service is null.
    void Push(std::unique_ptr<IGracefulService> service, std::string name = {});

    [[nodiscard]] std::size_t GetServiceCount() const noexcept;

    [[nodiscard]] bool IsShuttingDown() const noexcept;

    [[nodiscard]] const ShutdownGroupConfig& GetConfig() const noexcept;

    /// @brief Starts the one and only shutdown sequence of this group.
    ///
    /// The shutting-down flag is set immediately, before this function returns. The returned operation, once
    /// awaited, invokes ShutdownAsync on every service (each gets its own handle to the same force signal),
    /// spawns them all on the awaiting coroutine's executor and completes when every one of them has
    /// completed. A failing service does not stop the others.
    ///
    /// @param force Optional force signal handed to every service.
    /// @return Operation producing one record per service. With ShutdownFailurePolicy::Throw it throws a
    ///         Common::AggregateException instead when any service failed.
    /// @throws AlreadyShuttingDownException if a shutdown sequence was already started.
    [[nodiscard]] boost::asio::awaitable<ShutdownReport> ShutdownAll(std::optional<SharedSignal> force);

    /// @brief Waits for a termination request, then shuts the group down in two phases.
    ///
    /// The subscription to the source is taken before this function returns, so a notification published
    /// right after the call is not lost. On the first notification every service is asked to shut down with
    /// a force signal that fires on the next notification. If a shutdown was already started elsewhere, for
    /// example by destroying the group, the condition is logged and the operation completes.
    ///
    /// Once the shutdown sequence completed the force signal is fired and its subscription closed, which
    /// releases anything still waiting on it.
    ///
    /// @param source The termination notifications to listen to.
    [[nodiscard]] boost::asio::awaitable<void> WaitToTerminate(std::shared_ptr<TerminationSignalSource> source);

  private:
    static boost::asio::awaitable<ShutdownReport> RunShutdownAsync(std::shared_ptr<State> state, std::optional<SharedSignal> force);
    static boost::asio::awaitable<void> RunWaitToTerminateAsync(std::shared_ptr<State> state, std::shared_ptr<TerminationSignalSource> source,
                                                                std::shared_ptr<TerminationSubscription> subscription);
  };
}

#endif
