#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_TERMINATION_TERMINATIONSIGNALSOURCE_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_TERMINATION_TERMINATIONSIGNALSOURCE_HPP
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

#include <Graceful/Termination/TerminationSignalConfig.hpp>
#include <Graceful/Util/Detail/PendingCompletion.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace Graceful
{
  class TerminationSignalSource;

  /// @brief Receiving end of a TerminationSignalSource.
  ///
  /// Sees every notification published after it was created. Notifications that arrive while nobody is
  /// receiving are counted and handed out by later receive calls. Thread-safe.
  ///
  /// A closed subscription no longer accepts notifications, and every receive on it completes right away.
  class TerminationSubscription
  {
    friend class TerminationSignalSource;

    mutable std::mutex m_mutex;
    bool m_closed{false};
    uint64_t m_pending{0};
    std::deque<std::unique_ptr<Detail::IPendingCompletion>> m_receivers;

    /// @return false if the subscription is closed and the notification was not taken.
    bool Deliver();
    void AddReceiver(std::unique_ptr<Detail::IPendingCompletion> receiver);

  public:
    TerminationSubscription() = default;
    TerminationSubscription(const TerminationSubscription&) = delete;
    TerminationSubscription& operator=(const TerminationSubscription&) = delete;
    TerminationSubscription(TerminationSubscription&&) = delete;
    TerminationSubscription& operator=(TerminationSubscription&&) = delete;

    /// @brief Number of notifications received but not yet consumed.
    [[nodiscard]] uint64_t GetPendingCount() const;

    [[nodiscard]] bool IsClosed() const;

    /// @brief Stops taking notifications and completes every pending receive. Calling it again has no effect.
    void Close();

    /// @brief Consumes the next notification, waiting for one if none is pending.
    /// @param token Completion token with signature void().
    template <typename TCompletionToken>
    auto AsyncReceive(TCompletionToken&& token)
    {
      return boost::asio::async_initiate<TCompletionToken, void()>(
        [this](auto handler) { AddReceiver(Detail::MakePendingCompletion(std::move(handler))); }, token);
    }

    /// @brief Coroutine friendly form of AsyncReceive. The subscription must outlive the wait.
    boost::asio::awaitable<void> ReceiveAsync()
    {
      return AsyncReceive(boost::asio::use_awaitable);
    }
  };

  /// @brief Multi-consumer broadcast channel for termination requests.
  ///
  /// Each Notify() reaches every subscription alive at that moment. The OS bridge installed by
  /// InstallTerminationHandle publishes here, tests and embedding applications can publish directly.
  /// Thread-safe.
  class TerminationSignalSource
  {
    mutable std::mutex m_mutex;
    std::vector<std::weak_ptr<TerminationSubscription>> m_subscriptions;

  public:
    TerminationSignalSource() = default;
    TerminationSignalSource(const TerminationSignalSource&) = delete;
    TerminationSignalSource& operator=(const TerminationSignalSource&) = delete;
    TerminationSignalSource(TerminationSignalSource&&) = delete;
    TerminationSignalSource& operator=(TerminationSignalSource&&) = delete;

    /// @brief Creates a subscription that receives every notification published from now on.
    [[nodiscard]] std::shared_ptr<TerminationSubscription> Subscribe();

    /// @brief Publishes one notification.
    /// @return The number of live, open subscriptions that received it.
    std::size_t Notify();

    /// @brief Number of live subscriptions.
    [[nodiscard]] std::size_t GetSubscriberCount() const;
  };

  /// @brief Hooks the process termination signals into a new TerminationSignalSource.
  ///
  /// Every delivery of one of the configured signals publishes one notification and the hook re-arms itself.
  /// The hook lives as long as the executor's execution context and keeps it busy, so an io_context that
  /// runs it has to be stopped explicitly. Can be installed once per process; the returned source can be
  /// shared by any number of ShutdownGroups.
  ///
  /// A notification that cannot be delivered (the wait fails unexpectedly, publishing throws or nobody is
  /// subscribed) is fatal: it is logged and the process exits with EXIT_FAILURE.
  ///
  /// @param executor Executor the OS signals are dispatched on.
  /// @param config The signals to listen for.
  /// @return The source the notifications are published on.
  /// @throws TerminationHandleInstalledException if a handle has already been installed in this process.
  /// @throws boost::system::system_error if a signal cannot be registered.
  std::shared_ptr<TerminationSignalSource> InstallTerminationHandle(const boost::asio::any_io_executor& executor,
                                                                    const TerminationSignalConfig& config = {});
}

#endif
