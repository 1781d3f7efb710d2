#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_SIGNAL_SHAREDSIGNAL_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_SIGNAL_SHAREDSIGNAL_HPP
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

#include <Graceful/Util/Detail/PendingCompletion.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace Graceful
{
  /// @brief Broadcast-once notification that any number of holders can wait on.
  ///
  /// SharedSignal is a cheap handle: copies share the same underlying state. The signal is either pending or
  /// fired, and once fired it stays fired. Every waiter registered before the firing is woken, every waiter
  /// registered afterwards completes right away. An "unset" signal is modelled by an empty
  /// std::optional<SharedSignal>.
  ///
  /// A signal created from a producer awaitable fires when the producer completes. The producer is spawned
  /// lazily by the first waiter and runs exactly once no matter how many holders wait. IsFired() does not
  /// start the producer.
  ///
  /// All members are thread-safe. Completions are posted to the waiter's executor.
  class SharedSignal
  {
    class State
    {
      mutable std::mutex m_mutex;
      bool m_fired{false};
      std::optional<boost::asio::any_io_executor> m_producerExecutor;
      std::optional<boost::asio::awaitable<void>> m_producer;
      std::vector<std::unique_ptr<Detail::IPendingCompletion>> m_waiters;

    public:
      State() = default;
      State(boost::asio::any_io_executor producerExecutor, boost::asio::awaitable<void> producer);

      bool IsFired() const;
      void Fire();

      /// @brief Queues the waiter, or completes it at once if already fired. Starts the producer if needed.
      static void AddWaiter(const std::shared_ptr<State>& state, std::unique_ptr<Detail::IPendingCompletion> waiter);
    };

    std::shared_ptr<State> m_state;

    explicit SharedSignal(std::shared_ptr<State> state)
      : m_state(std::move(state))
    {
    }

  public:
    /// @brief Creates a pending signal that fires when the producer completes.
    /// @param executor Executor the producer is spawned on.
    /// @param producer The awaitable whose completion fires the signal. A failing producer fires it as well.
    SharedSignal(boost::asio::any_io_executor executor, boost::asio::awaitable<void> producer);

    /// @brief Creates a pending signal that only fires when Fire() is called.
    static SharedSignal CreateManual();

    /// @brief Creates a signal that has already fired.
    static SharedSignal CreateFired();

    /// @brief Fires the signal. Calling it again has no effect.
    void Fire()
    {
      m_state->Fire();
    }

    [[nodiscard]] bool IsFired() const
    {
      return m_state->IsFired();
    }

    /// @brief Waits until the signal has fired.
    /// @param token Completion token with signature void().
    template <typename TCompletionToken>
    auto AsyncWait(TCompletionToken&& token) const
    {
      return boost::asio::async_initiate<TCompletionToken, void()>(
        [state = m_state](auto handler) { State::AddWaiter(state, Detail::MakePendingCompletion(std::move(handler))); }, token);
    }

    /// @brief Coroutine friendly form of AsyncWait.
    boost::asio::awaitable<void> WaitAsync() const
    {
      return AsyncWait(boost::asio::use_awaitable);
    }

    /// @brief True if both handles refer to the same signal.
    bool operator==(const SharedSignal& other) const noexcept
    {
      return m_state == other.m_state;
    }
  };
}

#endif
