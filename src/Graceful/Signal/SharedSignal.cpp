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
#include <Graceful/Signal/SharedSignal.hpp>
#include <boost/asio/co_spawn.hpp>

namespace Graceful
{
  namespace
  {
    GRACEFUL_SHUTDOWN_LOGGER_NAME(SharedSignal);
  }

  SharedSignal::State::State(boost::asio::any_io_executor producerExecutor, boost::asio::awaitable<void> producer)
    : m_producerExecutor(std::move(producerExecutor))
    , m_producer(std::move(producer))
  {
  }

  bool SharedSignal::State::IsFired() const
  {
    std::lock_guard lock(m_mutex);
    return m_fired;
  }

  void SharedSignal::State::Fire()
  {
    std::vector<std::unique_ptr<Detail::IPendingCompletion>> waiters;
    {
      std::lock_guard lock(m_mutex);
      if (m_fired)
      {
        return;
      }
      m_fired = true;
      // A producer that never started is no longer needed
      m_producer.reset();
      waiters.swap(m_waiters);
    }

    for (auto& waiter : waiters)
    {
      waiter->Complete();
    }
  }

  void SharedSignal::State::AddWaiter(const std::shared_ptr<State>& state, std::unique_ptr<Detail::IPendingCompletion> waiter)
  {
    std::optional<boost::asio::awaitable<void>> producer;
    {
      std::lock_guard lock(state->m_mutex);
      if (!state->m_fired)
      {
        state->m_waiters.push_back(std::move(waiter));
        if (state->m_producer)
        {
          producer.emplace(std::move(*state->m_producer));
          state->m_producer.reset();
        }
      }
    }

    if (waiter)
    {
      // Already fired
      waiter->Complete();
      return;
    }

    if (producer)
    {
      boost::asio::co_spawn(*state->m_producerExecutor, std::move(*producer),
                            [state](std::exception_ptr ex)
                            {
                              if (ex)
                              {
                                Common::SpdLogHelper::GetLogger<LoggerName_SharedSignal>()->warn(
                                  "Signal producer failed, firing the signal anyway: {}", Common::AggregateException::Describe(ex));
                              }
                              state->Fire();
                            });
    }
  }

  SharedSignal::SharedSignal(boost::asio::any_io_executor executor, boost::asio::awaitable<void> producer)
    : m_state(std::make_shared<State>(std::move(executor), std::move(producer)))
  {
  }

  SharedSignal SharedSignal::CreateManual()
  {
    return SharedSignal(std::make_shared<State>());
  }

  SharedSignal SharedSignal::CreateFired()
  {
    auto state = std::make_shared<State>();
    state->Fire();
    return SharedSignal(std::move(state));
  }
}
