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

#include <Graceful/Termination/TerminationSignalSource.hpp>
#include <algorithm>

namespace Graceful
{
  bool TerminationSubscription::Deliver()
  {
    std::unique_ptr<Detail::IPendingCompletion> receiver;
    {
      std::lock_guard lock(m_mutex);
      if (m_closed)
      {
        return false;
      }
      if (m_receivers.empty())
      {
        ++m_pending;
        return true;
      }
      receiver = std::move(m_receivers.front());
      m_receivers.pop_front();
    }
    receiver->Complete();
    return true;
  }

  void TerminationSubscription::AddReceiver(std::unique_ptr<Detail::IPendingCompletion> receiver)
  {
    {
      std::lock_guard lock(m_mutex);
      if (!m_closed)
      {
        if (m_pending == 0)
        {
          m_receivers.push_back(std::move(receiver));
          return;
        }
        --m_pending;
      }
    }
    receiver->Complete();
  }

  uint64_t TerminationSubscription::GetPendingCount() const
  {
    std::lock_guard lock(m_mutex);
    return m_pending;
  }

  bool TerminationSubscription::IsClosed() const
  {
    std::lock_guard lock(m_mutex);
    return m_closed;
  }

  void TerminationSubscription::Close()
  {
    std::deque<std::unique_ptr<Detail::IPendingCompletion>> receivers;
    {
      std::lock_guard lock(m_mutex);
      if (m_closed)
      {
        return;
      }
      m_closed = true;
      m_pending = 0;
      receivers.swap(m_receivers);
    }

    // Pending receivers are woken, never dropped
    for (auto& receiver : receivers)
    {
      receiver->Complete();
    }
  }

  std::shared_ptr<TerminationSubscription> TerminationSignalSource::Subscribe()
  {
    auto subscription = std::make_shared<TerminationSubscription>();
    std::lock_guard lock(m_mutex);
    m_subscriptions.push_back(subscription);
    return subscription;
  }

  std::size_t TerminationSignalSource::Notify()
  {
    std::vector<std::shared_ptr<TerminationSubscription>> targets;
    {
      std::lock_guard lock(m_mutex);
      std::erase_if(m_subscriptions, [](const std::weak_ptr<TerminationSubscription>& entry) { return entry.expired(); });
      targets.reserve(m_subscriptions.size());
      for (const auto& entry : m_subscriptions)
      {
        if (auto subscription = entry.lock())
        {
          targets.push_back(std::move(subscription));
        }
      }
    }

    std::size_t delivered = 0;
    for (const auto& subscription : targets)
    {
      if (subscription->Deliver())
      {
        ++delivered;
      }
    }
    return delivered;
  }

  std::size_t TerminationSignalSource::GetSubscriberCount() const
  {
    std::lock_guard lock(m_mutex);
    return static_cast<std::size_t>(
      std::count_if(m_subscriptions.begin(), m_subscriptions.end(), [](const std::weak_ptr<TerminationSubscription>& entry) { return !entry.expired(); }));
  }
}
