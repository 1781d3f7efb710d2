#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_DETAIL_PENDINGCOMPLETION_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_DETAIL_PENDINGCOMPLETION_HPP
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

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <memory>
#include <utility>

namespace Graceful::Detail
{
  /// @brief Type-erased completion handler with signature void() that is waiting for an event.
  class IPendingCompletion
  {
  public:
    virtual ~IPendingCompletion() = default;

    /// @brief Delivers the completion. Must be called at most once.
    virtual void Complete() = 0;
  };

  /// @brief Stores a completion handler and keeps its executor busy until the completion is delivered.
  ///
  /// Without the tracked work an io_context could run out of work and return from run() while a coroutine
  /// is still suspended on the event. Complete() posts the handler, so it never runs inline on the thread
  /// that triggered the event.
  template <typename THandler>
  class PendingCompletion final : public IPendingCompletion
  {
    using work_executor_type = std::decay_t<decltype(boost::asio::prefer(std::declval<boost::asio::associated_executor_t<THandler>>(),
                                                                         boost::asio::execution::outstanding_work.tracked))>;

    THandler m_handler;
    work_executor_type m_workExecutor;

  public:
    explicit PendingCompletion(THandler handler)
      : m_handler(std::move(handler))
      , m_workExecutor(boost::asio::prefer(boost::asio::get_associated_executor(m_handler), boost::asio::execution::outstanding_work.tracked))
    {
    }

    void Complete() override
    {
      boost::asio::post(m_workExecutor, std::move(m_handler));
    }
  };

  template <typename THandler>
  std::unique_ptr<IPendingCompletion> MakePendingCompletion(THandler&& handler)
  {
    return std::make_unique<PendingCompletion<std::decay_t<THandler>>>(std::forward<THandler>(handler));
  }
}

#endif
