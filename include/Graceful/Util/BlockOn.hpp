#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_BLOCKON_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_BLOCKON_HPP
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

#include <utility>    // Must precede Boost.Asio 1.74 awaitable.hpp, which uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace Graceful::Util
{
  /// @brief Runs an awaitable to completion on a private io_context, blocking the calling thread.
  ///
  /// This is the bridge from synchronous code (destructors) into the coroutine world. The operation and
  /// everything it spawns on its own executor run on the calling thread.
  ///
  /// Never call this from a thread that runs the io_context the operation depends on: that context can
  /// no longer make progress while the thread is blocked here, and the call deadlocks.
  ///
  /// @param operation The awaitable to run.
  /// @return The value produced by the awaitable.
  /// @throws Whatever the awaitable throws.
  /// @throws std::runtime_error if the operation was abandoned without completing.
  template <typename T>
  T BlockOn(boost::asio::awaitable<T> operation)
  {
    boost::asio::io_context ioContext(1);
    bool completed = false;
    std::exception_ptr failure;

    if constexpr (std::is_void_v<T>)
    {
      boost::asio::co_spawn(ioContext, std::move(operation),
                            [&](std::exception_ptr ex)
                            {
                              completed = true;
                              failure = ex;
                            });
      ioContext.run();

      if (failure)
      {
        std::rethrow_exception(failure);
      }
      if (!completed)
      {
        throw std::runtime_error("BlockOn: the operation was abandoned before it completed");
      }
    }
    else
    {
      std::optional<T> result;
      boost::asio::co_spawn(ioContext, std::move(operation),
                            [&](std::exception_ptr ex, T value)
                            {
                              completed = true;
                              failure = ex;
                              if (!ex)
                              {
                                result.emplace(std::move(value));
                              }
                            });
      ioContext.run();

      if (failure)
      {
        std::rethrow_exception(failure);
      }
      if (!completed || !result)
      {
        throw std::runtime_error("BlockOn: the operation was abandoned before it completed");
      }
      return std::move(*result);
    }
  }
}

#endif
