#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_SERVICE_IGRACEFULSERVICE_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_SERVICE_IGRACEFULSERVICE_HPP
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

#include <Graceful/Signal/SharedSignal.hpp>
#include <boost/asio/awaitable.hpp>
#include <optional>

namespace Graceful
{
  /// @brief A service that can be stopped gracefully, with an optional request to hurry up.
  class IGracefulService
  {
  public:
    virtual ~IGracefulService() = default;

    /// @brief Stops the service and completes once its cleanup is done.
    ///
    /// When a force signal is supplied the caller may fire it if the graceful stop takes too long. Once it
    /// fires the service should abandon the remaining graceful work and return as soon as practical. A
    /// service without blocking work is free to ignore it. The operation must eventually complete.
    ///
    /// @param force Shared force signal, or std::nullopt if the caller will never force the shutdown.
    /// @throws Any std::exception derived type to report a failed shutdown.
    virtual boost::asio::awaitable<void> ShutdownAsync(std::optional<SharedSignal> force) = 0;
  };
}

#endif
