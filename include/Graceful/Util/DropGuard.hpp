#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_DROPGUARD_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_UTIL_DROPGUARD_HPP
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

#include <exception>
#include <utility>

namespace Graceful::Util
{
  namespace Detail
  {
    /// @brief Logs a failure raised while another exception was already propagating, with a stack trace.
    void ReportSecondaryFailure(const std::exception_ptr& failure) noexcept;
  }

  /// @brief Runs cleanup code from a destructor without losing failures.
  ///
  /// If the callback throws while the thread is already unwinding from another exception, rethrowing would
  /// call std::terminate and hide the original failure. In that case the secondary failure is logged with a
  /// stack trace and dropped, so the original exception keeps propagating. Outside of unwinding the failure
  /// is rethrown to the caller.
  ///
  /// @param func The cleanup callback.
  template <typename TFunc>
  void DropGuard(TFunc&& func)
  {
    const bool alreadyUnwinding = std::uncaught_exceptions() > 0;
    try
    {
      std::forward<TFunc>(func)();
    }
    catch (...)
    {
      if (!alreadyUnwinding)
      {
        throw;
      }
      Detail::ReportSecondaryFailure(std::current_exception());
    }
  }
}

#endif
