#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNGROUPCONFIG_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNGROUPCONFIG_HPP
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

#include <cstdint>

namespace Graceful
{
  /// @brief Decides how the composite shutdown operation reports failed services.
  enum class ShutdownFailurePolicy : uint8_t
  {
    /// @brief Complete normally and leave the failures in the ShutdownReport.
    Collect,
    /// @brief Throw a Common::AggregateException with every failure once all services have finished.
    Throw
  };

  /// @brief Configuration for ShutdownGroup.
  struct ShutdownGroupConfig
  {
    ShutdownFailurePolicy FailurePolicy{ShutdownFailurePolicy::Collect};

    constexpr ShutdownGroupConfig() noexcept = default;

    constexpr explicit ShutdownGroupConfig(ShutdownFailurePolicy failurePolicy) noexcept
      : FailurePolicy(failurePolicy)
    {
    }
  };
}

#endif
