#ifndef GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNREPORT_HPP
#define GRACEFUL_SHUTDOWN_GRACEFUL_GROUP_SHUTDOWNREPORT_HPP
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
#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace Graceful
{
  /// @brief Outcome of one service's shutdown.
  struct ServiceShutdownRecord
  {
    std::string ServiceName;
    /// @brief The failure thrown by the service, null on success.
    std::exception_ptr Error;
    std::chrono::nanoseconds Duration{};

    [[nodiscard]] bool Succeeded() const noexcept
    {
      return !Error;
    }
  };

  /// @brief Result of a ShutdownGroup::ShutdownAll sequence, one record per service in registration order.
  class ShutdownReport
  {
    std::vector<ServiceShutdownRecord> m_records;

  public:
    ShutdownReport() = default;

    explicit ShutdownReport(std::vector<ServiceShutdownRecord> records)
      : m_records(std::move(records))
    {
    }

    [[nodiscard]] const std::vector<ServiceShutdownRecord>& GetRecords() const noexcept
    {
      return m_records;
    }

    [[nodiscard]] std::size_t GetServiceCount() const noexcept
    {
      return m_records.size();
    }

    [[nodiscard]] std::size_t GetFailureCount() const noexcept
    {
      std::size_t count = 0;
      for (const auto& record : m_records)
      {
        if (!record.Succeeded())
        {
          ++count;
        }
      }
      return count;
    }

    [[nodiscard]] bool HasFailures() const noexcept
    {
      return GetFailureCount() > 0;
    }

    /// @brief The failures in registration order.
    [[nodiscard]] std::vector<std::exception_ptr> GetFailures() const
    {
      std::vector<std::exception_ptr> failures;
      for (const auto& record : m_records)
      {
        if (!record.Succeeded())
        {
          failures.push_back(record.Error);
        }
      }
      return failures;
    }

    /// @brief Throws a Common::AggregateException with every failure, does nothing if all services succeeded.
    void ThrowIfFailed() const
    {
      if (HasFailures())
      {
        throw Common::AggregateException("Service shutdown failed", GetFailures());
      }
    }
  };
}

#endif
