#ifndef GRACEFUL_SHUTDOWN_COMMON_AGGREGATEEXCEPTION_HPP
#define GRACEFUL_SHUTDOWN_COMMON_AGGREGATEEXCEPTION_HPP
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
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Common
{
  /// @brief Carries every failure produced by a group of operations that ran side by side.
  ///
  /// The inner failures are stored type-erased as std::exception_ptr in the order they were collected.
  /// Once constructed the exception is immutable.
  class AggregateException : public std::runtime_error
  {
    std::vector<std::exception_ptr> m_innerExceptions;

    static std::string ResolveMessage(const std::string& message)
    {
      return message.empty() ? std::string("One or more errors occurred.") : message;
    }

    static void ValidateNonEmpty(const std::vector<std::exception_ptr>& exceptions)
    {
      if (exceptions.empty())
      {
        throw std::invalid_argument("AggregateException requires at least one inner exception");
      }
    }

  public:
    /// @brief Creates the exception with the default message.
    /// @param innerExceptions The collected failures (must not be empty).
    /// @throws std::invalid_argument if innerExceptions is empty.
    explicit AggregateException(std::vector<std::exception_ptr> innerExceptions)
      : AggregateException(std::string(), std::move(innerExceptions))
    {
    }

    /// @brief Creates the exception with a custom message.
    /// @param message Summary of the failed operation, empty selects the default message.
    /// @param innerExceptions The collected failures (must not be empty).
    /// @throws std::invalid_argument if innerExceptions is empty.
    AggregateException(const std::string& message, std::vector<std::exception_ptr> innerExceptions)
      : std::runtime_error(ResolveMessage(message))
      , m_innerExceptions(std::move(innerExceptions))
    {
      ValidateNonEmpty(m_innerExceptions);
    }

    AggregateException(const AggregateException&) = default;
    AggregateException(AggregateException&&) = default;
    AggregateException& operator=(const AggregateException&) = delete;
    AggregateException& operator=(AggregateException&&) = delete;

    const std::vector<std::exception_ptr>& GetInnerExceptions() const noexcept
    {
      return m_innerExceptions;
    }

    std::size_t InnerExceptionCount() const noexcept
    {
      return m_innerExceptions.size();
    }

    /// @brief Returns a copy where nested AggregateExceptions are replaced by their own inner exceptions.
    AggregateException Flatten() const
    {
      std::vector<std::exception_ptr> flattened;
      FlattenInto(m_innerExceptions, flattened);
      return AggregateException(what(), std::move(flattened));
    }

    /// @brief Describes the exception and every inner failure, one per line.
    std::string ToString() const
    {
      std::ostringstream oss;
      oss << what();
      for (std::size_t i = 0; i < m_innerExceptions.size(); ++i)
      {
        oss << "\n  [" << i << "] " << Describe(m_innerExceptions[i]);
      }
      return oss.str();
    }

    /// @brief Extracts the message of a type-erased failure.
    static std::string Describe(const std::exception_ptr& exception)
    {
      if (!exception)
      {
        return "(null exception)";
      }
      try
      {
        std::rethrow_exception(exception);
      }
      catch (const std::exception& ex)
      {
        return ex.what();
      }
      catch (...)
      {
        return "(unknown exception type)";
      }
    }

    std::vector<std::exception_ptr>::const_iterator begin() const noexcept
    {
      return m_innerExceptions.begin();
    }

    std::vector<std::exception_ptr>::const_iterator end() const noexcept
    {
      return m_innerExceptions.end();
    }

  private:
    static void FlattenInto(const std::vector<std::exception_ptr>& exceptions, std::vector<std::exception_ptr>& result)
    {
      for (const auto& exPtr : exceptions)
      {
        if (!exPtr)
        {
          continue;
        }
        try
        {
          std::rethrow_exception(exPtr);
        }
        catch (const AggregateException& nested)
        {
          FlattenInto(nested.GetInnerExceptions(), result);
        }
        catch (...)
        {
          // Leaf failure
          result.push_back(exPtr);
        }
      }
    }
  };
}

#endif
