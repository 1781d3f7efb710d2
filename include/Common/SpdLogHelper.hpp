#ifndef GRACEFUL_SHUTDOWN_COMMON_SPDLOGHELPER_HPP
#define GRACEFUL_SHUTDOWN_COMMON_SPDLOGHELPER_HPP
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

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace Common::SpdLogHelper
{
  /// @brief Gets or creates a logger with the specified name.
  ///
  /// A logger created here reuses the sinks and level of the default logger, so the application configures
  /// output once and every component follows. spdlog's registry is thread-safe.
  /// @param name The logger name.
  /// @return Shared pointer to the logger.
  inline std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
  {
    auto log = spdlog::get(name);
    if (!log)
    {
      auto defaultLogger = spdlog::default_logger();
      log = std::make_shared<spdlog::logger>(name, defaultLogger->sinks().begin(), defaultLogger->sinks().end());
      log->set_level(defaultLogger->level());
      try
      {
        spdlog::register_logger(log);
      }
      catch (const spdlog::spdlog_ex&)
      {
        // Another thread registered the same name first
        return spdlog::get(name);
      }
    }
    return log;
  }

  /// @brief Cached variant of GetLogger for loggers with a compile-time name.
  /// @tparam Name Type exposing a static constexpr std::string_view value (see GRACEFUL_SHUTDOWN_LOGGER_NAME).
  template <typename Name>
  inline std::shared_ptr<spdlog::logger> GetLogger()
  {
    static const auto logger = GetLogger(std::string(Name::value));
    return logger;
  }
}

// Defines a compile-time logger name type
#define GRACEFUL_SHUTDOWN_LOGGER_NAME(name)          \
  struct LoggerName_##name                           \
  {                                                  \
    static constexpr std::string_view value = #name; \
  }

#endif
