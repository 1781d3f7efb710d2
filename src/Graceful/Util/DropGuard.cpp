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
#include <Graceful/Util/DropGuard.hpp>
#include <boost/stacktrace.hpp>
#include <iostream>
#include <string>

namespace Graceful::Util::Detail
{
  namespace
  {
    GRACEFUL_SHUTDOWN_LOGGER_NAME(Unwind);
  }

  void ReportSecondaryFailure(const std::exception_ptr& failure) noexcept
  {
    try
    {
      const std::string trace = boost::stacktrace::to_string(boost::stacktrace::stacktrace());
      auto logger = Common::SpdLogHelper::GetLogger<LoggerName_Unwind>();
      logger->critical("Failure while already unwinding from another exception: {}\n{}", Common::AggregateException::Describe(failure), trace);
      logger->flush();
    }
    catch (const std::exception& ex)
    {
      // Logging itself failed, fall back to stderr
      std::cerr << "Failure while already unwinding from another exception (logging failed: " << ex.what() << ")\n";
    }
  }
}
