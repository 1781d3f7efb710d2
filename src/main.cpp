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

#include <Demo/DrainService.hpp>
#include <Demo/TickerService.hpp>
#include <Graceful/Group/ShutdownGroup.hpp>
#include <Graceful/Termination/TerminationSignalSource.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string_view>

namespace
{
  void PrintUsage()
  {
    std::cout << "Usage: GracefulShutdownDemo [--fail-fast]\n"
              << "  --fail-fast  Report failed service shutdowns as an error\n"
              << "Log levels are read from SPDLOG_LEVEL (for example SPDLOG_LEVEL=debug).\n";
  }
}

int main(int argc, char* argv[])
{
  spdlog::cfg::load_env_levels();

  Graceful::ShutdownGroupConfig config;
  for (int i = 1; i < argc; ++i)
  {
    const std::string_view arg(argv[i]);
    if (arg == "--fail-fast")
    {
      config.FailurePolicy = Graceful::ShutdownFailurePolicy::Throw;
    }
    else if (arg == "--help" || arg == "-h")
    {
      PrintUsage();
      return EXIT_SUCCESS;
    }
    else
    {
      std::cerr << "Unknown argument: " << arg << "\n";
      PrintUsage();
      return EXIT_FAILURE;
    }
  }

  try
  {
    boost::asio::io_context ioContext;
    auto source = Graceful::InstallTerminationHandle(ioContext.get_executor());

    auto group = std::make_unique<Graceful::ShutdownGroup>(config);

    auto ticker = std::make_unique<Demo::TickerService>(ioContext.get_executor(), std::chrono::milliseconds(500));
    ticker->Start();
    group->Push(std::move(ticker), "ticker");
    group->Push(std::make_unique<Demo::DrainService>(std::chrono::seconds(5)), "drain");

    int exitCode = EXIT_SUCCESS;
    boost::asio::co_spawn(ioContext, group->WaitToTerminate(source),
                          [&](std::exception_ptr ex)
                          {
                            if (ex)
                            {
                              try
                              {
                                std::rethrow_exception(ex);
                              }
                              catch (const std::exception& error)
                              {
                                spdlog::error("Shutdown failed: {}", error.what());
                              }
                              exitCode = EXIT_FAILURE;
                            }
                            // The OS signal wait of the termination handle stays pending until the handle is released
                            ioContext.stop();
                          });

    spdlog::info("Running. Press Ctrl + C to shut down, press it again to force.");
    ioContext.run();

    group.reset();
    spdlog::info("Stopped");
    return exitCode;
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Fatal error: {}", ex.what());
    return EXIT_FAILURE;
  }
}
