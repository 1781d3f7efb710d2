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

#include <Graceful/Util/BlockOn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

namespace Graceful::Util
{
  namespace
  {
    boost::asio::awaitable<int> DelayedValue(int value)
    {
      auto executor = co_await boost::asio::this_coro::executor;
      boost::asio::steady_timer timer(executor, std::chrono::milliseconds(10));
      co_await timer.async_wait(boost::asio::use_awaitable);
      co_return value;
    }

    boost::asio::awaitable<std::string> Concatenate(std::string lhs, std::string rhs)
    {
      co_return lhs + rhs;
    }

    boost::asio::awaitable<void> RecordThread(std::thread::id* threadId)
    {
      *threadId = std::this_thread::get_id();
      co_return;
    }

    boost::asio::awaitable<void> Fail()
    {
      throw std::runtime_error("operation failed");
      co_return;
    }
  }

  TEST(BlockOnTest, ReturnsTheValue)
  {
    EXPECT_EQ(BlockOn(DelayedValue(42)), 42);
    EXPECT_EQ(BlockOn(Concatenate("graceful", "-shutdown")), "graceful-shutdown");
  }

  TEST(BlockOnTest, RunsOnTheCallingThread)
  {
    std::thread::id threadId;
    BlockOn(RecordThread(&threadId));
    EXPECT_EQ(threadId, std::this_thread::get_id());
  }

  TEST(BlockOnTest, RethrowsFailure)
  {
    EXPECT_THROW(BlockOn(Fail()), std::runtime_error);
  }

  TEST(BlockOnTest, CanBeCalledRepeatedly)
  {
    for (int i = 0; i < 3; ++i)
    {
      EXPECT_EQ(BlockOn(DelayedValue(i)), i);
    }
  }
}
