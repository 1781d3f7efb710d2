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
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace Graceful
{
  namespace
  {
    boost::asio::awaitable<void> CountingProducer(std::shared_ptr<std::atomic<int>> runCount)
    {
      ++(*runCount);
      co_return;
    }

    boost::asio::awaitable<void> FailingProducer()
    {
      throw std::runtime_error("producer failed");
      co_return;
    }

    boost::asio::awaitable<void> WaitForSignal(SharedSignal signal, std::shared_ptr<std::atomic<int>> wokenCount)
    {
      co_await signal.WaitAsync();
      ++(*wokenCount);
    }

    bool IsReady(std::future<void>& future)
    {
      return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }
  }

  class SharedSignalTest : public ::testing::Test
  {
  protected:
    boost::asio::io_context m_ioContext;

    void TearDown() override
    {
      m_ioContext.stop();
      m_ioContext.restart();
    }
  };

  TEST_F(SharedSignalTest, Fire_WakesEveryWaiter)
  {
    // Arrange
    auto signal = SharedSignal::CreateManual();
    auto wokenCount = std::make_shared<std::atomic<int>>(0);
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 3; ++i)
    {
      futures.push_back(boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future));
    }

    m_ioContext.poll();
    EXPECT_EQ(wokenCount->load(), 0);
    EXPECT_FALSE(signal.IsFired());

    // Act
    signal.Fire();
    m_ioContext.run();

    // Assert
    EXPECT_TRUE(signal.IsFired());
    EXPECT_EQ(wokenCount->load(), 3);
    for (auto& future : futures)
    {
      EXPECT_NO_THROW(future.get());
    }
  }

  TEST_F(SharedSignalTest, WaitAfterFire_CompletesImmediately)
  {
    auto signal = SharedSignal::CreateManual();
    signal.Fire();

    auto wokenCount = std::make_shared<std::atomic<int>>(0);
    auto future = boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future);
    m_ioContext.run();

    EXPECT_TRUE(IsReady(future));
    EXPECT_EQ(wokenCount->load(), 1);
  }

  TEST_F(SharedSignalTest, CreateFired_IsFiredFromTheStart)
  {
    auto signal = SharedSignal::CreateFired();
    EXPECT_TRUE(signal.IsFired());

    auto wokenCount = std::make_shared<std::atomic<int>>(0);
    auto future = boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future);
    m_ioContext.run();

    EXPECT_EQ(wokenCount->load(), 1);
  }

  TEST_F(SharedSignalTest, FireTwice_HasNoFurtherEffect)
  {
    auto signal = SharedSignal::CreateManual();
    signal.Fire();
    EXPECT_NO_THROW(signal.Fire());
    EXPECT_TRUE(signal.IsFired());
  }

  TEST_F(SharedSignalTest, Copies_ShareTheSameState)
  {
    auto signal = SharedSignal::CreateManual();
    SharedSignal copy = signal;

    EXPECT_TRUE(copy == signal);
    EXPECT_FALSE(SharedSignal::CreateManual() == signal);

    copy.Fire();
    EXPECT_TRUE(signal.IsFired());
  }

  TEST_F(SharedSignalTest, Producer_RunsOnceForManyWaiters)
  {
    // Arrange
    auto runCount = std::make_shared<std::atomic<int>>(0);
    SharedSignal signal(m_ioContext.get_executor(), CountingProducer(runCount));
    auto wokenCount = std::make_shared<std::atomic<int>>(0);

    // Act
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i)
    {
      SharedSignal handle = signal;
      futures.push_back(boost::asio::co_spawn(m_ioContext, WaitForSignal(handle, wokenCount), boost::asio::use_future));
    }
    m_ioContext.run();

    // Assert
    EXPECT_EQ(runCount->load(), 1);
    EXPECT_EQ(wokenCount->load(), 4);
    EXPECT_TRUE(signal.IsFired());
  }

  TEST_F(SharedSignalTest, Producer_NotStartedWithoutWaiter)
  {
    auto runCount = std::make_shared<std::atomic<int>>(0);
    SharedSignal signal(m_ioContext.get_executor(), CountingProducer(runCount));

    m_ioContext.poll();

    EXPECT_EQ(runCount->load(), 0);
    EXPECT_FALSE(signal.IsFired());
  }

  TEST_F(SharedSignalTest, ManualFire_DropsProducerThatNeverStarted)
  {
    auto runCount = std::make_shared<std::atomic<int>>(0);
    SharedSignal signal(m_ioContext.get_executor(), CountingProducer(runCount));
    signal.Fire();

    auto wokenCount = std::make_shared<std::atomic<int>>(0);
    auto future = boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future);
    m_ioContext.run();

    EXPECT_EQ(runCount->load(), 0);
    EXPECT_EQ(wokenCount->load(), 1);
  }

  TEST_F(SharedSignalTest, FailingProducer_StillFiresTheSignal)
  {
    SharedSignal signal(m_ioContext.get_executor(), FailingProducer());
    auto wokenCount = std::make_shared<std::atomic<int>>(0);

    auto future = boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future);
    m_ioContext.run();

    EXPECT_NO_THROW(future.get());
    EXPECT_TRUE(signal.IsFired());
    EXPECT_EQ(wokenCount->load(), 1);
  }

  TEST_F(SharedSignalTest, FireFromAnotherThread_WakesWaiter)
  {
    // Arrange
    auto signal = SharedSignal::CreateManual();
    auto wokenCount = std::make_shared<std::atomic<int>>(0);
    auto future = boost::asio::co_spawn(m_ioContext, WaitForSignal(signal, wokenCount), boost::asio::use_future);
    std::thread ioThread([this] { m_ioContext.run(); });

    // Act
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    signal.Fire();

    // Assert
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    ioThread.join();
    EXPECT_EQ(wokenCount->load(), 1);
  }
}
