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
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace Common
{
  class CustomException : public std::runtime_error
  {
  public:
    explicit CustomException(const std::string& msg)
      : std::runtime_error(msg)
    {
    }
  };
}

using namespace Common;

TEST(AggregateExceptionTest, BasicConstructionWithVector)
{
  std::vector<std::exception_ptr> exceptions;
  exceptions.push_back(std::make_exception_ptr(std::runtime_error("Error 1")));
  exceptions.push_back(std::make_exception_ptr(std::logic_error("Error 2")));

  AggregateException aggEx(std::move(exceptions));
  EXPECT_EQ(aggEx.InnerExceptionCount(), 2u);
  EXPECT_EQ(std::string(aggEx.what()), "One or more errors occurred.");
}

TEST(AggregateExceptionTest, ConstructionWithCustomMessage)
{
  AggregateException aggEx("Service shutdown failed", {std::make_exception_ptr(std::runtime_error("Error 1"))});
  EXPECT_EQ(aggEx.InnerExceptionCount(), 1u);
  EXPECT_EQ(std::string(aggEx.what()), "Service shutdown failed");
}

TEST(AggregateExceptionTest, EmptyMessageSelectsDefault)
{
  AggregateException aggEx("", {std::make_exception_ptr(std::runtime_error("Error 1"))});
  EXPECT_EQ(std::string(aggEx.what()), "One or more errors occurred.");
}

TEST(AggregateExceptionTest, EmptyVectorThrows)
{
  std::vector<std::exception_ptr> emptyExceptions;
  EXPECT_THROW(AggregateException aggEx(std::move(emptyExceptions)), std::invalid_argument);
}

TEST(AggregateExceptionTest, GetInnerExceptionsKeepsOrder)
{
  AggregateException aggEx({std::make_exception_ptr(CustomException("First error")), std::make_exception_ptr(std::runtime_error("Second error"))});

  const auto& innerExceptions = aggEx.GetInnerExceptions();
  ASSERT_EQ(innerExceptions.size(), 2u);

  try
  {
    std::rethrow_exception(innerExceptions[0]);
    FAIL() << "Exception should have been thrown";
  }
  catch (const CustomException& ex)
  {
    EXPECT_EQ(std::string(ex.what()), "First error");
  }
}

TEST(AggregateExceptionTest, IteratorSupport)
{
  AggregateException aggEx({std::make_exception_ptr(std::runtime_error("Error 1")), std::make_exception_ptr(std::runtime_error("Error 2")),
                            std::make_exception_ptr(std::runtime_error("Error 3"))});

  int count = 0;
  for (const auto& exPtr : aggEx)
  {
    EXPECT_NE(exPtr, nullptr);
    count++;
  }
  EXPECT_EQ(count, 3);
}

TEST(AggregateExceptionTest, FlattenNested)
{
  AggregateException inner1(
    {std::make_exception_ptr(std::runtime_error("Inner1-Error1")), std::make_exception_ptr(std::runtime_error("Inner1-Error2"))});
  AggregateException inner2({std::make_exception_ptr(std::logic_error("Inner2-Error1"))});

  AggregateException outer(
    {std::make_exception_ptr(inner1), std::make_exception_ptr(std::runtime_error("Outer-Error1")), std::make_exception_ptr(inner2)});
  ASSERT_EQ(outer.InnerExceptionCount(), 3u);

  auto flattened = outer.Flatten();
  EXPECT_EQ(flattened.InnerExceptionCount(), 4u);
  EXPECT_EQ(std::string(flattened.what()), std::string(outer.what()));
  EXPECT_EQ(AggregateException::Describe(flattened.GetInnerExceptions()[0]), "Inner1-Error1");
  EXPECT_EQ(AggregateException::Describe(flattened.GetInnerExceptions()[2]), "Outer-Error1");
}

TEST(AggregateExceptionTest, FlattenDeeplyNested)
{
  AggregateException level3({std::make_exception_ptr(std::runtime_error("Level3-Error"))});
  AggregateException level2({std::make_exception_ptr(level3), std::make_exception_ptr(std::logic_error("Level2-Error"))});
  AggregateException level1({std::make_exception_ptr(level2), std::make_exception_ptr(CustomException("Level1-Error"))});

  auto flattened = level1.Flatten();
  EXPECT_EQ(flattened.InnerExceptionCount(), 3u);
}

TEST(AggregateExceptionTest, FlattenSkipsNullEntries)
{
  AggregateException aggEx({std::exception_ptr(), std::make_exception_ptr(std::runtime_error("Error 1"))});

  auto flattened = aggEx.Flatten();
  EXPECT_EQ(flattened.InnerExceptionCount(), 1u);
}

TEST(AggregateExceptionTest, ToStringListsEveryFailure)
{
  AggregateException aggEx({std::make_exception_ptr(std::runtime_error("Error 1")), std::make_exception_ptr(std::logic_error("Error 2"))});

  std::string str = aggEx.ToString();
  EXPECT_NE(str.find("One or more errors occurred."), std::string::npos);
  EXPECT_NE(str.find("[0] Error 1"), std::string::npos);
  EXPECT_NE(str.find("[1] Error 2"), std::string::npos);
}

TEST(AggregateExceptionTest, DescribeHandlesNullAndUnknownExceptions)
{
  EXPECT_EQ(AggregateException::Describe(std::exception_ptr()), "(null exception)");
  EXPECT_EQ(AggregateException::Describe(std::make_exception_ptr(42)), "(unknown exception type)");
  EXPECT_EQ(AggregateException::Describe(std::make_exception_ptr(CustomException("Custom error"))), "Custom error");
}

TEST(AggregateExceptionTest, CopyConstructor)
{
  AggregateException original({std::make_exception_ptr(std::runtime_error("Error 1")), std::make_exception_ptr(std::logic_error("Error 2"))});

  AggregateException copy = original;
  EXPECT_EQ(copy.InnerExceptionCount(), 2u);
  EXPECT_EQ(std::string(copy.what()), std::string(original.what()));
}

TEST(AggregateExceptionTest, ThrowAndCatchAsRuntimeError)
{
  try
  {
    throw AggregateException({std::make_exception_ptr(std::runtime_error("Error 1"))});
  }
  catch (const std::runtime_error& ex)
  {
    EXPECT_EQ(std::string(ex.what()), "One or more errors occurred.");
    return;
  }
  FAIL() << "AggregateException should be catchable as std::runtime_error";
}
