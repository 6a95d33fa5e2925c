#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

struct TestError : pl::RoeErrorBase {
  using pl::RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = pl::ResultOrError<T, TestError>;

Roe<int> half(int value) {
  if (value % 2 != 0) {
    return TestError(7, "odd value " + std::to_string(value));
  }
  return value / 2;
}

Roe<void> check(bool ok) {
  if (!ok) {
    return TestError("check failed");
  }
  return {};
}

} // namespace

TEST(ResultOrErrorTest, HoldsValue) {
  auto result = half(10);
  ASSERT_TRUE(result.isOk());
  EXPECT_FALSE(result.isError());
  EXPECT_TRUE(static_cast<bool>(result));
  EXPECT_EQ(result.value(), 5);
  EXPECT_EQ(*result, 5);
}

TEST(ResultOrErrorTest, HoldsError) {
  auto result = half(3);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 7);
  EXPECT_EQ(result.error().message, "odd value 3");
  EXPECT_EQ(result.valueOr(-1), -1);
}

TEST(ResultOrErrorTest, WrongAccessorThrows) {
  auto ok = half(4);
  auto bad = half(5);
  EXPECT_THROW(ok.error(), std::logic_error);
  EXPECT_THROW(bad.value(), std::logic_error);
}

TEST(ResultOrErrorTest, MessageOnlyErrorHasDefaultCode) {
  auto result = check(false);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, -1);
  EXPECT_TRUE(check(true).isOk());
}

TEST(ResultOrErrorTest, CopyAndAssignSwitchSides) {
  Roe<std::string> result = std::string("value");
  Roe<std::string> copy = result;
  EXPECT_EQ(copy.value(), "value");

  copy = TestError(2, "now an error");
  ASSERT_TRUE(copy.isError());
  EXPECT_EQ(copy.error().code, 2);

  copy = std::string("value again");
  ASSERT_TRUE(copy.isOk());
  EXPECT_EQ(copy->size(), 11u);
}

TEST(ResultOrErrorTest, MoveOnlyValue) {
  Roe<std::unique_ptr<int>> result = std::make_unique<int>(42);
  Roe<std::unique_ptr<int>> moved = std::move(result);
  ASSERT_TRUE(moved.isOk());
  EXPECT_EQ(**moved, 42);
}
