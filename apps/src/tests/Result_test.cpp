#include "core/Result.h"

#include <gtest/gtest.h>
#include <memory>
#include <string>

using namespace GenePool;

TEST(ResultTest, OkayHoldsValue)
{
    auto result = Result<int, std::string>::okay(42);

    EXPECT_TRUE(result.isValue());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorHoldsErrorValue)
{
    auto result = Result<int, std::string>::error("bad input");

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue(), "bad input");
}

TEST(ResultTest, SameTypeForValueAndErrorStaysDistinct)
{
    auto okay = Result<std::string, std::string>::okay("value");
    auto error = Result<std::string, std::string>::error("error");

    EXPECT_TRUE(okay.isValue());
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(okay.value(), "value");
    EXPECT_EQ(error.errorValue(), "error");
}

TEST(ResultTest, MoveOnlyValueCanBeTakenOut)
{
    auto result = Result<std::unique_ptr<int>, std::string>::okay(std::make_unique<int>(7));

    std::unique_ptr<int> taken = std::move(result).value();

    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 7);
}
