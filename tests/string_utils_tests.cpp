#include <gtest/gtest.h>

#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <string>
#include <vector>

TEST(StringUtilsTest, Trim) {
    EXPECT_EQ(trim("  10 MiB \t\n"), "10 MiB");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(StringUtilsTest, SmallHelpers) {
    EXPECT_EQ(toLower("MiB"), "mib");
    EXPECT_EQ(join({ "B", "kB", "MB" }, ", "), "B, kB, MB");
    EXPECT_EQ(join({}, ", "), "");

    EXPECT_TRUE(isDigits("0123"));
    EXPECT_FALSE(isDigits(""));
    EXPECT_FALSE(isDigits("-1"));
    EXPECT_FALSE(isDigits("1.0"));

    EXPECT_TRUE(endsWith("10KiB", "KiB"));
    EXPECT_TRUE(endsWith("B", "B"));
    EXPECT_FALSE(endsWith("10KiB", "kB"));
    EXPECT_FALSE(endsWith("B", "KiB"));
}

TEST(StringUtilsTest, ParseDouble) {
    EXPECT_DOUBLE_EQ(parseDouble("1.5").getValue(), 1.5);
    EXPECT_DOUBLE_EQ(parseDouble(" -2e3 ").getValue(), -2000.0);
    EXPECT_DOUBLE_EQ(parseDouble(".5").getValue(), 0.5);

    // Underflow is just zero
    Result<double> underflow = parseDouble("1e-400");
    ASSERT_TRUE(underflow.isValue());
    EXPECT_DOUBLE_EQ(underflow.getValue(), 0.0);

    for (const std::string& input : { "", "abc", "1.5x", "0x1p3", "1 2" }) {
        Result<double> result = parseDouble(input);
        ASSERT_TRUE(result.isError()) << input;
        EXPECT_EQ(result.getErrorKind(), ErrorKind::Parse) << input;
    }

    Result<double> overflow = parseDouble("-1e999");
    ASSERT_TRUE(overflow.isError());
    EXPECT_EQ(overflow.getErrorKind(), ErrorKind::Overflow);
}

TEST(StringUtilsTest, FormatFixedPoint) {
    EXPECT_EQ(formatFixedPoint(1.0, 0), "1");
    EXPECT_EQ(formatFixedPoint(2.345, 1), "2.3");
    EXPECT_EQ(formatFixedPoint(0.5, 3), "0.500");
}

TEST(StringUtilsTest, ErrorKindNames) {
    EXPECT_EQ(getErrorKindName(ErrorKind::Configuration), "ConfigurationError");
    EXPECT_EQ(getErrorKindName(ErrorKind::Overflow), "OverflowError");
    EXPECT_EQ(getErrorKindName(ErrorKind::DivisionByZero), "DivisionByZeroError");
}
