#include <gtest/gtest.h>

#include "bytes/byte_quantity.hpp"
#include "bytes/config.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

TEST(ByteQuantityTest, CreateDefaultsToBaseUnit) {
    Result<ByteQuantity> quantity = ByteQuantity::create(1024, getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "B");
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 1024.0);
    EXPECT_DOUBLE_EQ(quantity.getValue().getByteEquivalent(), 1024.0);
    EXPECT_EQ(quantity.getValue().getExponent(), 1);
}

TEST(ByteQuantityTest, CreateWithUnit) {
    Result<ByteQuantity> quantity = ByteQuantity::create(1.5, "MiB", getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "MiB");
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 1.5);
    EXPECT_DOUBLE_EQ(quantity.getValue().getByteEquivalent(), 1572864.0);
    EXPECT_EQ(quantity.getValue().getExponent(), 1048576);
    EXPECT_TRUE(quantity.getValue().getStandard() == getBinaryStandard());
}

TEST(ByteQuantityTest, ParseSplitsUnitFromText) {
    Result<ByteQuantity> quantity = ByteQuantity::parse("1.5MiB", getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "MiB");
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 1.5);

    Result<ByteQuantity> bare = ByteQuantity::parse("2048", getBinaryStandard());
    ASSERT_TRUE(bare.isValue());
    EXPECT_EQ(bare.getValue().getUnit(), "B");
    EXPECT_DOUBLE_EQ(bare.getValue().getMagnitude(), 2048.0);
}

TEST(ByteQuantityTest, ParseTruncatesToWholeBytes) {
    // 1.0001 kB is 1000.1 bytes, only whole bytes are kept
    Result<ByteQuantity> quantity = ByteQuantity::parse("1.0001kB", getDecimalStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "kB");
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 1.0);
}

TEST(ByteQuantityTest, ParseBareNumberInExplicitUnit) {
    Result<ByteQuantity> quantity = ByteQuantity::parse("2.5", "GiB", getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "GiB");
    // Whole bytes of the number, so the fraction is dropped
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 2.0);
    EXPECT_TRUE(quantity.getValue().isIntegral());

    Result<ByteQuantity> padded = ByteQuantity::parse("010", "KiB", getBinaryStandard());
    ASSERT_TRUE(padded.isValue());
    EXPECT_DOUBLE_EQ(padded.getValue().getByteEquivalent(), 10240.0);
}

TEST(ByteQuantityTest, DoubleUnitIndicationIsAmbiguous) {
    Result<ByteQuantity> quantity = ByteQuantity::parse("1MiB", "KiB", getBinaryStandard());
    ASSERT_TRUE(quantity.isError());
    EXPECT_EQ(quantity.getErrorKind(), ErrorKind::AmbiguousUnit);
    EXPECT_NE(quantity.getError().message.find("KiB"), std::string::npos);
    EXPECT_NE(quantity.getError().message.find("1MiB"), std::string::npos);

    // "B" counts as a unit indication too
    EXPECT_EQ(ByteQuantity::parse("10B", "B", getBinaryStandard()).getErrorKind(), ErrorKind::AmbiguousUnit);
}

TEST(ByteQuantityTest, UnknownUnitIsConfigurationError) {
    Result<ByteQuantity> created = ByteQuantity::create(1, "KB", getBinaryStandard());
    ASSERT_TRUE(created.isError());
    EXPECT_EQ(created.getErrorKind(), ErrorKind::Configuration);

    Result<ByteQuantity> parsed = ByteQuantity::parse("1", "kb", getDecimalStandard());
    ASSERT_TRUE(parsed.isError());
    EXPECT_EQ(parsed.getErrorKind(), ErrorKind::Configuration);
}

TEST(ByteQuantityTest, UnregisteredStandardIsConfigurationError) {
    Standard custom("Custom", 1000, { "B", "kB", "MB" });
    Result<ByteQuantity> created = ByteQuantity::create(1, custom);
    ASSERT_TRUE(created.isError());
    EXPECT_EQ(created.getErrorKind(), ErrorKind::Configuration);
    EXPECT_NE(created.getError().message.find("Custom"), std::string::npos);

    EXPECT_EQ(ByteQuantity::parse("1kB", custom).getErrorKind(), ErrorKind::Configuration);
}

TEST(ByteQuantityTest, StructurallyEqualStandardIsAccepted) {
    Standard copy("Copy", 1024, getBinaryStandard().getUnitSymbols());
    Result<ByteQuantity> created = ByteQuantity::create(3, "KiB", copy);
    ASSERT_TRUE(created.isValue());
    EXPECT_EQ(&created.getValue().getStandard(), &getBinaryStandard());
}

TEST(ByteQuantityTest, WrongValueIsParseError) {
    for (const std::string& text : { "abc", "", "1.2.3", "MiB", "nan", "12 apples" }) {
        Result<ByteQuantity> quantity = ByteQuantity::parse(text, getBinaryStandard());
        ASSERT_TRUE(quantity.isError()) << text;
        EXPECT_EQ(quantity.getErrorKind(), ErrorKind::Parse) << text;
    }

    Result<ByteQuantity> notANumber = ByteQuantity::create(std::numeric_limits<double>::quiet_NaN(), getBinaryStandard());
    ASSERT_TRUE(notANumber.isError());
    EXPECT_EQ(notANumber.getErrorKind(), ErrorKind::Parse);
}

TEST(ByteQuantityTest, LargeBareNumberFallsBackToMagnitude) {
    // Too many bytes for the integer path, but a finite magnitude in bytes
    Result<ByteQuantity> quantity = ByteQuantity::parse("1e300", getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_EQ(quantity.getValue().getUnit(), "B");
    EXPECT_DOUBLE_EQ(quantity.getValue().getMagnitude(), 1e300);
}

TEST(ByteQuantityTest, OverflowIsReported) {
    EXPECT_EQ(ByteQuantity::parse("1e400", getBinaryStandard()).getErrorKind(), ErrorKind::Overflow);
    EXPECT_EQ(ByteQuantity::parse("1e400MiB", getBinaryStandard()).getErrorKind(), ErrorKind::Overflow);
    EXPECT_EQ(ByteQuantity::create(std::numeric_limits<double>::infinity(), getBinaryStandard()).getErrorKind(), ErrorKind::Overflow);

    // Finite magnitude, infinite byte equivalent
    Result<ByteQuantity> huge = ByteQuantity::create(1e300, "QiB", getBinaryStandard());
    ASSERT_TRUE(huge.isError());
    EXPECT_EQ(huge.getErrorKind(), ErrorKind::Overflow);
}

TEST(ByteQuantityTest, SetUnitKeepsBytes) {
    ByteQuantity quantity = ByteQuantity::create(1, "GiB", getBinaryStandard()).getValue();
    EXPECT_FALSE(quantity.setUnit("MiB").has_value());
    EXPECT_EQ(quantity.getUnit(), "MiB");
    EXPECT_DOUBLE_EQ(quantity.getMagnitude(), 1024.0);
    EXPECT_DOUBLE_EQ(quantity.getByteEquivalent(), 1073741824.0);

    // Setting the current unit is a no-op
    EXPECT_FALSE(quantity.setUnit("MiB").has_value());
    EXPECT_DOUBLE_EQ(quantity.getMagnitude(), 1024.0);
}

TEST(ByteQuantityTest, SetUnknownUnitLeavesValueUntouched) {
    ByteQuantity quantity = ByteQuantity::create(5, "kB", getDecimalStandard()).getValue();
    std::optional<Error> error = quantity.setUnit("KiB");
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::Configuration);
    EXPECT_EQ(quantity.getUnit(), "kB");
    EXPECT_DOUBLE_EQ(quantity.getMagnitude(), 5.0);
}

TEST(ByteQuantityTest, WithUnitReturnsCopy) {
    ByteQuantity quantity = ByteQuantity::create(2048, "KiB", getBinaryStandard()).getValue();
    Result<ByteQuantity> rescaled = quantity.withUnit("MiB");
    ASSERT_TRUE(rescaled.isValue());
    EXPECT_DOUBLE_EQ(rescaled.getValue().getMagnitude(), 2.0);
    EXPECT_EQ(quantity.getUnit(), "KiB");
    EXPECT_DOUBLE_EQ(quantity.getMagnitude(), 2048.0);

    EXPECT_TRUE(quantity.withUnit("MB").isError());
}

TEST(ByteQuantityTest, EqualityComparesBytes) {
    ByteQuantity kibibytes = ByteQuantity::create(1024, "KiB", getBinaryStandard()).getValue();
    ByteQuantity mebibyte = ByteQuantity::create(1, "MiB", getBinaryStandard()).getValue();
    EXPECT_TRUE(kibibytes == mebibyte);
    EXPECT_FALSE(kibibytes != mebibyte);

    ByteQuantity legacy = ByteQuantity::create(1, "MB", getLegacyBinaryStandard()).getValue();
    EXPECT_FALSE(mebibyte == legacy);
    EXPECT_TRUE(mebibyte != legacy);
}

TEST(ByteQuantityTest, StringRepresentation) {
    ByteQuantity quantity = ByteQuantity::create(1.5, "TiB", getBinaryStandard()).getValue();
    EXPECT_EQ(quantity.toString(), "1.50TiB");

    std::ostringstream os;
    os << ByteQuantity::create(3, "kB", getDecimalStandard()).getValue();
    EXPECT_EQ(os.str(), "3kB");
}

TEST(ByteQuantityTest, IntegralValuesAreStoredExactly) {
    Result<ByteQuantity> parsed = ByteQuantity::parse("9007199254740993", getBinaryStandard());
    ASSERT_TRUE(parsed.isValue());
    EXPECT_TRUE(parsed.getValue().isIntegral());
    EXPECT_EQ(parsed.getValue().getIntegralByteEquivalent().value(), ByteCount("9007199254740993"));
    EXPECT_EQ(parsed.getValue().toString(), "9007199254740993B");

    // 2^53 is the nearest double, but the values still differ by one byte
    ByteQuantity rounded = ByteQuantity::create(9007199254740992.0, getBinaryStandard()).getValue();
    EXPECT_FALSE(rounded.isIntegral());
    EXPECT_FALSE(parsed.getValue() == rounded);
    EXPECT_TRUE(parsed.getValue().compare(rounded).getValue() > 0);
    EXPECT_TRUE(parsed.getValue() == ByteQuantity::create(9007199254740993LL, getBinaryStandard()).getValue());
}

TEST(ByteQuantityTest, IntegersAndFloatsCompareByValue) {
    ByteQuantity integral = ByteQuantity::create(3, "KiB", getBinaryStandard()).getValue();
    ByteQuantity floating = ByteQuantity::create(3.0, "KiB", getBinaryStandard()).getValue();
    EXPECT_TRUE(integral.isIntegral());
    EXPECT_FALSE(floating.isIntegral());
    EXPECT_FALSE(floating.getIntegralByteEquivalent().has_value());
    EXPECT_TRUE(integral == floating);
    EXPECT_TRUE(floating == integral);

    ByteQuantity slightlyMore = ByteQuantity::create(3072.5, getBinaryStandard()).getValue();
    EXPECT_TRUE(integral.compare(slightlyMore).getValue() < 0);
    EXPECT_TRUE(slightlyMore.compare(integral).getValue() > 0);
}

TEST(ByteQuantityTest, UnitChangesStayIntegralWhenExact) {
    ByteQuantity quantity = ByteQuantity::create(3, "MiB", getBinaryStandard()).getValue();
    Result<ByteQuantity> kibibytes = quantity.withUnit("KiB");
    ASSERT_TRUE(kibibytes.isValue());
    EXPECT_TRUE(kibibytes.getValue().isIntegral());
    EXPECT_DOUBLE_EQ(kibibytes.getValue().getMagnitude(), 3072.0);

    Result<ByteQuantity> gibibytes = quantity.withUnit("GiB");
    ASSERT_TRUE(gibibytes.isValue());
    EXPECT_FALSE(gibibytes.getValue().isIntegral());
    EXPECT_DOUBLE_EQ(gibibytes.getValue().getMagnitude(), 3.0 / 1024.0);
}

TEST(ByteQuantityTest, IntegralBytesOutOfRangeBecomeFloatingPoint) {
    // 2^100 QiB is 2^200 bytes
    ByteCount count = ByteCount(1) << 100;
    Result<ByteQuantity> quantity = ByteQuantity::create(count, "QiB", getBinaryStandard());
    ASSERT_TRUE(quantity.isValue());
    EXPECT_FALSE(quantity.getValue().isIntegral());
    EXPECT_DOUBLE_EQ(quantity.getValue().getByteEquivalent(), std::ldexp(1.0, 200));
}
