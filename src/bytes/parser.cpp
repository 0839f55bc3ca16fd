#include "bytes/parser.hpp"

#include "bytes/config.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
const std::string ErrorPrefix = "Error parsing ";

Error makeInvalidNumberError(const std::string& text, const std::string& numberString) {
    return { .kind = ErrorKind::Parse, .message = ErrorPrefix + "\"" + text + "\": \"" + numberString + "\" is not a valid number." };
}

Error makeTooLargeError(const std::string& text, const std::string& numberString) {
    return { .kind = ErrorKind::Overflow, .message = ErrorPrefix + "\"" + text + "\": \"" + numberString + "\" is too large." };
}

Result<ByteCount> truncateToByteCount(double value, const std::string& text, const std::string& numberString) {
    if (std::isnan(value)) {
        return makeInvalidNumberError(text, numberString);
    }

    // ByteCount is signed magnitude, so anything below 2^128 in absolute value fits
    static const double ByteCountLimit = std::ldexp(1.0, 128);
    double truncated = std::trunc(value);
    if (std::isinf(truncated) || std::fabs(truncated) >= ByteCountLimit) {
        return makeTooLargeError(text, numberString);
    }

    return ByteCount(truncated);
}

// Decimal digits with an optional sign, read without the octal and hex prefixes of the string constructor
bool isSignedDigits(const std::string& numberString) {
    if (!numberString.empty() && (numberString[0] == '-' || numberString[0] == '+')) {
        return isDigits(numberString.substr(1));
    }
    return isDigits(numberString);
}

ByteCount parseDecimalDigits(const std::string& numberString) {
    bool negative = (numberString[0] == '-');
    std::size_t start = (negative || numberString[0] == '+') ? 1 : 0;

    ByteCount count = 0;
    for (std::size_t i = start; i < numberString.size(); ++i) {
        count = count * 10 + (numberString[i] - '0');
    }
    return negative ? ByteCount(-count) : count;
}

Result<ByteCount> getBytes(const std::string& text, const std::string& numberString, const ByteCount& exponent) {
    if (isSignedDigits(numberString)) {
        try {
            ByteCount bytes = parseDecimalDigits(numberString) * exponent;
            return bytes;
        }
        catch (const std::overflow_error&) {
            return makeTooLargeError(text, numberString);
        }
        catch (const std::runtime_error&) {
            return makeInvalidNumberError(text, numberString);
        }
    }

    Result<double> valueResult = parseDouble(numberString);
    if (valueResult.isError()) {
        if (valueResult.getErrorKind() == ErrorKind::Overflow) {
            return makeTooLargeError(text, numberString);
        }
        return makeInvalidNumberError(text, numberString);
    }

    return truncateToByteCount(valueResult.getValue() * exponent.convert_to<double>(), text, numberString);
}
} // namespace

Result<ParsedByteString> parseByteString(const std::string& text, const Standard& standard) {
    std::string trimmed = trim(text);

    // Scan from the largest unit down: "B" is a suffix of every other symbol, so it must be tried last
    const std::vector<std::string>& unitSymbols = standard.getUnitSymbols();
    for (std::size_t i = unitSymbols.size(); i-- > 0;) {
        const std::string& symbol = unitSymbols[i];
        if (trimmed.size() <= symbol.size() || !endsWith(trimmed, symbol)) {
            continue;
        }

        std::string numberString = trim(trimmed.substr(0, trimmed.size() - symbol.size()));
        Result<ByteCount> bytesResult = getBytes(text, numberString, standard.getExponent(i));
        if (bytesResult.isError()) {
            return bytesResult.getError();
        }

        return ParsedByteString{ .rawBytes = bytesResult.getValue(), .unit = symbol, .hasSuffix = true };
    }

    // Bare number, already in the base unit
    if (isSignedDigits(trimmed)) {
        Result<ByteCount> bytesResult = getBytes(text, trimmed, ByteCount(1));
        if (bytesResult.isError()) {
            return bytesResult.getError();
        }
        return ParsedByteString{ .rawBytes = bytesResult.getValue(), .unit = standard.getBaseSymbol(), .hasSuffix = false };
    }

    Result<double> valueResult = parseDouble(trimmed);
    if (valueResult.isError()) {
        if (valueResult.getErrorKind() == ErrorKind::Overflow) {
            return makeTooLargeError(text, trimmed);
        }
        return makeInvalidNumberError(text, trimmed);
    }

    Result<ByteCount> bytesResult = truncateToByteCount(valueResult.getValue(), text, trimmed);
    if (bytesResult.isError()) {
        return bytesResult.getError();
    }

    return ParsedByteString{ .rawBytes = bytesResult.getValue(), .unit = standard.getBaseSymbol(), .hasSuffix = false };
}

Result<ByteCount> parseByteCount(const std::string& text, const Standard& standard) {
    Result<ParsedByteString> parsed = parseByteString(text, standard);
    if (parsed.isError()) {
        return parsed.getError();
    }
    return parsed.getValue().rawBytes;
}
