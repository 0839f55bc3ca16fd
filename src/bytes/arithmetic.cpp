#include "bytes/arithmetic.hpp"

#include "bytes/byte_quantity.hpp"
#include "bytes/config.hpp"
#include "bytes/format.hpp"
#include "util/result.hpp"

#include <cassert>
#include <cmath>
#include <compare>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace {
Error makeOperationError(ErrorKind kind, Operation operation, const std::string& lhs, const std::string& rhs, const std::string& reason) {
    return { .kind = kind, .message = "Cannot evaluate " + lhs + " " + getOperationSymbol(operation) + " " + rhs + ": " + reason };
}

double floorDivideValues(double lhs, double rhs) {
    double mod = std::fmod(lhs, rhs);
    double div = (lhs - mod) / rhs;
    if (mod != 0.0 && ((rhs < 0.0) != (mod < 0.0))) {
        div -= 1.0;
    }

    if (div == 0.0) {
        return std::copysign(0.0, lhs / rhs);
    }

    double floorDiv = std::floor(div);
    if (div - floorDiv > 0.5) {
        floorDiv += 1.0;
    }
    return floorDiv;
}

double moduloValues(double lhs, double rhs) {
    double mod = std::fmod(lhs, rhs);
    if (mod == 0.0) {
        return std::copysign(0.0, rhs);
    }

    if ((rhs < 0.0) != (mod < 0.0)) {
        mod += rhs;
    }
    return mod;
}

Result<ByteQuantity> wrapMagnitude(const Result<Magnitude>& magnitude, const ByteQuantity& quantity) {
    if (magnitude.isError()) {
        return magnitude.getError();
    }
    return std::visit([&quantity](const auto& value) { return quantity.withMagnitude(value); }, magnitude.getValue());
}

ByteQuantity wrapWholeMagnitude(const Magnitude& magnitude, const ByteQuantity& quantity) {
    // Cannot fail: the magnitude is finite, and an integral one that overflows becomes a double
    return wrapMagnitude(Result<Magnitude>(magnitude), quantity).getValue();
}

// Whole numbers below 2^53 are exact integers and take the integral path
Magnitude toOperand(double value) {
    static const double ExactLimit = std::ldexp(1.0, 53);
    if (std::trunc(value) == value && std::fabs(value) < ExactLimit) {
        return ByteCount(value);
    }
    return value;
}

Magnitude toWholeMagnitude(double value) {
    static const double ByteCountLimit = std::ldexp(1.0, 128);
    if (std::fabs(value) < ByteCountLimit) {
        return ByteCount(value);
    }
    return value;
}

ByteCount floorDivideCounts(const ByteCount& lhs, const ByteCount& rhs) {
    ByteCount quotient = lhs / rhs;
    ByteCount remainder = lhs % rhs;
    if (remainder != 0 && ((remainder < 0) != (rhs < 0))) {
        quotient -= 1;
    }
    return quotient;
}

ByteCount moduloCounts(const ByteCount& lhs, const ByteCount& rhs) {
    ByteCount remainder = lhs % rhs;
    if (remainder != 0 && ((remainder < 0) != (rhs < 0))) {
        remainder += rhs;
    }
    return remainder;
}

// Empty when the result is not an integer or does not fit, the floating point path handles those
std::optional<ByteCount> applyIntegralOperation(Operation operation, const ByteCount& lhs, const ByteCount& rhs) {
    constexpr int MaxIntegralPower = 128;

    try {
        switch (operation) {
            case Operation::Add: {
                ByteCount sum = lhs + rhs;
                return sum;
            }
            case Operation::Subtract: {
                ByteCount difference = lhs - rhs;
                return difference;
            }
            case Operation::Multiply: {
                ByteCount product = lhs * rhs;
                return product;
            }
            case Operation::FloorDivide:
                if (rhs == 0) {
                    return std::nullopt;
                }
                return floorDivideCounts(lhs, rhs);
            case Operation::Modulo:
                if (rhs == 0) {
                    return std::nullopt;
                }
                return moduloCounts(lhs, rhs);
            case Operation::Power: {
                if (rhs < 0 || rhs > MaxIntegralPower) {
                    return std::nullopt;
                }
                ByteCount result = boost::multiprecision::pow(lhs, rhs.convert_to<unsigned>());
                return result;
            }
            case Operation::Divide:
            default:
                return std::nullopt;
        }
    }
    catch (const std::overflow_error&) {
        return std::nullopt;
    }
}

Result<Magnitude> applyMagnitudeOperation(Operation operation, const Magnitude& lhs, const Magnitude& rhs) {
    const ByteCount* lhsCount = std::get_if<ByteCount>(&lhs);
    const ByteCount* rhsCount = std::get_if<ByteCount>(&rhs);
    if (lhsCount != nullptr && rhsCount != nullptr) {
        std::optional<ByteCount> result = applyIntegralOperation(operation, *lhsCount, *rhsCount);
        if (result) {
            return Magnitude(*result);
        }
    }

    Result<double> result = applyOperation(operation, toDouble(lhs), toDouble(rhs));
    if (result.isError()) {
        return result.getError();
    }
    return Magnitude(result.getValue());
}

Result<bool> compareWith(const ByteQuantity& lhs, const ByteQuantity& rhs, bool (*predicate)(std::partial_ordering)) {
    Result<std::partial_ordering> ordering = lhs.compare(rhs);
    if (ordering.isError()) {
        return ordering.getError();
    }
    return predicate(ordering.getValue());
}
} // namespace

std::string getOperationSymbol(Operation operation) {
    switch (operation) {
        case Operation::Add:
            return "+";
        case Operation::Subtract:
            return "-";
        case Operation::Multiply:
            return "*";
        case Operation::Divide:
            return "/";
        case Operation::FloorDivide:
            return "//";
        case Operation::Modulo:
            return "%";
        case Operation::Power:
            return "**";
        default:
            assert(false);
            return "?";
    }
}

Result<double> applyOperation(Operation operation, double lhs, double rhs) {
    std::string lhsString = formatMagnitude(lhs);
    std::string rhsString = formatMagnitude(rhs);

    bool dividesByZero = (rhs == 0.0) && (operation == Operation::Divide || operation == Operation::FloorDivide || operation == Operation::Modulo);
    bool zeroToNegativePower = (operation == Operation::Power) && (lhs == 0.0) && (rhs < 0.0);
    if (dividesByZero || zeroToNegativePower) {
        return makeOperationError(ErrorKind::DivisionByZero, operation, lhsString, rhsString, "division by zero.");
    }

    double result = 0.0;
    switch (operation) {
        case Operation::Add:
            result = lhs + rhs;
            break;
        case Operation::Subtract:
            result = lhs - rhs;
            break;
        case Operation::Multiply:
            result = lhs * rhs;
            break;
        case Operation::Divide:
            result = lhs / rhs;
            break;
        case Operation::FloorDivide:
            result = floorDivideValues(lhs, rhs);
            break;
        case Operation::Modulo:
            result = moduloValues(lhs, rhs);
            break;
        case Operation::Power:
            result = std::pow(lhs, rhs);
            break;
        default:
            assert(false);
            break;
    }

    // Only a negative base with a fractional exponent gets here, e.g. (-8) ** 0.5
    if (std::isnan(result)) {
        return makeOperationError(ErrorKind::TypeMismatch, operation, lhsString, rhsString, "result is not a real number.");
    }

    if (std::isinf(result)) {
        return makeOperationError(ErrorKind::Overflow, operation, lhsString, rhsString, "result is too large.");
    }

    return result;
}

Result<ByteQuantity> applyOperation(Operation operation, const ByteQuantity& lhs, const ByteQuantity& rhs) {
    if (!(lhs.getStandard() == rhs.getStandard())) {
        return makeOperationError(
            ErrorKind::TypeMismatch,
            operation,
            lhs.toString() + " (" + lhs.getStandard().getName() + ")",
            rhs.toString() + " (" + rhs.getStandard().getName() + ")",
            "standards differ."
        );
    }

    std::optional<ByteCount> rhsBytes = rhs.getIntegralByteEquivalent();
    Magnitude rescaled = rhsBytes ? divideByteCount(*rhsBytes, lhs.getExponent()) : Magnitude(rhs.getByteEquivalent() / lhs.getExponent().convert_to<double>());
    return wrapMagnitude(applyMagnitudeOperation(operation, lhs.getExactMagnitude(), rescaled), lhs);
}

Result<ByteQuantity> applyOperation(Operation operation, const ByteQuantity& lhs, double rhs) {
    return wrapMagnitude(applyMagnitudeOperation(operation, lhs.getExactMagnitude(), toOperand(rhs)), lhs);
}

Result<ByteQuantity> applyOperation(Operation operation, double lhs, const ByteQuantity& rhs) {
    return wrapMagnitude(applyMagnitudeOperation(operation, toOperand(lhs), rhs.getExactMagnitude()), rhs);
}

Result<ByteQuantity> operator+(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Add, lhs, rhs);
}

Result<ByteQuantity> operator+(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Add, lhs, rhs);
}

Result<ByteQuantity> operator+(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Add, lhs, rhs);
}

Result<ByteQuantity> operator-(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Subtract, lhs, rhs);
}

Result<ByteQuantity> operator-(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Subtract, lhs, rhs);
}

Result<ByteQuantity> operator-(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Subtract, lhs, rhs);
}

Result<ByteQuantity> operator*(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Multiply, lhs, rhs);
}

Result<ByteQuantity> operator*(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Multiply, lhs, rhs);
}

Result<ByteQuantity> operator*(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Multiply, lhs, rhs);
}

Result<ByteQuantity> operator/(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Divide, lhs, rhs);
}

Result<ByteQuantity> operator/(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Divide, lhs, rhs);
}

Result<ByteQuantity> operator/(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Divide, lhs, rhs);
}

Result<ByteQuantity> operator%(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Modulo, lhs, rhs);
}

Result<ByteQuantity> operator%(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Modulo, lhs, rhs);
}

Result<ByteQuantity> operator%(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Modulo, lhs, rhs);
}

Result<ByteQuantity> floorDivide(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::FloorDivide, lhs, rhs);
}

Result<ByteQuantity> floorDivide(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::FloorDivide, lhs, rhs);
}

Result<ByteQuantity> floorDivide(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::FloorDivide, lhs, rhs);
}

Result<ByteQuantity> power(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Power, lhs, rhs);
}

Result<ByteQuantity> power(const ByteQuantity& lhs, double rhs) {
    return applyOperation(Operation::Power, lhs, rhs);
}

Result<ByteQuantity> power(double lhs, const ByteQuantity& rhs) {
    return applyOperation(Operation::Power, lhs, rhs);
}

Result<bool> operator<(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return compareWith(lhs, rhs, [](std::partial_ordering ordering) { return ordering < 0; });
}

Result<bool> operator<=(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return compareWith(lhs, rhs, [](std::partial_ordering ordering) { return ordering <= 0; });
}

Result<bool> operator>(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return compareWith(lhs, rhs, [](std::partial_ordering ordering) { return ordering > 0; });
}

Result<bool> operator>=(const ByteQuantity& lhs, const ByteQuantity& rhs) {
    return compareWith(lhs, rhs, [](std::partial_ordering ordering) { return ordering >= 0; });
}

ByteQuantity operator-(const ByteQuantity& quantity) {
    if (const ByteCount* count = std::get_if<ByteCount>(&quantity.getExactMagnitude())) {
        return wrapWholeMagnitude(ByteCount(-*count), quantity);
    }
    return quantity.withMagnitude(-quantity.getMagnitude()).getValue();
}

ByteQuantity operator+(const ByteQuantity& quantity) {
    return quantity;
}

ByteQuantity abs(const ByteQuantity& quantity) {
    if (const ByteCount* count = std::get_if<ByteCount>(&quantity.getExactMagnitude())) {
        return wrapWholeMagnitude(ByteCount(boost::multiprecision::abs(*count)), quantity);
    }
    return quantity.withMagnitude(std::fabs(quantity.getMagnitude())).getValue();
}

namespace {
// Half to even at a power of ten, exact on integers
Result<ByteQuantity> roundCount(const ByteQuantity& quantity, const ByteCount& count, int digits) {
    // 10^38 is the largest power of ten below 2^128
    constexpr int MaxDecimalDigits = 38;

    if (digits >= 0) {
        return quantity;
    }
    if (-digits > MaxDecimalDigits) {
        return quantity.withMagnitude(ByteCount(0));
    }

    try {
        ByteCount scale = boost::multiprecision::pow(ByteCount(10), static_cast<unsigned>(-digits));
        ByteCount quotient = count / scale;
        ByteCount remainder = boost::multiprecision::abs(ByteCount(count % scale));
        ByteCount twice = remainder * 2;
        if (twice > scale || (twice == scale && quotient % 2 != 0)) {
            quotient += (count < 0) ? -1 : 1;
        }
        ByteCount rounded = quotient * scale;
        return quantity.withMagnitude(rounded);
    }
    catch (const std::overflow_error&) {
        // Rounds past the largest ByteCount, the floating point result is still finite
        double scale = std::pow(10.0, -digits);
        return quantity.withMagnitude(std::nearbyint(quantity.getMagnitude() / scale) * scale);
    }
}

Magnitude applyWholeFunction(const ByteQuantity& quantity, double (*function)(double)) {
    if (quantity.isIntegral()) {
        return quantity.getExactMagnitude();
    }
    return toWholeMagnitude(function(quantity.getMagnitude()));
}
} // namespace

Result<ByteQuantity> round(const ByteQuantity& quantity, int digits) {
    if (const ByteCount* count = std::get_if<ByteCount>(&quantity.getExactMagnitude())) {
        return roundCount(quantity, *count, digits);
    }

    double magnitude = quantity.getMagnitude();
    if (digits == 0) {
        return wrapWholeMagnitude(toWholeMagnitude(std::nearbyint(magnitude)), quantity);
    }

    double scale = std::pow(10.0, digits);
    if (scale == 0.0) {
        return quantity.withMagnitude(std::copysign(0.0, magnitude));
    }

    // Values this large have no fractional digits left to round
    double scaled = magnitude * scale;
    if (!std::isfinite(scale) || !std::isfinite(scaled)) {
        return quantity;
    }

    return quantity.withMagnitude(std::nearbyint(scaled) / scale);
}

ByteQuantity floor(const ByteQuantity& quantity) {
    return wrapWholeMagnitude(applyWholeFunction(quantity, [](double value) { return std::floor(value); }), quantity);
}

ByteQuantity ceil(const ByteQuantity& quantity) {
    return wrapWholeMagnitude(applyWholeFunction(quantity, [](double value) { return std::ceil(value); }), quantity);
}

ByteQuantity trunc(const ByteQuantity& quantity) {
    return wrapWholeMagnitude(applyWholeFunction(quantity, [](double value) { return std::trunc(value); }), quantity);
}
