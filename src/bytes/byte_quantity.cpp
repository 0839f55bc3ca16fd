#include "bytes/byte_quantity.hpp"

#include "bytes/config.hpp"
#include "bytes/format.hpp"
#include "bytes/parser.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <cmath>
#include <compare>
#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

namespace {
Result<const Standard*> resolveStandard(const Standard& standard) {
    const Standard* registered = findRegisteredStandard(standard);
    if (registered == nullptr) {
        return Error{
            .kind = ErrorKind::Configuration,
            .message = "Unknown standard \"" + standard.getName() + "\" (base " + std::to_string(standard.getBase()) + ", units " + join(standard.getUnitSymbols(), ", ") + ")."
        };
    }
    return registered;
}

Result<std::size_t> resolveUnit(const Standard& standard, const std::optional<std::string>& unit) {
    if (!unit) {
        return std::size_t{ 0 };
    }

    std::optional<std::size_t> unitIndex = standard.getUnitIndex(*unit);
    if (!unitIndex) {
        return standard.getExponent(*unit).getError();
    }
    return *unitIndex;
}

double toDouble(const ByteCount& count) {
    return count.convert_to<double>();
}

std::optional<ByteCount> multiplyCounts(const ByteCount& lhs, const ByteCount& rhs) {
    try {
        ByteCount product = lhs * rhs;
        return product;
    }
    catch (const std::overflow_error&) {
        return std::nullopt;
    }
}

std::partial_ordering orderCounts(const ByteCount& lhs, const ByteCount& rhs) {
    if (lhs < rhs) {
        return std::partial_ordering::less;
    }
    if (lhs > rhs) {
        return std::partial_ordering::greater;
    }
    return std::partial_ordering::equivalent;
}

// Exact, without rounding the count to a double
std::partial_ordering compareCountWithDouble(const ByteCount& count, double value) {
    static const double ByteCountLimit = std::ldexp(1.0, 128);
    if (std::isnan(value)) {
        return std::partial_ordering::unordered;
    }
    if (value >= ByteCountLimit) {
        return std::partial_ordering::less;
    }
    if (value <= -ByteCountLimit) {
        return std::partial_ordering::greater;
    }

    double whole = std::trunc(value);
    std::partial_ordering ordering = orderCounts(count, ByteCount(whole));
    if (ordering != 0) {
        return ordering;
    }
    return 0.0 <=> (value - whole);
}
} // namespace

Magnitude divideByteCount(const ByteCount& bytes, const ByteCount& exponent) {
    if (bytes % exponent == 0) {
        ByteCount quotient = bytes / exponent;
        return quotient;
    }
    return toDouble(bytes) / toDouble(exponent);
}

double toDouble(const Magnitude& magnitude) {
    if (const ByteCount* count = std::get_if<ByteCount>(&magnitude)) {
        return toDouble(*count);
    }
    return std::get<double>(magnitude);
}

ByteQuantity::ByteQuantity(const Magnitude& magnitude, const Standard* standard, std::size_t unitIndex) :
    m_magnitude{ magnitude },
    m_standard{ standard },
    m_unitIndex{ unitIndex } {
    assert(m_standard != nullptr);
    assert(m_unitIndex < m_standard->getNumUnits());
}

Result<ByteQuantity> ByteQuantity::create(double value, const Standard& standard) {
    return build(value, std::nullopt, standard);
}

Result<ByteQuantity> ByteQuantity::create(double value, const std::string& unit, const Standard& standard) {
    return build(value, unit, standard);
}

Result<ByteQuantity> ByteQuantity::create(const ByteCount& value, const Standard& standard) {
    return build(value, std::nullopt, standard);
}

Result<ByteQuantity> ByteQuantity::create(const ByteCount& value, const std::string& unit, const Standard& standard) {
    return build(value, unit, standard);
}

Result<ByteQuantity> ByteQuantity::parse(const std::string& text, const Standard& standard) {
    return buildFromText(text, std::nullopt, standard);
}

Result<ByteQuantity> ByteQuantity::parse(const std::string& text, const std::string& unit, const Standard& standard) {
    return buildFromText(text, unit, standard);
}

Result<ByteQuantity> ByteQuantity::build(const Magnitude& value, const std::optional<std::string>& unit, const Standard& standard) {
    Result<const Standard*> standardResult = resolveStandard(standard);
    if (standardResult.isError()) {
        return standardResult.getError();
    }

    Result<std::size_t> unitResult = resolveUnit(standard, unit);
    if (unitResult.isError()) {
        return unitResult.getError();
    }

    const double* floating = std::get_if<double>(&value);
    if (floating != nullptr && std::isnan(*floating)) {
        return Error{ .kind = ErrorKind::Parse, .message = "Wrong value: not a number." };
    }

    return buildChecked(value, standardResult.getValue(), unitResult.getValue());
}

Result<ByteQuantity> ByteQuantity::buildFromText(const std::string& text, const std::optional<std::string>& unit, const Standard& standard) {
    Result<const Standard*> standardResult = resolveStandard(standard);
    if (standardResult.isError()) {
        return standardResult.getError();
    }
    const Standard* registered = standardResult.getValue();

    Result<std::size_t> unitResult = resolveUnit(*registered, unit);
    if (unitResult.isError()) {
        return unitResult.getError();
    }

    Result<ParsedByteString> parsed = parseByteString(text, *registered);
    if (parsed.isValue()) {
        const ParsedByteString& parsedValue = parsed.getValue();

        if (!unit) {
            std::size_t unitIndex = registered->getUnitIndex(parsedValue.unit).value();
            return buildChecked(divideByteCount(parsedValue.rawBytes, registered->getExponent(unitIndex)), registered, unitIndex);
        }

        if (parsedValue.hasSuffix) {
            return Error{
                .kind = ErrorKind::AmbiguousUnit,
                .message = "Double unit indication: \"" + *unit + "\" and \"" + text + "\"."
            };
        }

        // The whole byte count becomes the magnitude in the caller's unit, so "2.5" in GiB is 2 GiB
        return buildChecked(parsedValue.rawBytes, registered, unitResult.getValue());
    }

    // Not a byte string; a plain number is still acceptable and may exceed the integer byte range
    Result<double> bareResult = parseDouble(text);
    if (bareResult.isValue() && !std::isnan(bareResult.getValue())) {
        return buildChecked(bareResult.getValue(), registered, unitResult.getValue());
    }

    bool overflowed = (parsed.getErrorKind() == ErrorKind::Overflow) || (bareResult.isError() && bareResult.getErrorKind() == ErrorKind::Overflow);
    if (overflowed) {
        return Error{ .kind = ErrorKind::Overflow, .message = "\"" + text + "\" is too large." };
    }

    return Error{ .kind = ErrorKind::Parse, .message = "Wrong value: \"" + text + "\"." };
}

Result<ByteQuantity> ByteQuantity::buildChecked(const Magnitude& magnitude, const Standard* standard, std::size_t unitIndex) {
    const ByteCount& exponent = standard->getExponent(unitIndex);
    if (const ByteCount* count = std::get_if<ByteCount>(&magnitude)) {
        if (multiplyCounts(*count, exponent)) {
            return ByteQuantity(*count, standard, unitIndex);
        }
        return buildChecked(toDouble(*count), standard, unitIndex);
    }

    double value = std::get<double>(magnitude);
    if (!std::isfinite(value) || !std::isfinite(value * toDouble(exponent))) {
        return Error{
            .kind = ErrorKind::Overflow,
            .message = "Value " + formatQuantity(value, standard->getUnitSymbols()[unitIndex]) + " is too large."
        };
    }
    return ByteQuantity(value, standard, unitIndex);
}

double ByteQuantity::getMagnitude() const {
    return toDouble(m_magnitude);
}

const Magnitude& ByteQuantity::getExactMagnitude() const {
    return m_magnitude;
}

bool ByteQuantity::isIntegral() const {
    return std::holds_alternative<ByteCount>(m_magnitude);
}

const std::string& ByteQuantity::getUnit() const {
    return m_standard->getUnitSymbols()[m_unitIndex];
}

const Standard& ByteQuantity::getStandard() const {
    return *m_standard;
}

const ByteCount& ByteQuantity::getExponent() const {
    return m_standard->getExponent(m_unitIndex);
}

double ByteQuantity::getByteEquivalent() const {
    std::optional<ByteCount> bytes = getIntegralByteEquivalent();
    if (bytes) {
        return toDouble(*bytes);
    }
    return std::get<double>(m_magnitude) * toDouble(getExponent());
}

std::optional<ByteCount> ByteQuantity::getIntegralByteEquivalent() const {
    const ByteCount* count = std::get_if<ByteCount>(&m_magnitude);
    if (count == nullptr) {
        return std::nullopt;
    }
    // Always fits, checked on construction
    return multiplyCounts(*count, getExponent());
}

Magnitude ByteQuantity::rescaleTo(const ByteCount& exponent) const {
    std::optional<ByteCount> bytes = getIntegralByteEquivalent();
    if (bytes) {
        return divideByteCount(*bytes, exponent);
    }
    return getByteEquivalent() / toDouble(exponent);
}

std::optional<Error> ByteQuantity::setUnit(const std::string& unit) {
    std::optional<std::size_t> unitIndex = m_standard->getUnitIndex(unit);
    if (!unitIndex) {
        return m_standard->getExponent(unit).getError();
    }

    if (*unitIndex != m_unitIndex) {
        m_magnitude = rescaleTo(m_standard->getExponent(*unitIndex));
        m_unitIndex = *unitIndex;
    }
    return std::nullopt;
}

Result<ByteQuantity> ByteQuantity::withUnit(const std::string& unit) const {
    ByteQuantity copy = *this;
    std::optional<Error> error = copy.setUnit(unit);
    if (error) {
        return *error;
    }
    return copy;
}

Result<ByteQuantity> ByteQuantity::withMagnitude(double magnitude) const {
    if (std::isnan(magnitude)) {
        return Error{ .kind = ErrorKind::Parse, .message = "Wrong value: not a number." };
    }
    return buildChecked(magnitude, m_standard, m_unitIndex);
}

Result<ByteQuantity> ByteQuantity::withMagnitude(const ByteCount& magnitude) const {
    return buildChecked(magnitude, m_standard, m_unitIndex);
}

Result<ByteQuantity> ByteQuantity::convert(const Standard& standard) const {
    Result<const Standard*> standardResult = resolveStandard(standard);
    if (standardResult.isError()) {
        return standardResult.getError();
    }
    const Standard* target = standardResult.getValue();

    // First minimum wins, so ties go to the smaller unit
    double exponent = toDouble(getExponent());
    std::size_t nearestIndex = 0;
    double nearestDistance = std::fabs(toDouble(target->getExponent(nearestIndex)) - exponent);
    for (std::size_t i = 1; i < target->getNumUnits(); ++i) {
        double distance = std::fabs(toDouble(target->getExponent(i)) - exponent);
        if (distance < nearestDistance) {
            nearestDistance = distance;
            nearestIndex = i;
        }
    }

    return buildChecked(rescaleTo(target->getExponent(nearestIndex)), target, nearestIndex);
}

Result<ByteQuantity> ByteQuantity::convert(const Standard& standard, const std::string& unit) const {
    Result<const Standard*> standardResult = resolveStandard(standard);
    if (standardResult.isError()) {
        return standardResult.getError();
    }
    const Standard* target = standardResult.getValue();

    Result<std::size_t> unitResult = resolveUnit(*target, unit);
    if (unitResult.isError()) {
        return unitResult.getError();
    }

    std::size_t unitIndex = unitResult.getValue();
    return buildChecked(rescaleTo(target->getExponent(unitIndex)), target, unitIndex);
}

Result<std::partial_ordering> ByteQuantity::compare(const ByteQuantity& rhs) const {
    if (!(*m_standard == *rhs.m_standard)) {
        return Error{
            .kind = ErrorKind::TypeMismatch,
            .message = "Cannot compare " + toString() + " (" + m_standard->getName() + ") with " + rhs.toString() + " (" + rhs.m_standard->getName() + "): standards differ."
        };
    }
    return compareBytes(rhs);
}

std::partial_ordering ByteQuantity::compareBytes(const ByteQuantity& rhs) const {
    std::optional<ByteCount> lhsBytes = getIntegralByteEquivalent();
    std::optional<ByteCount> rhsBytes = rhs.getIntegralByteEquivalent();
    if (lhsBytes && rhsBytes) {
        return orderCounts(*lhsBytes, *rhsBytes);
    }
    if (lhsBytes) {
        return compareCountWithDouble(*lhsBytes, rhs.getByteEquivalent());
    }
    if (rhsBytes) {
        return 0 <=> compareCountWithDouble(*rhsBytes, getByteEquivalent());
    }
    return getByteEquivalent() <=> rhs.getByteEquivalent();
}

bool ByteQuantity::operator==(const ByteQuantity& rhs) const {
    return (*m_standard == *rhs.m_standard) && (compareBytes(rhs) == 0);
}

std::string ByteQuantity::toString() const {
    return std::visit([this](const auto& magnitude) { return formatQuantity(magnitude, getUnit()); }, m_magnitude);
}

std::ostream& operator<<(std::ostream& os, const ByteQuantity& quantity) {
    os << quantity.toString();
    return os;
}
