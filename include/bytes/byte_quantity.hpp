#ifndef BYTE_QUANTITY_HPP
#define BYTE_QUANTITY_HPP

#include "bytes/config.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"

#include <compare>
#include <concepts>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <variant>

// Integral magnitudes are kept exactly, anything else as a double
using Magnitude = std::variant<ByteCount, double>;

// bytes / exponent, integral when the division is exact
Magnitude divideByteCount(const ByteCount& bytes, const ByteCount& exponent);
double toDouble(const Magnitude& magnitude);

// A magnitude expressed in one unit of a registered standard, e.g. 1.5 MiB.
// The magnitude and the byte equivalent are always finite. An integral magnitude
// also has an exact byte equivalent; one whose bytes would not fit in a ByteCount is stored as a double.
//
// Every operation returns a new value except setUnit(), which mutates in place.
// Values shared between threads need external synchronization around setUnit().
class ByteQuantity {
public:
    static Result<ByteQuantity> create(double value, const Standard& standard);
    static Result<ByteQuantity> create(double value, const std::string& unit, const Standard& standard);
    static Result<ByteQuantity> create(const ByteCount& value, const Standard& standard);
    static Result<ByteQuantity> create(const ByteCount& value, const std::string& unit, const Standard& standard);

    template <std::integral T>
    static Result<ByteQuantity> create(T value, const Standard& standard) {
        return create(ByteCount(value), standard);
    }

    template <std::integral T>
    static Result<ByteQuantity> create(T value, const std::string& unit, const Standard& standard) {
        return create(ByteCount(value), unit, standard);
    }

    // Accepts a bare number ("1024") or a number followed by one of the standard's symbols ("1.5MiB").
    // With an explicit unit the text must be a bare number, which is then taken to be in that unit.
    static Result<ByteQuantity> parse(const std::string& text, const Standard& standard);
    static Result<ByteQuantity> parse(const std::string& text, const std::string& unit, const Standard& standard);

    double getMagnitude() const;
    const Magnitude& getExactMagnitude() const;
    bool isIntegral() const;
    const std::string& getUnit() const;
    const Standard& getStandard() const;
    const ByteCount& getExponent() const;
    double getByteEquivalent() const;
    std::optional<ByteCount> getIntegralByteEquivalent() const;

    // Re-expresses the same amount of bytes in another unit of this standard.
    // Returns the error and leaves the value untouched if the unit is unknown.
    std::optional<Error> setUnit(const std::string& unit);
    Result<ByteQuantity> withUnit(const std::string& unit) const;
    Result<ByteQuantity> withMagnitude(double magnitude) const;
    Result<ByteQuantity> withMagnitude(const ByteCount& magnitude) const;

    // Without a unit, picks the target unit whose exponent is closest to the current one
    Result<ByteQuantity> convert(const Standard& standard) const;
    Result<ByteQuantity> convert(const Standard& standard, const std::string& unit) const;

    Result<std::partial_ordering> compare(const ByteQuantity& rhs) const;
    bool operator==(const ByteQuantity& rhs) const;

    std::string toString() const;
    friend std::ostream& operator<<(std::ostream& os, const ByteQuantity& quantity);

private:
    ByteQuantity(const Magnitude& magnitude, const Standard* standard, std::size_t unitIndex);

    static Result<ByteQuantity> build(const Magnitude& value, const std::optional<std::string>& unit, const Standard& standard);
    static Result<ByteQuantity> buildFromText(const std::string& text, const std::optional<std::string>& unit, const Standard& standard);
    static Result<ByteQuantity> buildChecked(const Magnitude& magnitude, const Standard* standard, std::size_t unitIndex);

    Magnitude rescaleTo(const ByteCount& exponent) const;
    std::partial_ordering compareBytes(const ByteQuantity& rhs) const;

    Magnitude m_magnitude;
    const Standard* m_standard;
    std::size_t m_unitIndex;
};

#endif // BYTE_QUANTITY_HPP
