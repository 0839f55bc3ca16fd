#ifndef ARITHMETIC_HPP
#define ARITHMETIC_HPP

#include "bytes/byte_quantity.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

// Binary operations keep the unit and standard of the left operand.
// A quantity on the right is rescaled into the left operand's unit first, and must share its standard.
// A plain number on either side is taken to be in the quantity's unit.

enum class Operation : std::uint8_t {
    Add,
    Subtract,
    Multiply,
    Divide,
    FloorDivide,
    Modulo,
    Power
};

std::string getOperationSymbol(Operation operation);

// Floating point semantics: floored division and modulo, modulo takes the sign of the divisor
Result<double> applyOperation(Operation operation, double lhs, double rhs);
Result<ByteQuantity> applyOperation(Operation operation, const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> applyOperation(Operation operation, const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> applyOperation(Operation operation, double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> operator+(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> operator+(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> operator+(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> operator-(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> operator-(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> operator-(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> operator*(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> operator*(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> operator*(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> operator/(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> operator/(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> operator/(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> operator%(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> operator%(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> operator%(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> floorDivide(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> floorDivide(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> floorDivide(double lhs, const ByteQuantity& rhs);

Result<ByteQuantity> power(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<ByteQuantity> power(const ByteQuantity& lhs, double rhs);
Result<ByteQuantity> power(double lhs, const ByteQuantity& rhs);

// Ordering across standards is ErrorKind::TypeMismatch, equality (ByteQuantity::operator==) is just false
Result<bool> operator<(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<bool> operator<=(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<bool> operator>(const ByteQuantity& lhs, const ByteQuantity& rhs);
Result<bool> operator>=(const ByteQuantity& lhs, const ByteQuantity& rhs);

ByteQuantity operator-(const ByteQuantity& quantity);
ByteQuantity operator+(const ByteQuantity& quantity);
ByteQuantity abs(const ByteQuantity& quantity);
// Half to even. Fails only when rounding to tens or more pushes the value out of range
Result<ByteQuantity> round(const ByteQuantity& quantity, int digits = 0);
ByteQuantity floor(const ByteQuantity& quantity);
ByteQuantity ceil(const ByteQuantity& quantity);
ByteQuantity trunc(const ByteQuantity& quantity);

#endif // ARITHMETIC_HPP
