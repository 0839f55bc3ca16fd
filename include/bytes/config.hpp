#ifndef BYTES_CONFIG_HPP
#define BYTES_CONFIG_HPP

#include <boost/multiprecision/cpp_int.hpp>

// Signed so negative quantities survive parsing, checked so that overflow throws instead of wrapping
using ByteCount = boost::multiprecision::checked_int128_t;

namespace bytes {
constexpr int MaxBase = 1024;
constexpr int MaxNumUnits = 11; // 1024^10 still fits in a ByteCount

constexpr int FractionalDigits = 2;
} // namespace bytes

#endif // BYTES_CONFIG_HPP
