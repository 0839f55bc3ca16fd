#ifndef FORMAT_HPP
#define FORMAT_HPP

#include "bytes/config.hpp"

#include <string>

// Whole magnitudes get no decimals, everything else two, never in exponential notation.
// Non-finite values fall back to the default stream form.
std::string formatMagnitude(double magnitude);
// Exact decimal digits, however large
std::string formatMagnitude(const ByteCount& magnitude);
std::string formatQuantity(double magnitude, const std::string& unit);
std::string formatQuantity(const ByteCount& magnitude, const std::string& unit);

#endif // FORMAT_HPP
