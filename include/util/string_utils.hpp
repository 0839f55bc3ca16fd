#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include "util/result.hpp"

#include <string>
#include <vector>

std::string trim(const std::string& input);
std::string toLower(const std::string& input);
std::string join(const std::vector<std::string>& inputs, const std::string& connector);
bool isDigits(const std::string& input);
bool endsWith(const std::string& input, const std::string& suffix);

// Parses the whole of input (surrounding whitespace allowed) as a decimal floating point number.
// Out-of-range literals are reported as ErrorKind::Overflow, anything else as ErrorKind::Parse.
Result<double> parseDouble(const std::string& input);

std::string formatFixedPoint(double num, int precision);

#endif // STRING_UTILS_HPP
