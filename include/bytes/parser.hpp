#ifndef PARSER_HPP
#define PARSER_HPP

#include "bytes/config.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"

#include <string>

struct ParsedByteString {
    ByteCount rawBytes;
    std::string unit;
    bool hasSuffix;
};

Result<ParsedByteString> parseByteString(const std::string& text, const Standard& standard);
Result<ByteCount> parseByteCount(const std::string& text, const Standard& standard);

#endif // PARSER_HPP
