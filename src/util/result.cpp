#include "util/result.hpp"

#include <cassert>
#include <string>

std::string getErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:
            return "ConfigurationError";
        case ErrorKind::Parse:
            return "ParseError";
        case ErrorKind::Overflow:
            return "OverflowError";
        case ErrorKind::TypeMismatch:
            return "TypeMismatchError";
        case ErrorKind::AmbiguousUnit:
            return "AmbiguousUnitError";
        case ErrorKind::DivisionByZero:
            return "DivisionByZeroError";
        default:
            assert(false);
            return "UnknownError";
    }
}
