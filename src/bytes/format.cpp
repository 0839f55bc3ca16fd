#include "bytes/format.hpp"

#include "bytes/config.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <sstream>
#include <string>

std::string formatMagnitude(double magnitude) {
    if (!std::isfinite(magnitude)) {
        std::stringstream ss;
        ss << magnitude;
        return ss.str();
    }

    int precision = (std::trunc(magnitude) == magnitude) ? 0 : bytes::FractionalDigits;
    return formatFixedPoint(magnitude, precision);
}

std::string formatMagnitude(const ByteCount& magnitude) {
    return magnitude.str();
}

std::string formatQuantity(double magnitude, const std::string& unit) {
    return formatMagnitude(magnitude) + unit;
}

std::string formatQuantity(const ByteCount& magnitude, const std::string& unit) {
    return formatMagnitude(magnitude) + unit;
}
