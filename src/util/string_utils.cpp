#include "util/string_utils.hpp"

#include <cctype>
#include <cerrno>
#include <cstddef>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

std::string trim(const std::string& input) {
    int inputSize = input.size();

    int start = 0;
    while (start < inputSize && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }

    int end = inputSize - 1;
    while (end >= 0 && std::isspace(static_cast<unsigned char>(input[end]))) {
        --end;
    }

    if (end < start) {
        return "";
    }

    int outputLength = end - start + 1;
    return input.substr(start, outputLength);
}

std::string toLower(const std::string& input) {
    std::string output = input;
    for (char& c : output) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return output;
}

std::string join(const std::vector<std::string>& inputs, const std::string& connector) {
    std::string output;
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (i > 0) {
            output += connector;
        }
        output += inputs[i];
    }
    return output;
}

bool isDigits(const std::string& input) {
    if (input.empty()) {
        return false;
    }

    for (char c : input) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool endsWith(const std::string& input, const std::string& suffix) {
    return input.size() >= suffix.size() && input.compare(input.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Result<double> parseDouble(const std::string& input) {
    std::string trimmed = trim(input);
    Error invalid = { .kind = ErrorKind::Parse, .message = "\"" + input + "\" is not a valid number." };

    // strtod also accepts hexadecimal floats, which are not decimal numbers
    if (trimmed.empty() || trimmed.find_first_of("xX") != std::string::npos) {
        return invalid;
    }

    const char* begin = trimmed.c_str();
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(begin, &end);

    if (end == begin || *end != '\0') {
        return invalid;
    }

    // Underflow rounds towards zero and is accepted
    if (errno == ERANGE && std::isinf(value)) {
        return Error{ .kind = ErrorKind::Overflow, .message = "\"" + input + "\" is too large." };
    }

    return value;
}

std::string formatFixedPoint(double num, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << num;
    return ss.str();
}
