#include "io/output.hpp"

#include "bytes/byte_quantity.hpp"
#include "bytes/config.hpp"
#include "bytes/standard.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

json buildQuantityJSON(const ByteQuantity& quantity) {
    const Standard& standard = quantity.getStandard();

    json j;
    j["Text"] = quantity.toString();
    j["Magnitude"] = quantity.getMagnitude();
    j["Unit"] = quantity.getUnit();
    j["Standard"] = standard.getName();
    j["Base"] = standard.getBase();
    // Exponents reach 1024^10, past what a JSON number holds exactly
    j["Exponent"] = quantity.getExponent().str();
    j["Bytes"] = quantity.getByteEquivalent();

    std::optional<ByteCount> exactBytes = quantity.getIntegralByteEquivalent();
    if (exactBytes) {
        j["Exact Bytes"] = exactBytes->str();
    }
    return j;
}

json buildHistoryJSON(const std::vector<ByteQuantity>& history) {
    json j = json::array();
    for (const ByteQuantity& quantity : history) {
        j.push_back(buildQuantityJSON(quantity));
    }
    return j;
}

std::optional<Error> outputHistoryToJSON(const std::vector<ByteQuantity>& history, const std::string& filePath, int indent) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return Error{ .kind = ErrorKind::Configuration, .message = "Could not open \"" + filePath + "\" for writing." };
    }

    file << buildHistoryJSON(history).dump(indent) << std::endl;
    return std::nullopt;
}
