#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "bytes/byte_quantity.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

nlohmann::ordered_json buildQuantityJSON(const ByteQuantity& quantity);
nlohmann::ordered_json buildHistoryJSON(const std::vector<ByteQuantity>& history);
std::optional<Error> outputHistoryToJSON(const std::vector<ByteQuantity>& history, const std::string& filePath, int indent);

#endif // OUTPUT_HPP
