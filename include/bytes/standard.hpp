#ifndef STANDARD_HPP
#define STANDARD_HPP

#include "bytes/config.hpp"
#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// A unit system: a base multiplier and the ordered unit symbols it scales.
// Two standards are equal when base and symbols match, regardless of name.
class Standard {
public:
    Standard(const std::string& name, int base, const std::vector<std::string>& unitSymbols);

    const std::string& getName() const;
    int getBase() const;
    const std::vector<std::string>& getUnitSymbols() const;
    const std::string& getBaseSymbol() const;
    std::size_t getNumUnits() const;

    bool hasUnit(const std::string& symbol) const;
    std::optional<std::size_t> getUnitIndex(const std::string& symbol) const;

    // base^index of the symbol, ErrorKind::Configuration if the symbol does not belong to this standard
    Result<ByteCount> getExponent(const std::string& symbol) const;
    const ByteCount& getExponent(std::size_t unitIndex) const;

    bool operator==(const Standard& rhs) const;

private:
    std::string m_name;
    int m_base;
    std::vector<std::string> m_unitSymbols;
    std::vector<ByteCount> m_exponents;
};

const Standard& getDecimalStandard();
const Standard& getBinaryStandard();
const Standard& getLegacyBinaryStandard();

std::array<const Standard*, 3> getRegisteredStandards();
const Standard* findRegisteredStandard(const Standard& standard);
Result<const Standard*> findStandardByName(const std::string& name);

#endif // STANDARD_HPP
