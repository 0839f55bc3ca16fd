#include "bytes/standard.hpp"

#include "util/string_utils.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

Standard::Standard(const std::string& name, int base, const std::vector<std::string>& unitSymbols) :
    m_name{ name },
    m_base{ base },
    m_unitSymbols{ unitSymbols } {
    assert(m_base > 1 && m_base <= bytes::MaxBase);
    assert(!m_unitSymbols.empty() && m_unitSymbols.size() <= bytes::MaxNumUnits);

    ByteCount exponent = 1;
    for (std::size_t i = 0; i < m_unitSymbols.size(); ++i) {
        if (i > 0) {
            exponent *= m_base;
        }
        m_exponents.push_back(exponent);
    }
}

const std::string& Standard::getName() const {
    return m_name;
}

int Standard::getBase() const {
    return m_base;
}

const std::vector<std::string>& Standard::getUnitSymbols() const {
    return m_unitSymbols;
}

const std::string& Standard::getBaseSymbol() const {
    return m_unitSymbols.front();
}

std::size_t Standard::getNumUnits() const {
    return m_unitSymbols.size();
}

bool Standard::hasUnit(const std::string& symbol) const {
    return getUnitIndex(symbol).has_value();
}

std::optional<std::size_t> Standard::getUnitIndex(const std::string& symbol) const {
    auto it = std::find(m_unitSymbols.begin(), m_unitSymbols.end(), symbol);
    if (it == m_unitSymbols.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - m_unitSymbols.begin());
}

Result<ByteCount> Standard::getExponent(const std::string& symbol) const {
    std::optional<std::size_t> unitIndex = getUnitIndex(symbol);
    if (!unitIndex) {
        return Error{
            .kind = ErrorKind::Configuration,
            .message = "Unknown unit \"" + symbol + "\" for standard " + m_name + " (expected one of " + join(m_unitSymbols, ", ") + ")."
        };
    }
    return m_exponents[*unitIndex];
}

const ByteCount& Standard::getExponent(std::size_t unitIndex) const {
    assert(unitIndex < m_exponents.size());
    return m_exponents[unitIndex];
}

bool Standard::operator==(const Standard& rhs) const {
    return (m_base == rhs.m_base) && (m_unitSymbols == rhs.m_unitSymbols);
}

const Standard& getDecimalStandard() {
    static const Standard DecimalStandard("SI", 1000, { "B", "kB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB", "RB", "QB" });
    return DecimalStandard;
}

const Standard& getBinaryStandard() {
    static const Standard BinaryStandard("IEC", 1024, { "B", "KiB", "MiB", "GiB", "TiB", "PiB", "EiB", "ZiB", "YiB", "RiB", "QiB" });
    return BinaryStandard;
}

// Memory sizes as traditionally reported: powers of 1024 with decimal-looking symbols
const Standard& getLegacyBinaryStandard() {
    static const Standard LegacyBinaryStandard("MEM", 1024, { "B", "KB", "MB", "GB", "TB" });
    return LegacyBinaryStandard;
}

std::array<const Standard*, 3> getRegisteredStandards() {
    return { &getDecimalStandard(), &getBinaryStandard(), &getLegacyBinaryStandard() };
}

const Standard* findRegisteredStandard(const Standard& standard) {
    for (const Standard* registered : getRegisteredStandards()) {
        if (*registered == standard) {
            return registered;
        }
    }
    return nullptr;
}

Result<const Standard*> findStandardByName(const std::string& name) {
    std::string lowerName = toLower(trim(name));

    if (lowerName == "si" || lowerName == "decimal") {
        return &getDecimalStandard();
    }
    else if (lowerName == "iec" || lowerName == "binary") {
        return &getBinaryStandard();
    }
    else if (lowerName == "mem" || lowerName == "legacy") {
        return &getLegacyBinaryStandard();
    }

    return Error{
        .kind = ErrorKind::Configuration,
        .message = "Unknown standard \"" + name + "\" (expected si, iec, or mem)."
    };
}
