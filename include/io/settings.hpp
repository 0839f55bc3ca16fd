#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "bytes/standard.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

#include <yaml-cpp/yaml.h>

struct Settings {
    const Standard* inputStandard;
    const Standard* outputStandard; // nullptr follows the input standard
    std::optional<std::string> outputUnit; // nullopt picks the nearest unit
    int jsonIndent;
};

Settings getDefaultSettings();
const Standard& getOutputStandard(const Settings& settings);

Result<Settings> loadSettings(const YAML::Node& root);
Result<Settings> loadSettingsFile(const std::string& filePath);

#endif // SETTINGS_HPP
