#include "io/settings.hpp"

#include "bytes/standard.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
constexpr int MinJsonIndent = -1; // Compact output
constexpr int MaxJsonIndent = 16;

template <typename T>
bool loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return false;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            return true;
        }
        catch (const YAML::Exception&) {
            return false;
        }
    }

    if (!node.IsMap()) {
        return false;
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

template <typename T>
std::optional<Error> loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        return Error{ .kind = ErrorKind::Configuration, .message = "Could not load field " + join(indices, "::") + "." };
    }

    return std::nullopt;
}

template <typename T>
void loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    bool success = loadField(field, root, indices, 0);
    if (!success) {
        field = defaultValue;
    }
}

Error makeFieldError(const std::vector<std::string>& indices, const Error& cause) {
    return { .kind = cause.kind, .message = "Invalid field " + join(indices, "::") + ": " + cause.message };
}
} // namespace

Settings getDefaultSettings() {
    return {
        .inputStandard = &getBinaryStandard(),
        .outputStandard = nullptr,
        .outputUnit = std::nullopt,
        .jsonIndent = 4
    };
}

const Standard& getOutputStandard(const Settings& settings) {
    return (settings.outputStandard != nullptr) ? *settings.outputStandard : *settings.inputStandard;
}

Result<Settings> loadSettings(const YAML::Node& root) {
    Settings settings = getDefaultSettings();

    // Load input standard
    std::string inputStandardName;
    if (std::optional<Error> error = loadFieldRequired(inputStandardName, root, { "input-standard" })) {
        return *error;
    }
    Result<const Standard*> inputStandard = findStandardByName(inputStandardName);
    if (inputStandard.isError()) {
        return makeFieldError({ "input-standard" }, inputStandard.getError());
    }
    settings.inputStandard = inputStandard.getValue();

    // Load output standard
    std::string outputStandardName;
    loadFieldOptional(outputStandardName, root, { "output", "standard" }, std::string{});
    if (!outputStandardName.empty()) {
        Result<const Standard*> outputStandard = findStandardByName(outputStandardName);
        if (outputStandard.isError()) {
            return makeFieldError({ "output", "standard" }, outputStandard.getError());
        }
        settings.outputStandard = outputStandard.getValue();
    }

    // Load output unit, checked against the standard it will be used with
    std::string outputUnit;
    loadFieldOptional(outputUnit, root, { "output", "unit" }, std::string{ "auto" });
    if (outputUnit != "auto") {
        Result<ByteCount> exponent = getOutputStandard(settings).getExponent(outputUnit);
        if (exponent.isError()) {
            return makeFieldError({ "output", "unit" }, exponent.getError());
        }
        settings.outputUnit = outputUnit;
    }

    // Load JSON indent
    loadFieldOptional(settings.jsonIndent, root, { "json-indent" }, getDefaultSettings().jsonIndent);
    if (settings.jsonIndent < MinJsonIndent || settings.jsonIndent > MaxJsonIndent) {
        return Error{
            .kind = ErrorKind::Configuration,
            .message = "Invalid field json-indent: must be between " + std::to_string(MinJsonIndent) + " and " + std::to_string(MaxJsonIndent) + "."
        };
    }

    return settings;
}

Result<Settings> loadSettingsFile(const std::string& filePath) {
    YAML::Node root;

    try {
        root = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return Error{ .kind = ErrorKind::Configuration, .message = "Could not load settings file " + filePath + ". " + e.what() };
    }

    return loadSettings(root);
}
