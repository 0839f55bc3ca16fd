#include "cli/quantity_commands.hpp"

#include "bytes/arithmetic.hpp"
#include "bytes/byte_quantity.hpp"
#include "bytes/config.hpp"
#include "bytes/format.hpp"
#include "bytes/standard.hpp"
#include "cli/cli_dispatcher.hpp"
#include "io/output.hpp"
#include "io/settings.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <compare>
#include <iostream>
#include <optional>
#include <string>

namespace {
void printError(const Error& error) {
    std::cerr << "Error: " << error.message << "\n";
}

void printNoCurrentValueError() {
    std::cerr << "Error: No current value. Please run \"parse <text>\" first.\n";
}

void printSettings(const Settings& settings) {
    std::cout << "Input standard: " << settings.inputStandard->getName() << "\n";
    std::cout << "Output standard: " << getOutputStandard(settings).getName() << ((settings.outputStandard == nullptr) ? " (same as input)" : "") << "\n";
    std::cout << "Output unit: " << settings.outputUnit.value_or("auto") << "\n";
    std::cout << "JSON indent: " << settings.jsonIndent << "\n";
}

// A fixed output unit only makes sense while the output standard still has it
void resetOutputUnitIfNeeded(Settings& settings) {
    if (settings.outputUnit && !getOutputStandard(settings).hasUnit(*settings.outputUnit)) {
        std::cout << "Output unit " << *settings.outputUnit << " does not exist in " << getOutputStandard(settings).getName() << ", using auto.\n";
        settings.outputUnit = std::nullopt;
    }
}

bool setCurrent(QuantityContext& context, const Result<ByteQuantity>& result) {
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    const ByteQuantity& quantity = result.getValue();
    context.current = quantity;
    context.history.push_back(quantity);

    const std::string& baseSymbol = quantity.getStandard().getBaseSymbol();
    std::optional<ByteCount> exactBytes = quantity.getIntegralByteEquivalent();
    std::string bytesString = exactBytes ? formatQuantity(*exactBytes, baseSymbol) : formatQuantity(quantity.getByteEquivalent(), baseSymbol);
    std::cout << quantity << " (" << quantity.getStandard().getName() << ") = " << bytesString << "\n";
    return true;
}

bool handleSetStandard(QuantityContext& context, const std::string& argument) {
    Result<const Standard*> standard = findStandardByName(argument);
    if (standard.isError()) {
        printError(standard.getError());
        return false;
    }

    context.settings.inputStandard = standard.getValue();
    resetOutputUnitIfNeeded(context.settings);
    std::cout << "Successfully set input standard to " << standard.getValue()->getName() << " (" << join(standard.getValue()->getUnitSymbols(), ", ") << ").\n";
    return true;
}

bool handleSetTarget(QuantityContext& context, const std::string& argument) {
    if (toLower(argument) == "input") {
        context.settings.outputStandard = nullptr;
        resetOutputUnitIfNeeded(context.settings);
        std::cout << "Output standard now follows the input standard.\n";
        return true;
    }

    Result<const Standard*> standard = findStandardByName(argument);
    if (standard.isError()) {
        printError(standard.getError());
        return false;
    }

    context.settings.outputStandard = standard.getValue();
    resetOutputUnitIfNeeded(context.settings);
    std::cout << "Successfully set output standard to " << standard.getValue()->getName() << ".\n";
    return true;
}

bool handleSetUnit(QuantityContext& context, const std::string& argument) {
    if (argument == "auto") {
        context.settings.outputUnit = std::nullopt;
        std::cout << "Output unit will be chosen automatically.\n";
        return true;
    }

    Result<ByteCount> exponent = getOutputStandard(context.settings).getExponent(argument);
    if (exponent.isError()) {
        printError(exponent.getError());
        return false;
    }

    context.settings.outputUnit = argument;
    std::cout << "Successfully set output unit to " << argument << ".\n";
    return true;
}

bool handleLoadSettings(QuantityContext& context, const std::string& argument) {
    std::cout << "Loading settings from " << argument << ":\n";

    Result<Settings> settings = loadSettingsFile(argument);
    if (settings.isError()) {
        printError(settings.getError());
        return false;
    }

    context.settings = settings.getValue();
    std::cout << "Successfully loaded settings.\n";
    printSettings(context.settings);
    return true;
}

bool handleParse(QuantityContext& context, const std::string& argument) {
    return setCurrent(context, ByteQuantity::parse(argument, *context.settings.inputStandard));
}

bool handleConvert(QuantityContext& context) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    const Standard& target = getOutputStandard(context.settings);
    if (context.settings.outputUnit) {
        return setCurrent(context, context.current->convert(target, *context.settings.outputUnit));
    }
    return setCurrent(context, context.current->convert(target));
}

bool handleAs(QuantityContext& context, const std::string& argument) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    return setCurrent(context, context.current->withUnit(argument));
}

bool handleQuantityOperation(QuantityContext& context, Operation operation, const std::string& argument) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    Result<ByteQuantity> operand = ByteQuantity::parse(argument, context.current->getStandard());
    if (operand.isError()) {
        printError(operand.getError());
        return false;
    }

    return setCurrent(context, applyOperation(operation, *context.current, operand.getValue()));
}

bool handleNumberOperation(QuantityContext& context, Operation operation, const std::string& argument) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    Result<double> operand = parseDouble(argument);
    if (operand.isError()) {
        printError(operand.getError());
        return false;
    }

    return setCurrent(context, applyOperation(operation, *context.current, operand.getValue()));
}

bool handleCompare(QuantityContext& context, const std::string& argument) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    Result<ByteQuantity> other = ByteQuantity::parse(argument, context.current->getStandard());
    if (other.isError()) {
        printError(other.getError());
        return false;
    }

    Result<std::partial_ordering> ordering = context.current->compare(other.getValue());
    if (ordering.isError()) {
        printError(ordering.getError());
        return false;
    }

    std::string relation = "=";
    if (ordering.getValue() < 0) {
        relation = "<";
    }
    else if (ordering.getValue() > 0) {
        relation = ">";
    }

    std::cout << *context.current << " " << relation << " " << other.getValue() << "\n";
    return true;
}

bool handleInspect(QuantityContext& context) {
    if (!context.current) {
        printNoCurrentValueError();
        return false;
    }

    std::cout << buildQuantityJSON(*context.current).dump(context.settings.jsonIndent) << "\n";
    return true;
}

bool handleExport(QuantityContext& context, const std::string& argument) {
    if (std::optional<Error> error = outputHistoryToJSON(context.history, argument, context.settings.jsonIndent)) {
        printError(*error);
        return false;
    }

    std::cout << "Successfully wrote " << context.history.size() << " values to " << argument << ".\n";
    return true;
}

bool handleShowSettings(QuantityContext& context) {
    printSettings(context.settings);
    return true;
}
} // namespace

QuantityContext getDefaultContext() {
    return {
        .settings = getDefaultSettings(),
        .current = std::nullopt,
        .history = {}
    };
}

bool registerAllCommands(CliDispatcher& dispatcher, QuantityContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "settings",
        "file",
        "Loads settings from a given .yml configuration file.",
        [&context](const std::string& argument) { return handleLoadSettings(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "show",
        "Prints the current settings.",
        [&context]() { return handleShowSettings(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "standard",
        "name",
        "Sets the standard used to read new values: si (1000, kB), iec (1024, KiB) or mem (1024, KB). Default is iec.",
        [&context](const std::string& argument) { return handleSetStandard(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "target",
        "name",
        "Sets the standard that \"convert\" converts to, or \"input\" to follow the input standard.",
        [&context](const std::string& argument) { return handleSetTarget(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "unit",
        "symbol",
        "Sets the unit that \"convert\" converts to, or \"auto\" to pick the unit closest to the original.",
        [&context](const std::string& argument) { return handleSetUnit(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "parse",
        "text",
        "Reads a value such as 1024, 1.5MiB or 3kB and makes it the current value.",
        [&context](const std::string& argument) { return handleParse(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "convert",
        "Converts the current value to the output standard and unit.",
        [&context]() { return handleConvert(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "as",
        "symbol",
        "Expresses the current value in another unit of its own standard.",
        [&context](const std::string& argument) { return handleAs(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "add",
        "text",
        "Adds a value to the current value. The result keeps the current unit.",
        [&context](const std::string& argument) { return handleQuantityOperation(context, Operation::Add, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "sub",
        "text",
        "Subtracts a value from the current value. The result keeps the current unit.",
        [&context](const std::string& argument) { return handleQuantityOperation(context, Operation::Subtract, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "mul",
        "number",
        "Multiplies the current value by a number.",
        [&context](const std::string& argument) { return handleNumberOperation(context, Operation::Multiply, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "div",
        "number",
        "Divides the current value by a number.",
        [&context](const std::string& argument) { return handleNumberOperation(context, Operation::Divide, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "compare",
        "text",
        "Compares the current value with another value of the same standard.",
        [&context](const std::string& argument) { return handleCompare(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "inspect",
        "Prints the current value as JSON.",
        [&context]() { return handleInspect(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "export",
        "file",
        "Writes every value produced in this session to a JSON file.",
        [&context](const std::string& argument) { return handleExport(context, argument); }
    );

    return allSuccess;
}
