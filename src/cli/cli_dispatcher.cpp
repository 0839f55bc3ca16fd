#include "cli/cli_dispatcher.hpp"

#include "util/string_utils.hpp"

#include <cctype>
#include <cstddef>
#include <iostream>
#include <istream>
#include <string>
#include <utility>
#include <variant>

namespace {
constexpr char CommentMarker = '#';

// Splits a line into its command name and everything after it
std::pair<std::string, std::string> splitCommandLine(const std::string& line) {
    std::string trimmed = trim(line);

    std::size_t nameEnd = 0;
    while (nameEnd < trimmed.size() && !std::isspace(static_cast<unsigned char>(trimmed[nameEnd]))) {
        ++nameEnd;
    }

    return { trimmed.substr(0, nameEnd), trim(trimmed.substr(nameEnd)) };
}
} // namespace

std::string getVersionString(const Version& version) {
    return std::to_string(version.major) + "." + std::to_string(version.minor) + "." + std::to_string(version.patch);
}

CliDispatcher::CliDispatcher(const std::string& programName, const Version& version) : m_programName{ programName }, m_version{ version }, m_isRunning{ false } {
    registerCommand("help", "Prints this help page.", [this]() { return handleHelp(); });
    registerCommand("exit", "Exits the program.", [this]() { return handleExit(); });
}

bool CliDispatcher::isCommandNameValid(const std::string& name) const {
    if (name.empty() || name.front() == CommentMarker) {
        return false;
    }

    for (char c : name) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            return false;
        }
    }

    return m_commands.find(name) == m_commands.end();
}

bool CliDispatcher::addCommand(const std::string& name, Command command) {
    if (!isCommandNameValid(name)) {
        return false;
    }

    m_commandOrder.push_back(name);
    m_commands.emplace(name, std::move(command));
    return true;
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = std::nullopt, .handler = handler });
}

bool CliDispatcher::registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler) {
    return addCommand(name, Command{ .description = description, .argument = argument, .handler = handler });
}

std::size_t CliDispatcher::run(std::istream& input) {
    m_isRunning = true;
    std::size_t numFailures = 0;

    std::cout << m_programName << " " << getVersionString(m_version) << "\n";
    std::cout << "Type \"help\" for more information.\n";
    while (m_isRunning) {
        std::cout << "> ";
        std::string line;
        if (!std::getline(input, line)) {
            std::cout << "\n";
            break;
        }

        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed.front() == CommentMarker) {
            continue;
        }

        if (!dispatch(trimmed)) {
            ++numFailures;
        }
    }

    m_isRunning = false;
    return numFailures;
}

bool CliDispatcher::dispatch(const std::string& line) {
    auto [name, argument] = splitCommandLine(line);
    if (name.empty()) {
        return false;
    }

    auto it = m_commands.find(name);
    if (it == m_commands.end()) {
        std::cerr << "Error: Unknown command: " << name << "\n";
        return false;
    }

    const Command& command = it->second;
    if (const HandlerWithoutArgument* handler = std::get_if<HandlerWithoutArgument>(&command.handler)) {
        if (!argument.empty()) {
            std::cerr << "Error: " << name << " takes no argument, got \"" << argument << "\".\n";
            return false;
        }
        return (*handler)();
    }

    if (argument.empty()) {
        std::cerr << "Error: Missing argument for " << name << ": expected <" << command.argument.value_or("argument") << ">.\n";
        return false;
    }
    return std::get<HandlerWithArgument>(command.handler)(argument);
}

bool CliDispatcher::handleHelp() const {
    std::cout << m_programName << " " << getVersionString(m_version) << " commands:\n";
    for (const std::string& name : m_commandOrder) {
        const Command& command = m_commands.at(name);
        std::cout << name;
        if (command.argument) {
            std::cout << " <" << *command.argument << ">";
        }
        std::cout << ": " << command.description << "\n";
    }
    return true;
}

bool CliDispatcher::handleExit() {
    m_isRunning = false;
    return true;
}
