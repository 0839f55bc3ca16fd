#ifndef CLI_DISPATCHER_HPP
#define CLI_DISPATCHER_HPP

#include <cstddef>
#include <functional>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using HandlerWithoutArgument = std::function<bool()>;
using HandlerWithArgument = std::function<bool(const std::string&)>;

struct Version {
    int major;
    int minor;
    int patch;
};

std::string getVersionString(const Version& version);

// A command takes no argument, or takes the rest of its line as one argument ("parse 10 MiB").
// Blank lines and lines starting with '#' are ignored.
class CliDispatcher {
public:
    CliDispatcher(const std::string& programName, const Version& version);

    bool registerCommand(const std::string& name, const std::string& description, const HandlerWithoutArgument& handler);
    bool registerCommand(const std::string& name, const std::string& argument, const std::string& description, const HandlerWithArgument& handler);

    // Runs until "exit" or end of input, returns the number of failed commands
    std::size_t run(std::istream& input);
    bool dispatch(const std::string& line);

private:
    struct Command {
        std::string description;
        std::optional<std::string> argument;
        std::variant<HandlerWithoutArgument, HandlerWithArgument> handler;
    };

    bool addCommand(const std::string& name, Command command);
    bool isCommandNameValid(const std::string& name) const;
    bool handleHelp() const;
    bool handleExit();

    std::string m_programName;
    Version m_version;
    bool m_isRunning;
    std::vector<std::string> m_commandOrder;
    std::map<std::string, Command> m_commands;
};

#endif // CLI_DISPATCHER_HPP
