#include "cli/cli_dispatcher.hpp"
#include "cli/quantity_commands.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>

int main() {
    CliDispatcher dispatcher("ByteUnits", Version{ .major = 1, .minor = 0, .patch = 0 });
    QuantityContext context = getDefaultContext();
    if (!registerAllCommands(dispatcher, context)) {
        std::cerr << "Error: Could not register commands.\n";
        return EXIT_FAILURE;
    }

    // Piped sessions report whether every command succeeded
    std::size_t numFailures = dispatcher.run(std::cin);
    return (numFailures == 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
