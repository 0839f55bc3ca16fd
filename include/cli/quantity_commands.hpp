#ifndef QUANTITY_COMMANDS_HPP
#define QUANTITY_COMMANDS_HPP

#include "bytes/byte_quantity.hpp"
#include "cli/cli_dispatcher.hpp"
#include "io/settings.hpp"

#include <optional>
#include <vector>

struct QuantityContext {
    Settings settings;
    std::optional<ByteQuantity> current;
    std::vector<ByteQuantity> history;
};

QuantityContext getDefaultContext();
bool registerAllCommands(CliDispatcher& dispatcher, QuantityContext& context);

#endif // QUANTITY_COMMANDS_HPP
