#pragma once

#include <memory>
#include <hoard/cli/command.h>

namespace hoard::cli {

// Forward declaration
class HoardCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(HoardCLI* cli);

    static std::unique_ptr<ICommand> createPullCommand();
    static std::unique_ptr<ICommand> createStatusCommand();
    static std::unique_ptr<ICommand> createResetCommand();
};

} // namespace hoard::cli
