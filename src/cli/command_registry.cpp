#include <hoard/cli/command_registry.h>
#include <hoard/cli/hoard_cli.h>

namespace hoard::cli {

// External factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createPullCommand();
std::unique_ptr<ICommand> createStatusCommand();
std::unique_ptr<ICommand> createResetCommand();

void CommandRegistry::registerAllCommands(HoardCLI* cli) {
    cli->registerCommand(CommandRegistry::createPullCommand());
    cli->registerCommand(CommandRegistry::createStatusCommand());
    cli->registerCommand(CommandRegistry::createResetCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createPullCommand() {
    return ::hoard::cli::createPullCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStatusCommand() {
    return ::hoard::cli::createStatusCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createResetCommand() {
    return ::hoard::cli::createResetCommand();
}

} // namespace hoard::cli
