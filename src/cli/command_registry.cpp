#include <dsm/cli/command_registry.h>
#include <dsm/cli/dsm_cli.h>

namespace dsm::cli {

// Factory functions from command implementations (in this namespace)
std::unique_ptr<ICommand> createListCommand();
std::unique_ptr<ICommand> createInstallCommand();
std::unique_ptr<ICommand> createRemoveCommand();
std::unique_ptr<ICommand> createStartCommand();
std::unique_ptr<ICommand> createStopCommand();
std::unique_ptr<ICommand> createLogsCommand();
std::unique_ptr<ICommand> createApplicationsCommand();

void CommandRegistry::registerAllCommands(DsmCLI* cli) {
    cli->registerCommand(CommandRegistry::createListCommand());
    cli->registerCommand(CommandRegistry::createInstallCommand());
    cli->registerCommand(CommandRegistry::createRemoveCommand());
    cli->registerCommand(CommandRegistry::createStartCommand());
    cli->registerCommand(CommandRegistry::createStopCommand());
    cli->registerCommand(CommandRegistry::createLogsCommand());
    cli->registerCommand(CommandRegistry::createApplicationsCommand());
}

std::unique_ptr<ICommand> CommandRegistry::createListCommand() {
    return ::dsm::cli::createListCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createInstallCommand() {
    return ::dsm::cli::createInstallCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createRemoveCommand() {
    return ::dsm::cli::createRemoveCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStartCommand() {
    return ::dsm::cli::createStartCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createStopCommand() {
    return ::dsm::cli::createStopCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createLogsCommand() {
    return ::dsm::cli::createLogsCommand();
}

std::unique_ptr<ICommand> CommandRegistry::createApplicationsCommand() {
    return ::dsm::cli::createApplicationsCommand();
}

} // namespace dsm::cli
