#pragma once

#include <memory>
#include <dsm/cli/command.h>

namespace dsm::cli {

class DsmCLI;

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    static void registerAllCommands(DsmCLI* cli);

    static std::unique_ptr<ICommand> createListCommand();
    static std::unique_ptr<ICommand> createInstallCommand();
    static std::unique_ptr<ICommand> createRemoveCommand();
    static std::unique_ptr<ICommand> createStartCommand();
    static std::unique_ptr<ICommand> createStopCommand();
    static std::unique_ptr<ICommand> createLogsCommand();
    static std::unique_ptr<ICommand> createApplicationsCommand();
};

} // namespace dsm::cli
