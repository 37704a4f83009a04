#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>

namespace dsm::cli {

class RemoveCommand : public ICommand {
public:
    std::string getName() const override { return "remove"; }

    std::string getDescription() const override {
        return "Stop a site's services and delete its directory";
    }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("remove", getDescription());
        cmd->alias("rm");
        cmd->add_option("id", id_, "Site id")->required();

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto removed = cli_->getSiteManager().remove(id_);
        if (!removed) {
            return removed;
        }
        std::cout << "Removed site " << id_ << "\n";
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
    std::string id_;
};

std::unique_ptr<ICommand> createRemoveCommand() {
    return std::make_unique<RemoveCommand>();
}

} // namespace dsm::cli
