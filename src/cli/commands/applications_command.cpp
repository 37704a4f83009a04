#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>
#include <dsm/site/application.h>

namespace dsm::cli {

using json = nlohmann::json;

class ApplicationsCommand : public ICommand {
public:
    std::string getName() const override { return "applications"; }

    std::string getDescription() const override {
        return "List application archives available to install";
    }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("applications", getDescription());
        cmd->alias("apps");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& dir = cli_->getSettings().applicationDir;
        auto apps = site::listApplications(dir);

        if (cli_->getJsonOutput()) {
            json j = json::array();
            for (const auto& a : apps) {
                j.push_back({{"name", a.name},
                             {"title", a.humanName},
                             {"archive", a.archive.string()}});
            }
            std::cout << j.dump(2) << std::endl;
            return Result<void>();
        }

        if (apps.empty()) {
            std::cout << "No applications in " << dir.string() << "\n";
            return Result<void>();
        }
        size_t width = 4;
        for (const auto& a : apps) {
            width = std::max(width, a.name.size());
        }
        std::cout << std::left;
        for (const auto& a : apps) {
            std::cout << std::setw(static_cast<int>(width)) << a.name << "  " << a.humanName
                      << "\n";
        }
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createApplicationsCommand() {
    return std::make_unique<ApplicationsCommand>();
}

} // namespace dsm::cli
