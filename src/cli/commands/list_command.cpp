#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>

namespace dsm::cli {

using json = nlohmann::json;

namespace {

const char* stateName(bool running) {
    return running ? "running" : "stopped";
}

} // namespace

class ListCommand : public ICommand {
public:
    std::string getName() const override { return "list"; }

    std::string getDescription() const override { return "List sites and their service state"; }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("list", getDescription());
        cmd->alias("ls");
        cmd->add_flag("--json", json_, "Output as JSON");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto sites = cli_->getSiteManager().registry().listSites();

        if (json_ || cli_->getJsonOutput()) {
            json j = json::array();
            for (const auto& status : sites) {
                const auto& site = status.site;
                j.push_back({{"id", site.id},
                             {"port", site.port},
                             {"http_port", site.httpPort()},
                             {"https_port", site.httpsPort()},
                             {"db_port", site.databasePort()},
                             {"www", stateName(status.webRunning)},
                             {"db", stateName(status.dbRunning)},
                             {"directory", site.directory.string()}});
            }
            std::cout << j.dump(2) << std::endl;
            return Result<void>();
        }

        if (sites.empty()) {
            std::cout << "No sites in " << cli_->getSettings().baseDir.string() << "\n";
            return Result<void>();
        }

        size_t idWidth = 2;
        for (const auto& status : sites) {
            idWidth = std::max(idWidth, status.site.id.size());
        }

        std::cout << std::left;
        std::cout << std::setw(static_cast<int>(idWidth)) << "ID" << "  ";
        std::cout << std::setw(5) << "PORT" << "  ";
        std::cout << std::setw(7) << "WWW" << "  ";
        std::cout << std::setw(7) << "DB" << "  ";
        std::cout << "DIRECTORY\n";
        for (const auto& status : sites) {
            std::cout << std::setw(static_cast<int>(idWidth)) << status.site.id << "  ";
            std::cout << std::setw(5) << status.site.port << "  ";
            std::cout << std::setw(7) << stateName(status.webRunning) << "  ";
            std::cout << std::setw(7) << stateName(status.dbRunning) << "  ";
            std::cout << status.site.directory.string() << "\n";
        }
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
    bool json_ = false;
};

std::unique_ptr<ICommand> createListCommand() {
    return std::make_unique<ListCommand>();
}

} // namespace dsm::cli
