#include <spdlog/spdlog.h>
#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>
#include <dsm/site/application.h>
#include <dsm/site/service_stack.h>

namespace dsm::cli {

class InstallCommand : public ICommand {
public:
    std::string getName() const override { return "install"; }

    std::string getDescription() const override {
        return "Create a site with its own web server and database";
    }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("install", getDescription());
        cmd->add_option("id", id_, "Site id: a letter, then up to 23 letters, digits or '_'")
            ->required();
        portOpt_ = cmd->add_option("-p,--port", port_, "Base port (default: lowest free)");
        cmd->add_option("--db", dbEngine_, "Database engine (default from config)")
            ->check(CLI::IsMember({"mysql", "pgsql"}));
        cmd->add_option("-a,--application", application_,
                        "Application archive or name to unpack into the document root");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& settings = cli_->getSettings();
        const auto& templates = cli_->getTemplates();

        auto web = site::makeWebStack("apache2", settings, templates);
        if (!web) {
            return web.error();
        }
        auto db = site::makeDatabaseStack(dbEngine_.empty() ? settings.dbEngine : dbEngine_,
                                          settings, templates);
        if (!db) {
            return db.error();
        }

        site::InstallRequest request;
        request.id = id_;
        if (portOpt_->count() > 0) {
            request.port = port_;
        }
        request.web = web.value().get();
        request.database = db.value().get();

        if (!application_.empty()) {
            auto archive = site::resolveApplication(settings.applicationDir, application_);
            if (!archive) {
                return archive.error();
            }
            request.application = archive.value();
        }

        auto installed = cli_->getSiteManager().install(request);
        if (!installed) {
            return installed.error();
        }

        const auto& s = installed.value();
        std::cout << "Installed site " << s.id << " in " << s.directory.string() << "\n";
        std::cout << "  web: http://127.0.0.1:" << s.httpPort() << "/\n";
        std::cout << "  db:  " << db.value()->name() << " on 127.0.0.1:" << s.databasePort()
                  << " (database, user and password: " << s.id << ")\n";
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
    std::string id_;
    CLI::Option* portOpt_ = nullptr;
    int port_ = 0;
    std::string dbEngine_;
    std::string application_;
};

std::unique_ptr<ICommand> createInstallCommand() {
    return std::make_unique<InstallCommand>();
}

} // namespace dsm::cli
