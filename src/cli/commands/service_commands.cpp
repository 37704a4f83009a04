#include <iostream>
#include <dsm/cli/command.h>
#include <dsm/cli/dsm_cli.h>
#include <dsm/site/site.h>

namespace dsm::cli {

namespace {

// "all" (or nothing) means both services.
Result<std::optional<site::ServiceKind>> parseService(const std::string& name) {
    if (name.empty() || name == "all") {
        return std::optional<site::ServiceKind>();
    }
    auto kind = site::parseServiceName(name);
    if (!kind) {
        return Error{ErrorCode::InvalidArgument, "Unknown service '" + name + "' (www, db, all)"};
    }
    return std::optional<site::ServiceKind>(*kind);
}

} // namespace

/**
 * start and stop share everything except the SiteManager call.
 */
class ServiceCommand : public ICommand {
public:
    explicit ServiceCommand(bool starting) : starting_(starting) {}

    std::string getName() const override { return starting_ ? "start" : "stop"; }

    std::string getDescription() const override {
        return starting_ ? "Start the services of a site" : "Stop the services of a site";
    }

    void registerCommand(CLI::App& app, DsmCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand(getName(), getDescription());
        cmd->add_option("id", id_, "Site id")->required();
        cmd->add_option("-s,--service", service_, "www, db or all")
            ->default_val("all")
            ->check(CLI::IsMember({"www", "web", "db", "database", "all"}));

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto service = parseService(service_);
        if (!service) {
            return service.error();
        }
        const auto& manager = cli_->getSiteManager();
        auto result = starting_ ? manager.start(id_, service.value())
                                : manager.stop(id_, service.value());
        if (!result) {
            return result;
        }
        std::cout << (starting_ ? "Started " : "Stopped ") << service_ << " of site " << id_
                  << "\n";
        return Result<void>();
    }

private:
    DsmCLI* cli_ = nullptr;
    bool starting_;
    std::string id_;
    std::string service_ = "all";
};

std::unique_ptr<ICommand> createStartCommand() {
    return std::make_unique<ServiceCommand>(true);
}

std::unique_ptr<ICommand> createStopCommand() {
    return std::make_unique<ServiceCommand>(false);
}

} // namespace dsm::cli
