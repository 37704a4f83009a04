#include <spdlog/spdlog.h>
#include <iostream>
#include <dsm/cli/command_registry.h>
#include <dsm/cli/dsm_cli.h>
#include <dsm/config/config_helpers.h>
#include <dsm/core/exit_codes.h>
#include <dsm/core/log_level.h>
#include <dsm/version.hpp>

namespace dsm::cli {

DsmCLI::DsmCLI() {
    // Conservative default; finalized after parsing flags in run()
    spdlog::set_level(spdlog::level::warn);

    app_ = std::make_unique<CLI::App>("Local development sites (Apache + MySQL/PostgreSQL)",
                                      "dsm");
    app_->set_version_flag("--version", std::string(version::string_v));
    app_->require_subcommand(1);

    app_->add_option("--config", configPath_,
                     "Configuration file (default ~/.config/dsm/config.toml)");
    app_->add_option("--base", baseDir_, "Directory holding the sites (default ~/www)");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format where supported");

    registerBuiltinCommands();
}

DsmCLI::~DsmCLI() = default;

int DsmCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        // --help and --version arrive here with exit code 0
        int code = app_->exit(e);
        return code == 0 ? exit_code::Success : exit_code::Usage;
    }

    applyLogLevel(verbose_);

    if (!pendingCommand_) {
        return exit_code::Success;
    }

    auto result = ensureInitialized();
    if (result) {
        result = pendingCommand_->execute();
    }
    if (!result) {
        std::cerr << "Error: " << result.error().message << "\n";
        spdlog::debug("{} failed with {}", pendingCommand_->getName(), result.error().code);
        return exitCodeFor(result.error().code);
    }
    return exit_code::Success;
}

Result<void> DsmCLI::ensureInitialized() {
    if (siteManager_) {
        return Result<void>();
    }

    auto loaded = config::loadSettings(config::get_config_path(configPath_), baseDir_);
    if (!loaded) {
        return loaded.error();
    }
    settings_ = loaded.value();
    templates_ = std::make_unique<templating::TemplateLibrary>(settings_->templateDir);
    siteManager_ = std::make_unique<site::SiteManager>(*settings_, *templates_);
    return Result<void>();
}

void DsmCLI::registerBuiltinCommands() {
    CommandRegistry::registerAllCommands(this);
}

void DsmCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

} // namespace dsm::cli
