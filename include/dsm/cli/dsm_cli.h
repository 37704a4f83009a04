#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <dsm/cli/command.h>
#include <dsm/config/settings.h>
#include <dsm/site/site_manager.h>
#include <dsm/template/template_renderer.h>

namespace dsm::cli {

/**
 * Main CLI application class
 */
class DsmCLI {
public:
    DsmCLI();
    ~DsmCLI();

    /**
     * Run the CLI with given arguments; returns the process exit code
     */
    int run(int argc, char* argv[]);

    /**
     * Load settings and build the site manager (lazy, once per run)
     */
    Result<void> ensureInitialized();

    const config::Settings& getSettings() const { return *settings_; }
    const templating::TemplateLibrary& getTemplates() const { return *templates_; }
    const site::SiteManager& getSiteManager() const { return *siteManager_; }

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until after parsing and log setup
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

private:
    void registerBuiltinCommands();

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    ICommand* pendingCommand_ = nullptr;

    std::string configPath_;
    std::string baseDir_;
    bool verbose_ = false;
    bool jsonOutput_ = false;

    std::optional<config::Settings> settings_;
    std::unique_ptr<templating::TemplateLibrary> templates_;
    std::unique_ptr<site::SiteManager> siteManager_;
};

} // namespace dsm::cli
