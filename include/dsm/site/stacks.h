#pragma once

#include <dsm/process/command_runner.h>
#include <dsm/site/service_stack.h>

namespace dsm::site {

class Apache2Stack final : public IServiceStack {
public:
    Apache2Stack(const config::Settings& settings, const templating::TemplateLibrary& templates)
        : settings_(settings), templates_(templates) {}

    std::string name() const override { return "apache2"; }
    ServiceKind kind() const override { return ServiceKind::Web; }
    std::vector<std::filesystem::path> directories(const Site& site) const override;
    Result<templating::SubstitutionContext> context(const Site& site) const override;
    std::vector<TemplateFile> files() const override;

    // "2.2" or "2.4"; "auto" in the settings asks the apache2 binary.
    std::string apacheVersion() const;

private:
    const config::Settings& settings_;
    const templating::TemplateLibrary& templates_;
};

class MysqlStack final : public IServiceStack {
public:
    MysqlStack(const config::Settings& settings, const templating::TemplateLibrary& templates)
        : settings_(settings), templates_(templates) {}

    std::string name() const override { return "mysql"; }
    ServiceKind kind() const override { return ServiceKind::Database; }
    std::vector<std::filesystem::path> directories(const Site& site) const override;
    Result<templating::SubstitutionContext> context(const Site& site) const override;
    std::vector<TemplateFile> files() const override;

    // mysql_install_db, then create the site's database and user on a transient server.
    Result<void> bootstrap(const Site& site) const override;

private:
    std::filesystem::path configPath(const Site& site) const;

    const config::Settings& settings_;
    const templating::TemplateLibrary& templates_;
};

class PgsqlStack final : public IServiceStack {
public:
    PgsqlStack(const config::Settings& settings, const templating::TemplateLibrary& templates)
        : settings_(settings), templates_(templates) {}

    std::string name() const override { return "pgsql"; }
    ServiceKind kind() const override { return ServiceKind::Database; }
    std::vector<std::filesystem::path> directories(const Site& site) const override;

    // initdb; it refuses a non-empty data directory, so it runs before rendering.
    Result<void> prepare(const Site& site) const override;

    Result<templating::SubstitutionContext> context(const Site& site) const override;
    std::vector<TemplateFile> files() const override;
    Result<void> bootstrap(const Site& site) const override;

private:
    std::filesystem::path binary(const char* name) const;

    const config::Settings& settings_;
    const templating::TemplateLibrary& templates_;
};

/**
 * Shared database bootstrap sequence: start the server through db.start,
 * poll `probe` until the server accepts clients, run `create`, then stop the
 * server through db.stop. The server is stopped even when a step fails.
 * Every failure is reported as DatabaseBootstrapFailed.
 */
Result<void> bootstrapDatabase(const Site& site, const process::CommandSpec& probe,
                               const process::CommandSpec& create);

} // namespace dsm::site
