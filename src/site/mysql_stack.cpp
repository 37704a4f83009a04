#include <dsm/site/stacks.h>

#include <spdlog/spdlog.h>

namespace dsm::site {

std::filesystem::path MysqlStack::configPath(const Site& site) const {
    return site.directory / "mysql.conf";
}

std::vector<std::filesystem::path> MysqlStack::directories(const Site& site) const {
    return {site.serviceDir(ServiceKind::Database), site.logDir(ServiceKind::Database),
            site.runDir(ServiceKind::Database), site.dataDir()};
}

Result<templating::SubstitutionContext> MysqlStack::context(const Site& site) const {
    if (settings_.mysqld.empty()) {
        return Error{ErrorCode::NotFound, "mysqld executable not found; set [database] mysqld"};
    }

    auto ctx = baseContext(site, settings_);
    ctx["DAEMON"] = settings_.mysqld.string();
    ctx["CONFPATH"] = configPath(site).string();
    ctx["PORT"] = std::to_string(site.databasePort());
    ctx["LOGDIR"] = site.logDir(ServiceKind::Database).string();
    ctx["LOGPATH"] = (site.logDir(ServiceKind::Database) / "mysql_error.log").string();
    ctx["SOCKPATH"] = (site.runDir(ServiceKind::Database) / "mysqld.sock").string();
    ctx["PIDPATH"] = site.pidFile(ServiceKind::Database).string();
    ctx["DATADIR"] = site.dataDir().string();
    ctx["RUNDIR"] = site.runDir(ServiceKind::Database).string();
    ctx["ID"] = std::to_string(site.port);
    return ctx;
}

std::vector<TemplateFile> MysqlStack::files() const {
    return {
        {"mysql/conf", "mysql.conf", kConfigMode},
        {"mysql/start", "db.start", kScriptMode},
        {"mysql/stop", "db.stop", kScriptMode},
        {"mysql/isrunning", "db.isrunning", kScriptMode},
    };
}

Result<void> MysqlStack::bootstrap(const Site& site) const {
    if (settings_.mysqlInstallDb.empty()) {
        return Error{ErrorCode::DatabaseBootstrapFailed, "mysql_install_db not found"};
    }
    const std::string defaults = "--defaults-file=" + configPath(site).string();

    process::CommandSpec init;
    if (settings_.mysqlInstallDb.filename() == "mysqld") {
        init.argv = {settings_.mysqlInstallDb.string(), defaults, "--initialize-insecure"};
    } else {
        init.argv = {settings_.mysqlInstallDb.string(), defaults};
    }
    spdlog::info("Initialising MySQL data directory of {}", site.id);
    auto initialised = process::runCommand(init);
    if (!initialised || !initialised.value().ok()) {
        return Error{ErrorCode::DatabaseBootstrapFailed,
                     "Database bootstrap of site " + site.id + " failed: " +
                         init.argv.front() + " did not complete"};
    }

    auto createTmpl = templates_.get("mysql/create");
    if (!createTmpl) {
        return createTmpl.error();
    }
    templating::SubstitutionContext vars = {
        {"DATABASE", site.id}, {"DBUSER", site.id}, {"PASSWORD", site.id}};
    auto sql = templating::render(createTmpl.value(), vars);
    if (!sql) {
        return sql.error();
    }

    const std::string client =
        settings_.mysqlClient.empty() ? std::string("mysql") : settings_.mysqlClient.string();

    process::CommandSpec probe;
    probe.argv = {client, defaults, "--user=root", "-e", "SELECT 1"};

    process::CommandSpec create;
    create.argv = {client, defaults, "--user=root"};
    create.input = sql.value();

    return bootstrapDatabase(site, probe, create);
}

} // namespace dsm::site
