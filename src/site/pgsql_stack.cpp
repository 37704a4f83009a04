#include <dsm/site/stacks.h>

#include <spdlog/spdlog.h>

namespace dsm::site {

std::filesystem::path PgsqlStack::binary(const char* name) const {
    if (settings_.postgresBinDir.empty()) {
        return name;
    }
    return settings_.postgresBinDir / name;
}

std::vector<std::filesystem::path> PgsqlStack::directories(const Site& site) const {
    // db/data is created by initdb with the permissions it insists on.
    return {site.serviceDir(ServiceKind::Database), site.logDir(ServiceKind::Database),
            site.runDir(ServiceKind::Database)};
}

Result<void> PgsqlStack::prepare(const Site& site) const {
    process::CommandSpec initdb;
    initdb.argv = {binary("initdb").string(), "--pgdata=" + site.dataDir().string(),
                   "--username=" + settings_.user, "--auth=trust"};
    spdlog::info("Initialising PostgreSQL cluster of {}", site.id);
    auto res = process::runCommand(initdb);
    if (!res) {
        return Error{ErrorCode::DatabaseBootstrapFailed, res.error().message};
    }
    if (!res.value().ok()) {
        return Error{ErrorCode::DatabaseBootstrapFailed,
                     "initdb for site " + site.id + " exited with status " +
                         std::to_string(res.value().exitCode)};
    }
    return Result<void>();
}

Result<templating::SubstitutionContext> PgsqlStack::context(const Site& site) const {
    auto ctx = baseContext(site, settings_);
    ctx["DAEMON"] = binary("postgres").string();
    ctx["PORT"] = std::to_string(site.databasePort());
    ctx["DATADIR"] = site.dataDir().string();
    ctx["RUNDIR"] = site.runDir(ServiceKind::Database).string();
    ctx["LOGDIR"] = site.logDir(ServiceKind::Database).string();
    ctx["LOGPATH"] = (site.logDir(ServiceKind::Database) / "pgsql_error.log").string();
    ctx["PIDPATH"] = site.pidFile(ServiceKind::Database).string();
    ctx["CONFPATH"] = (site.dataDir() / "postgresql.conf").string();
    return ctx;
}

std::vector<TemplateFile> PgsqlStack::files() const {
    return {
        {"pgsql/conf", "db/data/postgresql.conf", kConfigMode},
        {"pgsql/pg_hba.conf", "db/data/pg_hba.conf", kConfigMode},
        {"pgsql/pg_ident.conf", "db/data/pg_ident.conf", kConfigMode},
        {"pgsql/start", "db.start", kScriptMode},
        {"pgsql/stop", "db.stop", kScriptMode},
        {"pgsql/isrunning", "db.isrunning", kScriptMode},
    };
}

Result<void> PgsqlStack::bootstrap(const Site& site) const {
    auto createTmpl = templates_.get("pgsql/create");
    if (!createTmpl) {
        return createTmpl.error();
    }
    auto sql = templating::render(createTmpl.value(), {{"DATABASE", site.id},
                                                       {"DBUSER", site.id},
                                                       {"PASSWORD", site.id}});
    if (!sql) {
        return sql.error();
    }

    const std::vector<std::string> connect = {
        binary("psql").string(), "-h", site.runDir(ServiceKind::Database).string(),
        "-p", std::to_string(site.databasePort()), "-U", settings_.user, "-d", "postgres"};

    process::CommandSpec probe;
    probe.argv = connect;
    probe.argv.insert(probe.argv.end(), {"-c", "SELECT 1"});

    process::CommandSpec create;
    create.argv = connect;
    create.argv.insert(create.argv.end(), {"-v", "ON_ERROR_STOP=1"});
    create.input = sql.value();

    return bootstrapDatabase(site, probe, create);
}

} // namespace dsm::site
