#include <dsm/site/stacks.h>

#include <spdlog/spdlog.h>

namespace dsm::site {

std::vector<std::filesystem::path> Apache2Stack::directories(const Site& site) const {
    auto www = site.serviceDir(ServiceKind::Web);
    return {www, www / "log", www / "lock", www / "run", site.docDir()};
}

Result<templating::SubstitutionContext> Apache2Stack::context(const Site& site) const {
    if (settings_.apache2.empty()) {
        return Error{ErrorCode::NotFound, "apache2 executable not found; set [web] daemon"};
    }

    auto ctx = baseContext(site, settings_);
    auto www = site.serviceDir(ServiceKind::Web);
    ctx["DAEMON"] = settings_.apache2.string();
    ctx["SERVERROOT"] = www.string();
    ctx["SERVERNAME"] = settings_.user + "-" + site.id;
    ctx["HTTP_PORT"] = std::to_string(site.httpPort());
    ctx["HTTPS_PORT"] = std::to_string(site.httpsPort());
    ctx["LOCKDIR"] = (www / "lock").string();
    ctx["LOCKFILE"] = "accept.lock";
    ctx["PIDPATH"] = site.pidFile(ServiceKind::Web).string();
    ctx["LOGDIR"] = site.logDir(ServiceKind::Web).string();
    ctx["ERRLOGFILE"] = "apache2_error.log";
    ctx["ACCLOGFILE"] = "apache2_access.log";
    ctx["DOCDIR"] = site.docDir().string();
    ctx["MODULEDIR"] = settings_.apacheModuleDir.string();
    ctx["CONFPATH"] = (site.directory / "apache2.conf").string();
    return ctx;
}

std::vector<TemplateFile> Apache2Stack::files() const {
    return {
        {"apache2/" + apacheVersion() + ".conf", "apache2.conf", kConfigMode},
        {"apache2/start", "www.start", kScriptMode},
        {"apache2/stop", "www.stop", kScriptMode},
        {"apache2/isrunning", "www.isrunning", kScriptMode},
    };
}

std::string Apache2Stack::apacheVersion() const {
    if (settings_.apacheVersion != "auto") {
        return settings_.apacheVersion;
    }

    process::CommandSpec spec;
    spec.argv = {settings_.apache2.string(), "-v"};
    spec.captureOutput = true;
    auto res = process::runCommand(spec);
    if (!res || !res.value().ok()) {
        spdlog::debug("Could not query the apache2 version, assuming 2.4");
        return "2.4";
    }
    // "Server version: Apache/2.2.22 (Ubuntu)"
    if (res.value().output.find("Apache/2.2.") != std::string::npos) {
        return "2.2";
    }
    return "2.4";
}

} // namespace dsm::site
