#include <dsm/site/service_stack.h>

#include <dsm/site/stacks.h>

namespace dsm::site {

templating::SubstitutionContext baseContext(const Site& site, const config::Settings& settings) {
    return {
        {"SITE", site.id},
        {"USER", settings.user},
        {"GROUP", settings.group},
        {"DIRECTORY", site.directory.string()},
        {"CONTROLLER", settings.controller.string()},
        {"START_TIMEOUT", std::to_string(settings.startTimeout.count())},
        {"STOP_TIMEOUT", std::to_string(settings.stopTimeout.count())},
    };
}

Result<std::unique_ptr<IServiceStack>> makeWebStack(const std::string& name,
                                                    const config::Settings& settings,
                                                    const templating::TemplateLibrary& templates) {
    if (name == "apache2") {
        return std::unique_ptr<IServiceStack>(std::make_unique<Apache2Stack>(settings, templates));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown web server '" + name + "'"};
}

Result<std::unique_ptr<IServiceStack>>
makeDatabaseStack(const std::string& name, const config::Settings& settings,
                  const templating::TemplateLibrary& templates) {
    if (name == "mysql") {
        return std::unique_ptr<IServiceStack>(std::make_unique<MysqlStack>(settings, templates));
    }
    if (name == "pgsql" || name == "postgresql") {
        return std::unique_ptr<IServiceStack>(std::make_unique<PgsqlStack>(settings, templates));
    }
    return Error{ErrorCode::InvalidArgument, "Unknown database engine '" + name + "'"};
}

} // namespace dsm::site
