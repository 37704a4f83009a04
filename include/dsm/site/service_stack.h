#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <dsm/config/settings.h>
#include <dsm/core/types.h>
#include <dsm/site/site.h>
#include <dsm/template/template_renderer.h>

namespace dsm::site {

// One rendered artifact: template name, destination relative to the site directory, mode.
struct TemplateFile {
    std::string templateName;
    std::filesystem::path destination;
    std::filesystem::perms mode;
};

inline constexpr std::filesystem::perms kConfigMode =
    std::filesystem::perms::owner_read | std::filesystem::perms::owner_write;
inline constexpr std::filesystem::perms kScriptMode = std::filesystem::perms::owner_all;

/**
 * Interface for the server software behind one half of a site.
 *
 * The installer calls, in order: directories(), prepare(), context() and
 * files() for rendering, then bootstrap(). Implementations hold no per-site
 * state; everything is derived from the Site passed in.
 */
class IServiceStack {
public:
    virtual ~IServiceStack() = default;

    virtual std::string name() const = 0;
    virtual ServiceKind kind() const = 0;

    // Absolute directories to create before anything is rendered.
    virtual std::vector<std::filesystem::path> directories(const Site& site) const = 0;

    // Runs after the directories exist and before templates are written.
    virtual Result<void> prepare(const Site& site) const {
        (void)site;
        return Result<void>();
    }

    virtual Result<templating::SubstitutionContext> context(const Site& site) const = 0;

    virtual std::vector<TemplateFile> files() const = 0;

    // Runs after every template of both stacks is written.
    virtual Result<void> bootstrap(const Site& site) const {
        (void)site;
        return Result<void>();
    }
};

// Variables shared by every stack: SITE, USER, GROUP, DIRECTORY, CONTROLLER, timeouts.
templating::SubstitutionContext baseContext(const Site& site, const config::Settings& settings);

// Supported names: "apache2".
Result<std::unique_ptr<IServiceStack>> makeWebStack(const std::string& name,
                                                    const config::Settings& settings,
                                                    const templating::TemplateLibrary& templates);

// Supported names: "mysql", "pgsql".
Result<std::unique_ptr<IServiceStack>>
makeDatabaseStack(const std::string& name, const config::Settings& settings,
                  const templating::TemplateLibrary& templates);

} // namespace dsm::site
