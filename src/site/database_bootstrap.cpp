#include <dsm/site/stacks.h>

#include <spdlog/spdlog.h>

#include <chrono>

#include <dsm/process/readiness.h>
#include <dsm/site/service_scripts.h>

namespace dsm::site {

namespace {

// A freshly initialised server can take a while to accept its first client.
constexpr std::chrono::seconds kClientReadyTimeout{30};

Error bootstrapError(const Site& site, const std::string& what) {
    return Error{ErrorCode::DatabaseBootstrapFailed,
                 "Database bootstrap of site " + site.id + " failed: " + what};
}

} // namespace

Result<void> bootstrapDatabase(const Site& site, const process::CommandSpec& probe,
                               const process::CommandSpec& create) {
    auto started = runServiceScript(site, ServiceKind::Database, ServiceAction::Start);
    if (!started) {
        return bootstrapError(site, "server did not start: " + started.error().message);
    }

    Result<void> outcome;
    bool ready = process::waitFor(
        [&probe]() {
            auto res = process::runCommand(probe);
            return res && res.value().ok();
        },
        kClientReadyTimeout);

    if (!ready) {
        outcome = bootstrapError(site, "server is not accepting connections");
    } else {
        auto res = process::runCommand(create);
        if (!res) {
            outcome = bootstrapError(site, res.error().message);
        } else if (!res.value().ok()) {
            outcome = bootstrapError(site, "creating the database exited with status " +
                                               std::to_string(res.value().exitCode));
        }
    }

    auto stopped = runServiceScript(site, ServiceKind::Database, ServiceAction::Stop);
    if (!stopped) {
        spdlog::warn("Stopping the bootstrap database server of {} failed: {}", site.id,
                     stopped.error().message);
        if (outcome) {
            outcome = bootstrapError(site, "server did not stop: " + stopped.error().message);
        }
    }
    return outcome;
}

} // namespace dsm::site
