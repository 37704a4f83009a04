#include <dsm/site/service_scripts.h>

#include <spdlog/spdlog.h>

#include <dsm/process/command_runner.h>
#include <dsm/process/pid_file.h>
#include <dsm/process/process_controller.h>

namespace dsm::site {

Result<void> runServiceScript(const Site& site, ServiceKind kind, ServiceAction action) {
    auto script = site.scriptPath(kind, action);
    std::error_code ec;
    if (!std::filesystem::exists(script, ec)) {
        return Error{ErrorCode::NotFound, "Missing control script " + script.string()};
    }

    process::CommandSpec spec;
    spec.argv = {script.string()};
    spec.quiet = (action == ServiceAction::IsRunning);
    auto res = process::runCommand(spec);
    if (!res) {
        return res.error();
    }

    int code = res.value().exitCode;
    if (code == 0) {
        return Result<void>();
    }
    if (action == ServiceAction::IsRunning) {
        return Error{ErrorCode::NotFound,
                     std::string(serviceName(kind)) + " of site " + site.id + " is not running"};
    }
    if (code == 2) {
        return Error{action == ServiceAction::Start ? ErrorCode::ProcessStartTimeout
                                                    : ErrorCode::ProcessStopTimeout,
                     script.filename().string() + " timed out for site " + site.id};
    }
    return Error{ErrorCode::InternalError,
                 script.filename().string() + " exited with status " + std::to_string(code)};
}

void stopServicesBestEffort(const Site& site) {
    for (auto kind : {ServiceKind::Web, ServiceKind::Database}) {
        process::PidFile pidFile(site.pidFile(kind));
        if (!pidFile.exists()) {
            continue;
        }

        auto stopped = runServiceScript(site, kind, ServiceAction::Stop);
        if (stopped) {
            continue;
        }
        spdlog::warn("Stopping {} of site {} failed: {}", serviceName(kind), site.id,
                     stopped.error().message);

        // The script may be damaged; signal the recorded process directly.
        if (pidFile.isRunning()) {
            process::ProcessController controller;
            process::StopSpec spec;
            spec.pidFile = pidFile.path();
            if (auto direct = controller.stop(spec); !direct) {
                spdlog::warn("{} of site {} is still running: {}", serviceName(kind), site.id,
                             direct.error().message);
            }
        }
    }
}

} // namespace dsm::site
