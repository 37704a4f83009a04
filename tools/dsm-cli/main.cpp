#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <dsm/cli/dsm_cli.h>
#include <dsm/core/exit_codes.h>

int main(int argc, char* argv[]) {
    try {
        // stdout carries command output; diagnostics go to stderr
        spdlog::set_default_logger(spdlog::stderr_color_mt("dsm"));
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        dsm::cli::DsmCLI cli;
        return cli.run(argc, argv);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return dsm::exit_code::Failure;
    }
}
