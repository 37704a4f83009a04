#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <dsm/core/types.h>

namespace dsm::process {

struct CommandSpec {
    std::vector<std::string> argv;             // argv[0] is looked up in PATH
    std::optional<std::string> input;          // written to the child's stdin, then closed
    bool captureOutput = false;                // collect stdout into CommandResult::output
    bool quiet = true;                         // discard stderr (and stdout when not captured)
    std::optional<std::filesystem::path> workdir;
};

struct CommandResult {
    int exitCode = -1; // 128 + signal when the child was killed
    std::string output;

    bool ok() const { return exitCode == 0; }
};

/**
 * Run an external command to completion.
 *
 * Only spawning failures are errors; a non-zero exit status is reported
 * through CommandResult::exitCode. Exit code 127 means exec failed.
 */
Result<CommandResult> runCommand(const CommandSpec& spec);

// Locate an executable in PATH, then in the hint directories. Hints may be
// glob patterns such as "/usr/lib/postgresql/*/bin". Returns an empty path
// when nothing is found.
std::filesystem::path findExecutable(const std::string& name,
                                     const std::vector<std::string>& hints = {});

// Directory of the running executable (from /proc/self/exe), empty if unknown.
std::filesystem::path currentExecutableDir();

} // namespace dsm::process
