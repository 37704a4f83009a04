#pragma once

#include <dsm/core/types.h>

namespace dsm {

// Process exit statuses shared by dsm and dsm-ctl.
namespace exit_code {
inline constexpr int Success = 0;
inline constexpr int Failure = 1; // operation failed after it started
inline constexpr int Timeout = 2; // readiness wait expired
inline constexpr int Usage = 64;  // bad arguments or failed validation
} // namespace exit_code

constexpr int exitCodeFor(ErrorCode code) {
    if (code == ErrorCode::Success) {
        return exit_code::Success;
    }
    if (code == ErrorCode::ProcessStartTimeout || code == ErrorCode::ProcessStopTimeout) {
        return exit_code::Timeout;
    }
    if (isValidationError(code)) {
        return exit_code::Usage;
    }
    return exit_code::Failure;
}

} // namespace dsm
