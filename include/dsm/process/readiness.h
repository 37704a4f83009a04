#pragma once

#include <chrono>
#include <functional>

namespace dsm::process {

inline constexpr std::chrono::milliseconds kDefaultPollInterval{500};

/**
 * Bounded readiness wait.
 *
 * The condition is evaluated immediately, then once per interval until it
 * returns true or the timeout elapses. A final evaluation is made at the
 * deadline. Returns true on the first success, false on timeout.
 */
bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout,
             std::chrono::milliseconds interval = kDefaultPollInterval);

} // namespace dsm::process
