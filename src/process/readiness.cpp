#include <dsm/process/readiness.h>

#include <algorithm>
#include <thread>

namespace dsm::process {

bool waitFor(const std::function<bool()>& condition, std::chrono::milliseconds timeout,
             std::chrono::milliseconds interval) {
    if (condition()) {
        return true;
    }
    if (interval.count() <= 0) {
        interval = kDefaultPollInterval;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(interval, remaining));
        if (condition()) {
            return true;
        }
    }
}

} // namespace dsm::process
