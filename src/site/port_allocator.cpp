#include <dsm/site/port_allocator.h>

#include <string>

namespace dsm::site {

Result<void> PortAllocator::checkRange() const {
    if (stride_ <= 0 || portMin_ <= 0 || portMax_ > 65535 || portMin_ > portMax_) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid port range [" + std::to_string(portMin_) + ", " +
                         std::to_string(portMax_) + "] with stride " + std::to_string(stride_)};
    }
    return Result<void>();
}

bool PortAllocator::overlaps(int port, const std::set<int>& existing) const {
    // Any existing base in (port - stride, port + stride) shares at least one port.
    // Only called with ports inside [portMin_, portMax_], so neither bound overflows.
    auto it = existing.lower_bound(port - (stride_ - 1));
    return it != existing.end() && *it - port < stride_;
}

Result<int> PortAllocator::allocate(const std::set<int>& existing) const {
    if (auto range = checkRange(); !range) {
        return range.error();
    }

    const int lastBase = portMax_ - (stride_ - 1);
    for (int port = portMin_; port <= lastBase; port += stride_) {
        if (!overlaps(port, existing)) {
            return port;
        }
    }
    return Error{ErrorCode::PortRangeExhausted,
                 "No free port between " + std::to_string(portMin_) + " and " +
                     std::to_string(portMax_)};
}

Result<void> PortAllocator::validate(int port, const std::set<int>& existing) const {
    if (auto range = checkRange(); !range) {
        return range;
    }
    // Overflow-free for any int port.
    if (port < portMin_ || port > portMax_ - (stride_ - 1)) {
        return Error{ErrorCode::InvalidArgument,
                     "Port " + std::to_string(port) + " is outside [" + std::to_string(portMin_) +
                         ", " + std::to_string(portMax_) + "]"};
    }
    if (overlaps(port, existing)) {
        return Error{ErrorCode::PortRangeExhausted,
                     "Port " + std::to_string(port) + " is already used by another site"};
    }
    return Result<void>();
}

} // namespace dsm::site
