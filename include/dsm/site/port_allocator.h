#pragma once

#include <set>

#include <dsm/core/types.h>

namespace dsm::site {

/**
 * Hands out base ports from [portMin, portMax].
 *
 * Each site consumes `stride` consecutive ports (HTTP, HTTPS, DB), so a
 * candidate is free only when its whole stride fits in the range and does
 * not overlap the stride of any existing base port.
 */
class PortAllocator {
public:
    PortAllocator(int portMin, int portMax, int stride)
        : portMin_(portMin), portMax_(portMax), stride_(stride) {}

    // Lowest free base port, or PortRangeExhausted.
    Result<int> allocate(const std::set<int>& existing) const;

    // Check a caller-chosen base port against the range and existing sites.
    Result<void> validate(int port, const std::set<int>& existing) const;

    int portMin() const { return portMin_; }
    int portMax() const { return portMax_; }
    int stride() const { return stride_; }

private:
    bool overlaps(int port, const std::set<int>& existing) const;
    Result<void> checkRange() const;

    int portMin_;
    int portMax_;
    int stride_;
};

} // namespace dsm::site
