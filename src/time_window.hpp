#pragma once

#include "impression.hpp"

namespace adsim {

// Half-open active interval [start, end) in seconds since day start.
struct TimeWindow {
    double start{0.0};
    double end{kSecondsPerDay};

    [[nodiscard]] bool contains(double time) const noexcept {
        return time >= start && time < end;
    }

    [[nodiscard]] double length() const noexcept { return end - start; }

    [[nodiscard]] double elapsed_fraction(double time) const noexcept {
        if (time <= start) {
            return 0.0;
        }
        if (time >= end) {
            return 1.0;
        }
        return (time - start) / length();
    }
};

} // namespace adsim
