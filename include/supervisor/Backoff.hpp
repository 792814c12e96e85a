#pragma once

#include <chrono>

namespace usd::supervisor {

// Exponential restart delay: base, 2*base, 4*base, ... capped at max.
class Backoff {
public:
    Backoff(std::chrono::milliseconds base, std::chrono::milliseconds max);

    // Delay before the restart that follows the `failures`-th consecutive failure (1-based).
    [[nodiscard]] std::chrono::milliseconds delayFor(unsigned int failures) const;

    [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
    [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }

private:
    std::chrono::milliseconds base_, max_;
};

}
