#include "supervisor/Backoff.hpp"

#include <algorithm>
#include <stdexcept>

namespace usd::supervisor {

Backoff::Backoff(const std::chrono::milliseconds base, const std::chrono::milliseconds max)
    : base_(base), max_(std::max(base, max)) {
    if (base_.count() < 0) throw std::invalid_argument("backoff base must not be negative");
}

std::chrono::milliseconds Backoff::delayFor(const unsigned int failures) const {
    if (failures <= 1 || base_.count() == 0) return std::min(base_, max_);

    auto delay = base_;
    for (unsigned int i = 1; i < failures && delay < max_; ++i) delay *= 2;
    return std::min(delay, max_);
}

}
