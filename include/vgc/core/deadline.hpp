#pragma once

#include <chrono>

namespace vgc {

/**
 * Wall-clock budget shared by every stage of one turn decision.
 */
class Deadline {
public:
    using Clock = std::chrono::high_resolution_clock;

    static Deadline none() { return Deadline(); }

    static Deadline after(float seconds) {
        Deadline d;
        if (seconds > 0) {
            d.unlimited_ = false;
            d.at_ = Clock::now() + std::chrono::microseconds(
                static_cast<long long>(seconds * 1e6f));
        }
        return d;
    }

    bool expired() const {
        return !unlimited_ && Clock::now() >= at_;
    }

    bool unlimited() const { return unlimited_; }

    float remaining_seconds() const {
        if (unlimited_) return 1e9f;
        auto left = std::chrono::duration<float>(at_ - Clock::now()).count();
        return left > 0 ? left : 0.0f;
    }

private:
    Deadline() = default;

    Clock::time_point at_{};
    bool unlimited_ = true;
};

}  // namespace vgc
