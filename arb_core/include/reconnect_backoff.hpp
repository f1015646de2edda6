#pragma once
#include <chrono>

// Exponential reconnect delay: initial, x2 per failed attempt, capped.
class ReconnectBackoff {
public:
    ReconnectBackoff(std::chrono::seconds initial, std::chrono::seconds max_delay);

    // Delay to wait now. Advances the sequence.
    std::chrono::seconds next_delay();

    // Back to the initial delay (after a successful connect)
    void reset();

    std::chrono::seconds current() const { return current_; }

private:
    std::chrono::seconds initial_;
    std::chrono::seconds max_delay_;
    std::chrono::seconds current_;
};
