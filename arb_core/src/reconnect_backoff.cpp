#include "reconnect_backoff.hpp"
#include <algorithm>

ReconnectBackoff::ReconnectBackoff(std::chrono::seconds initial, std::chrono::seconds max_delay)
    : initial_(initial), max_delay_(std::max(initial, max_delay)), current_(initial)
{
}

std::chrono::seconds ReconnectBackoff::next_delay() {
    std::chrono::seconds delay = current_;
    current_ = std::min(current_ * 2, max_delay_);
    return delay;
}

void ReconnectBackoff::reset() {
    current_ = initial_;
}
