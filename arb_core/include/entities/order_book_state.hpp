// arb_core/include/entities/order_book_state.hpp
#pragma once
#include <string>

// Top of book for one leg. Replaced wholesale on every update.
struct OrderBookState {
    std::string symbol;
    double best_bid = 0.0;
    double best_ask = 0.0;
    double bid_size = 0.0;
    double ask_size = 0.0;
    long long last_update = 0; // local receive time, ms

    bool is_valid() const { return best_bid > 0.0 && best_ask > 0.0; }
};
