// arb_core/include/entities/price_state.hpp
#pragma once
#include "order_book_state.hpp"

// Both legs of the pair. Spreads are derived, never stored.
struct PriceState {
    OrderBookState spot;
    OrderBookState perp;

    bool is_ready() const { return spot.is_valid() && perp.is_valid(); }

    // (perp_bid - spot_ask) / spot_ask; 0 when not ready.
    // Positive = buy spot, short perp.
    double entry_spread() const;

    // (perp_ask - spot_bid) / spot_bid; +inf when not ready so a missing
    // quote can never look like an exit signal.
    double exit_spread() const;
};
