#include "entities/price_state.hpp"
#include <limits>

double PriceState::entry_spread() const {
    if (!is_ready()) return 0.0;
    return (perp.best_bid - spot.best_ask) / spot.best_ask;
}

double PriceState::exit_spread() const {
    if (!is_ready()) return std::numeric_limits<double>::infinity();
    return (perp.best_ask - spot.best_bid) / spot.best_bid;
}
