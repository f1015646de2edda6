// arb_core/include/entities/market_depth.hpp
#pragma once
#include <string>
#include <vector>

// One price level as it arrives on the wire
struct PriceLevel {
    double price = 0.0;
    double quantity = 0.0;
};

// Parsed l2Book frame (full snapshot, the exchange never sends deltas)
struct OrderBookSnapshot {
    std::string symbol;
    long long timestamp = 0;       // exchange time, ms
    long long local_timestamp = 0; // receive time, ms
    std::vector<PriceLevel> bids;
    std::vector<PriceLevel> asks;
};
