#pragma once
#include <string>
#include "../entities/market_depth.hpp"

enum class ParseResultType {
    None,            // valid frame we don't care about
    SubscriptionAck,
    Depth,
    Malformed
};

class IMessageParser {
public:
    virtual ~IMessageParser() = default;

    // out_error is filled only for Malformed
    virtual ParseResultType parse(
        const std::string& payload,
        OrderBookSnapshot& out_depth,
        std::string& out_error
    ) = 0;
};
