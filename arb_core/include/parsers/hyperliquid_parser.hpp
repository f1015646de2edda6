#pragma once
#include "imessage_parser.hpp"
#include <simdjson.h>

// Parses the public ws feed: subscriptionResponse and l2Book channels
class HyperliquidParser : public IMessageParser {
public:
    ParseResultType parse(
        const std::string& payload,
        OrderBookSnapshot& out_depth,
        std::string& out_error
    ) override;

private:
    simdjson::ondemand::parser parser_;
};
