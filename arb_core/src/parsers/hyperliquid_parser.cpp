#include "parsers/hyperliquid_parser.hpp"
#include <charconv>
#include <chrono>

// Prices and sizes come as decimal strings, but accept plain numbers too
static double extract_double(simdjson::ondemand::value val) {
    double res = 0.0;
    if (auto num = val.get_double(); !num.error()) {
        return num.value();
    }
    std::string_view sv;
    if (auto str = val.get_string(); !str.error()) {
        sv = str.value();
        if (sv.empty()) return 0.0;
        std::from_chars(sv.data(), sv.data() + sv.size(), res);
        return res;
    }
    return 0.0;
}

static double extract_from_result(simdjson::simdjson_result<simdjson::ondemand::value> res) {
    if (!res.error()) {
        return extract_double(res.value());
    }
    return 0.0;
}

ParseResultType HyperliquidParser::parse(
    const std::string& payload,
    OrderBookSnapshot& out_depth,
    std::string& out_error
) {
    simdjson::padded_string json_data(payload);

    try {
        simdjson::ondemand::document doc;
        if (auto err = parser_.iterate(json_data).get(doc); err) {
            out_error = simdjson::error_message(err);
            return ParseResultType::Malformed;
        }

        simdjson::ondemand::object obj;
        if (auto err = doc.get_object().get(obj); err) {
            out_error = simdjson::error_message(err);
            return ParseResultType::Malformed;
        }

        std::string_view channel_sv;
        auto channel_err = obj["channel"].get_string().get(channel_sv);
        if (channel_err == simdjson::NO_SUCH_FIELD) {
            return ParseResultType::None;
        }
        if (channel_err) {
            out_error = std::string("bad channel: ") + simdjson::error_message(channel_err);
            return ParseResultType::Malformed;
        }

        if (channel_sv == "subscriptionResponse") {
            return ParseResultType::SubscriptionAck;
        }
        if (channel_sv != "l2Book") {
            return ParseResultType::None;
        }

        simdjson::ondemand::object data_obj;
        if (auto err = obj["data"].get_object().get(data_obj); err) {
            out_error = std::string("l2Book without data: ") + simdjson::error_message(err);
            return ParseResultType::Malformed;
        }

        std::string_view coin;
        if (auto err = data_obj["coin"].get_string().get(coin); err) {
            out_error = std::string("l2Book without coin: ") + simdjson::error_message(err);
            return ParseResultType::Malformed;
        }
        out_depth.symbol = std::string(coin);

        int64_t ts = 0;
        if (!data_obj["time"].get_int64().get(ts)) out_depth.timestamp = ts;

        simdjson::ondemand::array levels;
        if (auto err = data_obj["levels"].get_array().get(levels); err) {
            out_error = std::string("l2Book without levels: ") + simdjson::error_message(err);
            return ParseResultType::Malformed;
        }

        out_depth.bids.clear();
        out_depth.asks.clear();

        // levels[0] = bids, levels[1] = asks, best first
        size_t side = 0;
        for (auto side_val : levels) {
            simdjson::ondemand::array side_arr;
            if (auto err = side_val.get_array().get(side_arr); err) {
                out_error = std::string("bad book side: ") + simdjson::error_message(err);
                return ParseResultType::Malformed;
            }

            std::vector<PriceLevel>& target = (side == 0) ? out_depth.bids : out_depth.asks;
            for (auto level_val : side_arr) {
                simdjson::ondemand::object level_obj;
                if (auto err = level_val.get_object().get(level_obj); err) {
                    out_error = std::string("bad book level: ") + simdjson::error_message(err);
                    return ParseResultType::Malformed;
                }
                PriceLevel level;
                level.price = extract_from_result(level_obj["px"]);
                level.quantity = extract_from_result(level_obj["sz"]);
                target.push_back(level);
            }

            if (++side == 2) break;
        }

        auto now = std::chrono::system_clock::now();
        out_depth.local_timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

        return ParseResultType::Depth;

    } catch (const simdjson::simdjson_error& e) {
        out_error = e.what();
    }
    return ParseResultType::Malformed;
}
