#include "execution_gateway.hpp"
#include <string>

// Exchange sends decimals as strings
static double json_to_double(const nlohmann::json& v) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) return std::stod(v.get<std::string>());
    throw GatewayError("expected a decimal, got " + v.dump());
}

double estimate_fee(double size, double price, double taker_fee_rate) {
    return size * price * taker_fee_rate;
}

Fill parse_order_response(const nlohmann::json& result, double taker_fee_rate) {
    Fill fill;

    try {
        if (!result.is_object() || !result.contains("status") || result["status"] != "ok") {
            fill.error = result.dump();
            return fill;
        }

        const auto& response = result.at("response");
        if (response.is_object() && response.contains("type") && response["type"] == "order") {
            const auto& statuses = response.at("data").at("statuses");
            for (const auto& status : statuses) {
                if (status.contains("filled")) {
                    const auto& filled = status["filled"];
                    fill.size = json_to_double(filled.at("totalSz"));
                    fill.price = json_to_double(filled.at("avgPx"));
                    if (filled.contains("oid")) {
                        const auto& oid = filled["oid"];
                        fill.order_id = oid.is_string() ? oid.get<std::string>() : oid.dump();
                    }
                    fill.fee = filled.contains("fee") ? json_to_double(filled["fee"])
                                                      : estimate_fee(fill.size, fill.price, taker_fee_rate);
                    if (fill.size <= 0.0) {
                        fill.error = "filled with zero size";
                        return fill;
                    }
                    fill.success = true;
                    return fill;
                }
                if (status.contains("error")) {
                    const auto& err = status["error"];
                    fill.error = err.is_string() ? err.get<std::string>() : err.dump();
                    return fill;
                }
            }
        }
        fill.error = "Unknown result format: " + result.dump();
    } catch (const std::exception& e) {
        fill.error = std::string("bad order response: ") + e.what();
    }
    fill.success = false;
    return fill;
}

double parse_funding_rate(const nlohmann::json& meta_and_ctxs, const std::string& perp_symbol) {
    try {
        const auto& universe = meta_and_ctxs.at(0).at("universe");
        const auto& ctxs = meta_and_ctxs.at(1);
        for (size_t i = 0; i < universe.size(); ++i) {
            if (universe[i].at("name") == perp_symbol) {
                return json_to_double(ctxs.at(i).at("funding"));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError(std::string("bad metaAndAssetCtxs response: ") + e.what());
    } catch (const std::logic_error& e) {
        throw GatewayError(std::string("bad funding value: ") + e.what());
    }
    throw GatewayError("no funding rate for " + perp_symbol);
}

double parse_available_margin(const nlohmann::json& clearinghouse_state) {
    try {
        if (clearinghouse_state.contains("withdrawable")) {
            return json_to_double(clearinghouse_state["withdrawable"]);
        }
        return json_to_double(clearinghouse_state.at("marginSummary").at("accountValue"));
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError(std::string("bad clearinghouseState response: ") + e.what());
    } catch (const std::logic_error& e) {
        throw GatewayError(std::string("bad margin value: ") + e.what());
    }
}

int parse_perp_asset(const nlohmann::json& meta, const std::string& perp_symbol) {
    try {
        const auto& universe = meta.at("universe");
        for (size_t i = 0; i < universe.size(); ++i) {
            if (universe[i].at("name") == perp_symbol) {
                return static_cast<int>(i);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError(std::string("bad meta response: ") + e.what());
    }
    throw GatewayError("unknown perp " + perp_symbol);
}

int parse_spot_asset(const nlohmann::json& spot_meta, const std::string& spot_symbol) {
    if (!spot_symbol.empty() && spot_symbol[0] == '@') {
        const std::string digits = spot_symbol.substr(1);
        if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 6) {
            throw GatewayError("bad spot symbol " + spot_symbol);
        }
        return kSpotAssetOffset + std::stoi(digits);
    }

    try {
        for (const auto& pair : spot_meta.at("universe")) {
            if (pair.at("name") == spot_symbol) {
                return kSpotAssetOffset + pair.at("index").get<int>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw GatewayError(std::string("bad spotMeta response: ") + e.what());
    }
    throw GatewayError("unknown spot pair " + spot_symbol);
}

bool is_spot_symbol(const std::string& symbol) {
    return (!symbol.empty() && symbol[0] == '@') || symbol.find('/') != std::string::npos;
}
