#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "execution_gateway.hpp"
#include "order_gateway.hpp"

using nlohmann::json;

TEST(OrderResponseTest, Filled) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"filled":{"totalSz":"1.20","avgPx":"10.01","oid":77738308}}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    ASSERT_TRUE(fill.success) << fill.error;
    EXPECT_DOUBLE_EQ(fill.size, 1.2);
    EXPECT_DOUBLE_EQ(fill.price, 10.01);
    EXPECT_EQ(fill.order_id, "77738308");
    EXPECT_NEAR(fill.fee, 1.2 * 10.01 * 0.00025, 1e-12);
}

TEST(OrderResponseTest, ReportedFeeWins) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"filled":{"totalSz":"2","avgPx":"5","oid":"abc","fee":"0.0042"}}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    ASSERT_TRUE(fill.success);
    EXPECT_DOUBLE_EQ(fill.fee, 0.0042);
    EXPECT_EQ(fill.order_id, "abc");
}

TEST(OrderResponseTest, ErrorStatus) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"error":"Order could not immediately match against any resting orders."}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
    EXPECT_EQ(fill.error, "Order could not immediately match against any resting orders.");
}

TEST(OrderResponseTest, NotOkStatus) {
    json result = json::parse(R"({"status":"err","response":"User or API Wallet does not exist."})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
    EXPECT_NE(fill.error.find("does not exist"), std::string::npos);
}

TEST(OrderResponseTest, UnknownFormat) {
    json result = json::parse(R"({"status":"ok","response":{"type":"cancel","data":{}}})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
    EXPECT_EQ(fill.error.rfind("Unknown result format", 0), 0u);
}

TEST(OrderResponseTest, RestingOrderIsNotAFill) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"resting":{"oid":1}}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
    EXPECT_FALSE(fill.error.empty());
}

TEST(OrderResponseTest, ZeroSizeIsFailure) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"filled":{"totalSz":"0.0","avgPx":"10","oid":1}}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
}

TEST(OrderResponseTest, GarbageDecimalIsFailure) {
    json result = json::parse(R"({"status":"ok","response":{"type":"order","data":{"statuses":[
        {"filled":{"totalSz":"abc","avgPx":"10","oid":1}}]}}})");

    Fill fill = parse_order_response(result, 0.00025);
    EXPECT_FALSE(fill.success);
    EXPECT_FALSE(fill.error.empty());
}

TEST(AccountQueryTest, FundingRateFound) {
    json ctx = json::parse(R"([{"universe":[{"name":"BTC"},{"name":"HYPE"}]},
        [{"funding":"0.0000125"},{"funding":"-0.00003"}]])");

    EXPECT_DOUBLE_EQ(parse_funding_rate(ctx, "BTC"), 0.0000125);
    EXPECT_DOUBLE_EQ(parse_funding_rate(ctx, "HYPE"), -0.00003);
}

TEST(AccountQueryTest, FundingRateMissingSymbolThrows) {
    json ctx = json::parse(R"([{"universe":[{"name":"BTC"}]},[{"funding":"0.0001"}]])");
    EXPECT_THROW(parse_funding_rate(ctx, "HYPE"), GatewayError);
    EXPECT_THROW(parse_funding_rate(json::object(), "HYPE"), GatewayError);
}

TEST(AccountQueryTest, AvailableMargin) {
    EXPECT_DOUBLE_EQ(parse_available_margin(json::parse(R"({"withdrawable":"42.5",
        "marginSummary":{"accountValue":"100"}})")), 42.5);
    EXPECT_DOUBLE_EQ(parse_available_margin(json::parse(R"({"marginSummary":{"accountValue":"100"}})")), 100.0);
    EXPECT_THROW(parse_available_margin(json::parse(R"({"assetPositions":[]})")), GatewayError);
}

TEST(AssetIdTest, PerpIsUniverseIndex) {
    json meta = json::parse(R"({"universe":[{"name":"BTC"},{"name":"ETH"},{"name":"HYPE"}]})");
    EXPECT_EQ(parse_perp_asset(meta, "BTC"), 0);
    EXPECT_EQ(parse_perp_asset(meta, "HYPE"), 2);
    EXPECT_THROW(parse_perp_asset(meta, "PURR"), GatewayError);
    EXPECT_THROW(parse_perp_asset(json::object(), "BTC"), GatewayError);
}

TEST(AssetIdTest, SpotIsOffsetIndex) {
    EXPECT_EQ(parse_spot_asset(json::object(), "@107"), 10107);
    EXPECT_EQ(parse_spot_asset(json::object(), "@0"), 10000);
    EXPECT_THROW(parse_spot_asset(json::object(), "@"), GatewayError);
    EXPECT_THROW(parse_spot_asset(json::object(), "@1x"), GatewayError);

    json spot_meta = json::parse(R"({"universe":[{"name":"PURR/USDC","index":0},{"name":"@1","index":1}]})");
    EXPECT_EQ(parse_spot_asset(spot_meta, "PURR/USDC"), 10000);
    EXPECT_THROW(parse_spot_asset(spot_meta, "HFUN/USDC"), GatewayError);

    EXPECT_TRUE(is_spot_symbol("@107"));
    EXPECT_TRUE(is_spot_symbol("PURR/USDC"));
    EXPECT_FALSE(is_spot_symbol("HYPE"));
}

TEST(WireFormatTest, DecimalsDropTrailingZeros) {
    EXPECT_EQ(wire_decimal(1.2, 2), "1.2");
    EXPECT_EQ(wire_decimal(10.00999, 4), "10.01");
    EXPECT_EQ(wire_decimal(10.0, 4), "10");
    EXPECT_EQ(wire_decimal(3.0, 0), "3");
    EXPECT_EQ(wire_decimal(0.5, 2), "0.5");
    EXPECT_EQ(wire_decimal(-0.00001, 2), "0");
}

TEST(WireFormatTest, OrderActionLayout) {
    OrderRequest request;
    request.symbol = "HYPE";
    request.is_buy = false;
    request.size = 1.2;
    request.limit_price = 9.98998;
    request.time_in_force = TimeInForce::IOC;
    request.reduce_only = true;

    nlohmann::ordered_json action = order_action(request, 135, 4, 2);

    std::vector<std::string> keys;
    for (auto it = action.begin(); it != action.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"type", "orders", "grouping"}));

    const nlohmann::ordered_json& order = action["orders"][0];
    std::vector<std::string> order_keys;
    for (auto it = order.begin(); it != order.end(); ++it) order_keys.push_back(it.key());
    EXPECT_EQ(order_keys, (std::vector<std::string>{"a", "b", "p", "s", "r", "t"}));

    EXPECT_EQ(action["type"], "order");
    EXPECT_EQ(action["grouping"], "na");
    EXPECT_EQ(order["a"], 135);
    EXPECT_EQ(order["b"], false);
    EXPECT_EQ(order["p"], "9.99");
    EXPECT_EQ(order["s"], "1.2");
    EXPECT_EQ(order["r"], true);
    EXPECT_EQ(order["t"]["limit"]["tif"], "Ioc");

    request.time_in_force = TimeInForce::GTC;
    EXPECT_EQ(order_action(request, 135, 4, 2)["orders"][0]["t"]["limit"]["tif"], "Gtc");
}

class FixedSigner : public IActionSigner {
public:
    nlohmann::ordered_json sign_action(const nlohmann::ordered_json& action, long long nonce) const override {
        last_action = action;
        last_nonce = nonce;
        return {{"r", "0x01"}, {"s", "0x02"}, {"v", 27}};
    }
    const std::string& address() const override { return address_; }

    mutable nlohmann::ordered_json last_action;
    mutable long long last_nonce = 0;

private:
    std::string address_ = "0xabc";
};

TEST(OrderGatewayTest, SignedPayloadLayout) {
    GatewaySettings settings;
    settings.url = "ws://127.0.0.1:1";
    auto signer = std::make_shared<FixedSigner>();
    OrderGateway gateway(settings, signer);
    EXPECT_TRUE(gateway.can_trade());

    OrderRequest request;
    request.symbol = "HYPE";
    request.size = 1.0;
    request.limit_price = 10.0;
    nlohmann::ordered_json action = order_action(request, 3, 4, 2);

    nlohmann::ordered_json payload = gateway.signed_payload(action, 1700000000000LL);

    std::vector<std::string> keys;
    for (auto it = payload.begin(); it != payload.end(); ++it) keys.push_back(it.key());
    EXPECT_EQ(keys, (std::vector<std::string>{"action", "nonce", "signature", "vaultAddress"}));
    EXPECT_EQ(payload["action"], action);
    EXPECT_EQ(payload["nonce"], 1700000000000LL);
    EXPECT_EQ(payload["signature"]["v"], 27);
    EXPECT_TRUE(payload["vaultAddress"].is_null());

    EXPECT_EQ(signer->last_action, action);
    EXPECT_EQ(signer->last_nonce, 1700000000000LL);
}

TEST(OrderGatewayTest, RefusesOrdersWithoutSigner) {
    GatewaySettings settings;
    settings.url = "ws://127.0.0.1:1";
    OrderGateway gateway(settings);
    EXPECT_FALSE(gateway.can_trade());

    OrderRequest request;
    request.symbol = "HYPE";
    request.size = 1.0;
    request.limit_price = 10.0;
    EXPECT_THROW(gateway.place_order(request), GatewayError);
    EXPECT_THROW(gateway.signed_payload(order_action(request, 3, 4, 2), 1), GatewayError);
}

TEST(OrderGatewayTest, QueriesFailWhenNotConnected) {
    GatewaySettings settings;
    settings.url = "ws://127.0.0.1:1";
    OrderGateway gateway(settings);

    EXPECT_THROW(gateway.funding_rate("HYPE"), GatewayError);
    EXPECT_THROW(gateway.available_margin(), GatewayError);
}
