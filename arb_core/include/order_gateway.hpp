#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <ixwebsocket/IXWebSocket.h>
#include <nlohmann/json.hpp>
#include "action_signer.hpp"
#include "execution_gateway.hpp"

struct GatewaySettings {
    std::string url;
    std::string account_address;
    double taker_fee_rate = 0.00025;
    int price_decimals = 4;
    int size_decimals = 2;
    int request_timeout_s = 10;
    int ping_interval_s = 20;
};

// Exchange gateway over the websocket post channel.
// Every call is fire-and-wait: send, then block for the response with the same id.
// Without a signer the gateway is read-only and place_order throws.
class OrderGateway : public IExecutionGateway {
public:
    explicit OrderGateway(GatewaySettings settings, std::shared_ptr<const IActionSigner> signer = nullptr);
    ~OrderGateway() override;

    void connect();
    void stop();

    bool wait_ready(std::chrono::seconds timeout);
    bool can_trade() const { return signer_ != nullptr; }

    Fill place_order(const OrderRequest& request) override;
    double funding_rate(const std::string& perp_symbol) override;
    double available_margin() override;

    // Exchange asset id for a symbol, resolved from meta/spotMeta once and cached
    int asset_for(const std::string& symbol);

    // {action, nonce, signature, vaultAddress} as sent on the wire
    nlohmann::ordered_json signed_payload(const nlohmann::ordered_json& action, long long nonce) const;

private:
    nlohmann::json post(const std::string& type, const nlohmann::ordered_json& payload);
    nlohmann::json info(const nlohmann::ordered_json& request);
    void on_message(const ix::WebSocketMessagePtr& msg);

    GatewaySettings settings_;
    std::shared_ptr<const IActionSigner> signer_;
    ix::WebSocket webSocket;

    std::atomic<bool> open_{false};
    std::atomic<long long> next_id_{1};

    std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::unordered_set<long long> waiting_;
    std::unordered_map<long long, nlohmann::json> responses_;

    std::mutex assets_mutex_;
    std::unordered_map<std::string, int> assets_;
};

// Order action {type:"order", orders:[{a,b,p,s,r,t}], grouping:"na"}, keys in wire order
nlohmann::ordered_json order_action(const OrderRequest& request, int asset, int price_decimals, int size_decimals);

// Exchange wants decimals as strings without trailing zeros: 10.0100 -> "10.01", 10.0 -> "10"
std::string wire_decimal(double value, int decimals);
