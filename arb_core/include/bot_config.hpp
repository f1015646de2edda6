#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "arbitrage_state_machine.hpp"
#include "market_data_stream.hpp"
#include "order_gateway.hpp"

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BotConfig {
    // network
    std::string ws_url = "wss://api.hyperliquid.xyz/ws";
    int reconnect_delay_s = 5;
    int reconnect_max_delay_s = 60;
    int ping_interval_s = 20;
    int test_timeout_s = 5;
    int connect_timeout_s = 5;
    int order_timeout_s = 10;

    // pair
    std::string spot_symbol = "@107";
    std::string perp_symbol = "HYPE";
    int size_decimals = 2;
    int price_decimals = 4;

    // strategy
    double min_spread_threshold = 0.0015;  // 0.15%
    double exit_threshold = 0.0003;        // 0.03%
    bool check_funding_rate = true;
    int funding_cache_s = 60;              // 0 = query on every check
    double max_position_usd = 12.0;
    double taker_fee_rate = 0.00025;
    double slippage = 0.001;
    bool dry_run = true;

    std::string events_file = "trade_events.json";

    // live mode only: wallet (or API wallet) key that signs orders,
    // and the account whose margin is queried
    std::string account_address;
    std::string private_key;
};

// Absent keys keep their defaults. Throws ConfigError.
BotConfig load_config(const std::string& path);
BotConfig config_from_json(const nlohmann::json& j);

void validate_config(const BotConfig& config);
void validate_live(const BotConfig& config);

// Signer for live orders. Throws ConfigError when the key is unusable or this
// OpenSSL build cannot sign exchange actions.
std::shared_ptr<const IActionSigner> make_live_signer(const BotConfig& config);
bool is_mainnet(const std::string& ws_url);

StreamSettings stream_settings(const BotConfig& config);
GatewaySettings gateway_settings(const BotConfig& config);
StrategySettings strategy_settings(const BotConfig& config);
