#include "bot_config.hpp"
#include <fstream>
#include <iostream>

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("config key '") + key + "': " + e.what());
    }
}

void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigError("invalid config: " + what);
}

}  // namespace

BotConfig config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("config root must be a JSON object");
    }

    BotConfig config;
    read_key(j, "ws_url", config.ws_url);
    read_key(j, "reconnect_delay_s", config.reconnect_delay_s);
    read_key(j, "reconnect_max_delay_s", config.reconnect_max_delay_s);
    read_key(j, "ping_interval_s", config.ping_interval_s);
    read_key(j, "test_timeout_s", config.test_timeout_s);
    read_key(j, "connect_timeout_s", config.connect_timeout_s);
    read_key(j, "order_timeout_s", config.order_timeout_s);
    read_key(j, "spot_symbol", config.spot_symbol);
    read_key(j, "perp_symbol", config.perp_symbol);
    read_key(j, "size_decimals", config.size_decimals);
    read_key(j, "price_decimals", config.price_decimals);
    read_key(j, "min_spread_threshold", config.min_spread_threshold);
    read_key(j, "exit_threshold", config.exit_threshold);
    read_key(j, "check_funding_rate", config.check_funding_rate);
    read_key(j, "funding_cache_s", config.funding_cache_s);
    read_key(j, "max_position_usd", config.max_position_usd);
    read_key(j, "taker_fee_rate", config.taker_fee_rate);
    read_key(j, "slippage", config.slippage);
    read_key(j, "dry_run", config.dry_run);
    read_key(j, "events_file", config.events_file);
    read_key(j, "account_address", config.account_address);
    read_key(j, "private_key", config.private_key);

    validate_config(config);
    return config;
}

BotConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError("Config file is not valid JSON: " + path);
    }
    return config_from_json(j);
}

void validate_config(const BotConfig& config) {
    require(!config.ws_url.empty(), "ws_url is empty");
    require(!config.spot_symbol.empty() && !config.perp_symbol.empty(), "symbols must be set");
    require(config.spot_symbol != config.perp_symbol, "spot and perp symbols must differ");
    require(config.min_spread_threshold > 0.0, "min_spread_threshold must be > 0");
    require(config.exit_threshold < config.min_spread_threshold,
            "exit_threshold must be below min_spread_threshold");
    require(config.max_position_usd > 0.0, "max_position_usd must be > 0");
    require(config.taker_fee_rate >= 0.0, "taker_fee_rate must be >= 0");
    require(config.slippage >= 0.0 && config.slippage < 0.05, "slippage must be in [0, 0.05)");
    require(config.reconnect_delay_s > 0, "reconnect_delay_s must be > 0");
    require(config.reconnect_max_delay_s >= config.reconnect_delay_s,
            "reconnect_max_delay_s must be >= reconnect_delay_s");
    require(config.ping_interval_s > 0, "ping_interval_s must be > 0");
    require(config.test_timeout_s > 0 && config.order_timeout_s > 0 && config.connect_timeout_s > 0,
            "timeouts must be > 0");
    require(config.funding_cache_s >= 0, "funding_cache_s must be >= 0");
    require(config.size_decimals >= 0 && config.size_decimals <= 8, "size_decimals must be in [0, 8]");
    require(config.price_decimals >= 0 && config.price_decimals <= 8, "price_decimals must be in [0, 8]");
    require(!config.events_file.empty(), "events_file is empty");
}

void validate_live(const BotConfig& config) {
    require(!config.private_key.empty(), "live trading needs private_key");
    require(!config.account_address.empty(), "live trading needs account_address");
}

bool is_mainnet(const std::string& ws_url) {
    return ws_url.find("testnet") == std::string::npos;
}

std::shared_ptr<const IActionSigner> make_live_signer(const BotConfig& config) {
    validate_live(config);
    try {
        auto signer = std::make_shared<WalletSigner>(config.private_key, is_mainnet(config.ws_url));
        if (signer->address() != config.account_address) {
            std::cout << "[C++] Signing as API wallet " << signer->address()
                      << " for account " << config.account_address << std::endl;
        }
        return signer;
    } catch (const SignerError& e) {
        throw ConfigError(std::string("live trading unavailable: ") + e.what());
    }
}

StreamSettings stream_settings(const BotConfig& config) {
    StreamSettings s;
    s.url = config.ws_url;
    s.spot_symbol = config.spot_symbol;
    s.perp_symbol = config.perp_symbol;
    s.reconnect_delay_s = config.reconnect_delay_s;
    s.reconnect_max_delay_s = config.reconnect_max_delay_s;
    s.ping_interval_s = config.ping_interval_s;
    s.test_timeout_s = config.test_timeout_s;
    s.connect_timeout_s = config.connect_timeout_s;
    return s;
}

GatewaySettings gateway_settings(const BotConfig& config) {
    GatewaySettings s;
    s.url = config.ws_url;
    s.account_address = config.account_address;
    s.taker_fee_rate = config.taker_fee_rate;
    s.price_decimals = config.price_decimals;
    s.size_decimals = config.size_decimals;
    s.request_timeout_s = config.order_timeout_s;
    s.ping_interval_s = config.ping_interval_s;
    return s;
}

StrategySettings strategy_settings(const BotConfig& config) {
    StrategySettings s;
    s.spot_symbol = config.spot_symbol;
    s.perp_symbol = config.perp_symbol;
    s.min_spread_threshold = config.min_spread_threshold;
    s.exit_threshold = config.exit_threshold;
    s.max_position_usd = config.max_position_usd;
    s.check_funding_rate = config.check_funding_rate;
    s.funding_cache_s = config.funding_cache_s;
    s.dry_run = config.dry_run;
    s.taker_fee_rate = config.taker_fee_rate;
    s.slippage = config.slippage;
    s.size_decimals = config.size_decimals;
    s.price_decimals = config.price_decimals;
    return s;
}
