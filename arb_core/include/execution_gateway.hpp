#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "entities/execution_data.hpp"

class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Order placement and account queries. Implementations block until the
// exchange answers; transport failures are thrown as GatewayError, rejected
// orders come back as an unsuccessful Fill.
class IExecutionGateway {
public:
    virtual ~IExecutionGateway() = default;

    virtual Fill place_order(const OrderRequest& request) = 0;
    virtual double funding_rate(const std::string& perp_symbol) = 0;
    virtual double available_margin() = 0;
};

double estimate_fee(double size, double price, double taker_fee_rate);

// {status, response:{type, data:{statuses:[{filled:{totalSz, avgPx, oid}} | {error}]}}}
Fill parse_order_response(const nlohmann::json& result, double taker_fee_rate);

// metaAndAssetCtxs: [ {universe:[{name}]}, [{funding}] ]
double parse_funding_rate(const nlohmann::json& meta_and_ctxs, const std::string& perp_symbol);

// clearinghouseState: withdrawable, falling back to marginSummary.accountValue
double parse_available_margin(const nlohmann::json& clearinghouse_state);

// Spot pairs are addressed as 10000 + their spotMeta index
constexpr int kSpotAssetOffset = 10000;

// meta: {universe:[{name}]}, asset = position in the universe
int parse_perp_asset(const nlohmann::json& meta, const std::string& perp_symbol);

// "@N" maps straight to 10000 + N; a pair name is looked up in spotMeta {universe:[{name, index}]}
int parse_spot_asset(const nlohmann::json& spot_meta, const std::string& spot_symbol);

bool is_spot_symbol(const std::string& symbol);
