#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "entities/execution_data.hpp"
#include "entities/position.hpp"
#include "entities/price_state.hpp"
#include "event_bus.hpp"
#include "execution_gateway.hpp"

struct StrategySettings {
    std::string spot_symbol;
    std::string perp_symbol;
    double min_spread_threshold = 0.0015;
    double exit_threshold = 0.0003;
    double max_position_usd = 12.0;
    bool check_funding_rate = true;
    int funding_cache_s = 60;  // funding changes hourly; 0 = query every time
    bool dry_run = true;
    double taker_fee_rate = 0.00025;
    double slippage = 0.001;   // price aggression for IOC legs
    int size_decimals = 2;
    int price_decimals = 4;
};

enum class ArbState {
    Flat,
    Entering,
    InPosition,
    Exiting,
    Error      // needs an operator, see clear_error()
};

// FLAT -> ENTERING -> IN_POSITION -> EXITING -> FLAT
//
// Runs synchronously inside the price callback. Entering/exiting submits
// both legs at once and waits for both fills before moving on. A failed or
// mismatched leg parks the machine in ERROR: no retry, no unwind.
class ArbitrageStateMachine {
public:
    ArbitrageStateMachine(StrategySettings settings, IExecutionGateway& gateway, EventBus& events);

    void on_price_update(const PriceState& prices);

    ArbState state() const;
    std::optional<Position> position() const;

    // Operator reset ERROR -> FLAT. Returns false in any other state.
    bool clear_error();

    static const char* state_name(ArbState state);

    double round_size(double size) const;
    double round_price(double price) const;

private:
    void evaluate_entry(const PriceState& prices);
    double current_funding();
    void evaluate_exit(const PriceState& prices);

    std::pair<Fill, Fill> submit_pair(const OrderRequest& spot, const OrderRequest& perp);
    Fill execute_leg(const OrderRequest& request);
    Fill simulate_fill(const OrderRequest& request);

    void complete_entry(const Fill& spot, const Fill& perp, double spread);
    void complete_exit(const Position& position, const Fill& spot, const Fill& perp);
    bool sizes_match(double a, double b) const;
    void set_state(ArbState state);

    StrategySettings settings_;
    IExecutionGateway& gateway_;
    EventBus& events_;

    mutable std::mutex mutex_;
    ArbState state_ = ArbState::Flat;
    std::optional<Position> position_;
    double entry_fees_ = 0.0;

    // Reset by clear_error() from the operator thread
    std::atomic<bool> opportunity_armed_{true};

    // Price thread only. Failed queries are not cached.
    std::optional<double> cached_funding_;
    std::chrono::steady_clock::time_point funding_fetched_at_;
    std::atomic<long long> simulated_orders_{0};
};

nlohmann::json fill_to_json(const Fill& fill);
