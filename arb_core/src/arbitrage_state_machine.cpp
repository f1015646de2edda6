#include "arbitrage_state_machine.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <utility>
#include "time_utils.hpp"

nlohmann::json fill_to_json(const Fill& fill) {
    nlohmann::json j;
    j["success"] = fill.success;
    if (fill.success) {
        j["size"] = fill.size;
        j["price"] = fill.price;
        j["fee"] = fill.fee;
        j["oid"] = fill.order_id;
    } else {
        j["error"] = fill.error;
    }
    return j;
}

ArbitrageStateMachine::ArbitrageStateMachine(StrategySettings settings, IExecutionGateway& gateway, EventBus& events)
    : settings_(std::move(settings)), gateway_(gateway), events_(events)
{
}

const char* ArbitrageStateMachine::state_name(ArbState state) {
    switch (state) {
        case ArbState::Flat:       return "FLAT";
        case ArbState::Entering:   return "ENTERING";
        case ArbState::InPosition: return "IN_POSITION";
        case ArbState::Exiting:    return "EXITING";
        case ArbState::Error:      return "ERROR";
    }
    return "ERROR";
}

ArbState ArbitrageStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<Position> ArbitrageStateMachine::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return position_;
}

void ArbitrageStateMachine::set_state(ArbState state) {
    ArbState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        state_ = state;
    }
    std::cout << "[C++] Arbitrage " << state_name(previous) << " -> " << state_name(state) << std::endl;
}

bool ArbitrageStateMachine::clear_error() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ArbState::Error) return false;
        position_.reset();
        entry_fees_ = 0.0;
    }
    set_state(ArbState::Flat);
    opportunity_armed_ = true;
    return true;
}

// Never round a size up past the budget
double ArbitrageStateMachine::round_size(double size) const {
    double scale = std::pow(10.0, settings_.size_decimals);
    return std::floor(size * scale + 1e-9) / scale;
}

double ArbitrageStateMachine::round_price(double price) const {
    double scale = std::pow(10.0, settings_.price_decimals);
    return std::round(price * scale) / scale;
}

bool ArbitrageStateMachine::sizes_match(double a, double b) const {
    return std::fabs(a - b) < 0.5 * std::pow(10.0, -settings_.size_decimals);
}

void ArbitrageStateMachine::on_price_update(const PriceState& prices) {
    // Partial data is no signal
    if (!prices.is_ready()) return;

    switch (state()) {
        case ArbState::Flat:
            evaluate_entry(prices);
            break;
        case ArbState::InPosition:
            evaluate_exit(prices);
            break;
        case ArbState::Entering:
        case ArbState::Exiting:
        case ArbState::Error:
            break;
    }
}

void ArbitrageStateMachine::evaluate_entry(const PriceState& prices) {
    const double spread = prices.entry_spread();
    if (spread < settings_.min_spread_threshold) {
        opportunity_armed_ = true;
        return;
    }

    if (settings_.check_funding_rate) {
        double funding = 0.0;
        try {
            funding = current_funding();
        } catch (const std::exception& e) {
            std::cerr << "[C++] Arbitrage skipping entry, funding rate unavailable: " << e.what() << std::endl;
            return;
        }

        // Negative funding: shorts pay, the hedge bleeds
        if (funding < 0.0) {
            if (opportunity_armed_.exchange(false)) {
                events_.record_opportunity(
                    "Spread " + std::to_string(spread * 100.0) + "% skipped, negative funding",
                    {{"spread", spread}, {"funding_rate", funding},
                     {"spot_ask", prices.spot.best_ask}, {"perp_bid", prices.perp.best_bid}});
            }
            return;
        }
    }

    double budget = settings_.max_position_usd;
    if (!settings_.dry_run) {
        try {
            budget = std::min(budget, gateway_.available_margin());
        } catch (const std::exception& e) {
            std::cerr << "[C++] Arbitrage skipping entry, margin unavailable: " << e.what() << std::endl;
            return;
        }
    }

    const double size = round_size(budget / prices.spot.best_ask);
    if (size <= 0.0) {
        std::cerr << "[C++] Arbitrage skipping entry, size rounds to zero (budget $" << budget << ")" << std::endl;
        return;
    }

    set_state(ArbState::Entering);

    OrderRequest spot;
    spot.symbol = settings_.spot_symbol;
    spot.is_buy = true;
    spot.size = size;
    spot.limit_price = round_price(prices.spot.best_ask * (1.0 + settings_.slippage));

    OrderRequest perp;
    perp.symbol = settings_.perp_symbol;
    perp.is_buy = false;
    perp.size = size;
    perp.limit_price = round_price(prices.perp.best_bid * (1.0 - settings_.slippage));

    std::cout << "[C++] Arbitrage ENTRY signal, spread " << spread * 100.0 << "%, size " << size << std::endl;

    std::pair<Fill, Fill> fills = submit_pair(spot, perp);
    complete_entry(fills.first, fills.second, spread);
}

double ArbitrageStateMachine::current_funding() {
    const auto now = std::chrono::steady_clock::now();
    if (cached_funding_ && now - funding_fetched_at_ < std::chrono::seconds(settings_.funding_cache_s)) {
        return *cached_funding_;
    }

    double funding = gateway_.funding_rate(settings_.perp_symbol);
    cached_funding_ = funding;
    funding_fetched_at_ = now;
    return funding;
}

void ArbitrageStateMachine::evaluate_exit(const PriceState& prices) {
    const double spread = prices.exit_spread();
    if (spread > settings_.exit_threshold) return;

    std::optional<Position> open = position();
    if (!open) {
        // IN_POSITION always carries a position
        set_state(ArbState::Error);
        events_.record_error("IN_POSITION without a position", {{"phase", "exit"}});
        return;
    }

    set_state(ArbState::Exiting);

    OrderRequest spot;
    spot.symbol = settings_.spot_symbol;
    spot.is_buy = false;
    spot.size = open->size;
    spot.limit_price = round_price(prices.spot.best_bid * (1.0 - settings_.slippage));

    OrderRequest perp;
    perp.symbol = settings_.perp_symbol;
    perp.is_buy = true;
    perp.size = open->size;
    perp.limit_price = round_price(prices.perp.best_ask * (1.0 + settings_.slippage));
    perp.reduce_only = true;

    std::cout << "[C++] Arbitrage EXIT signal, spread " << spread * 100.0 << "%, size " << open->size << std::endl;

    std::pair<Fill, Fill> fills = submit_pair(spot, perp);
    complete_exit(*open, fills.first, fills.second);
}

std::pair<Fill, Fill> ArbitrageStateMachine::submit_pair(const OrderRequest& spot, const OrderRequest& perp) {
    // Both legs go out before either result is looked at
    std::future<Fill> spot_fill = std::async(std::launch::async, [this, &spot] { return execute_leg(spot); });
    std::future<Fill> perp_fill = std::async(std::launch::async, [this, &perp] { return execute_leg(perp); });

    Fill s = spot_fill.get();
    Fill p = perp_fill.get();
    return {s, p};
}

Fill ArbitrageStateMachine::execute_leg(const OrderRequest& request) {
    if (settings_.dry_run) {
        return simulate_fill(request);
    }

    try {
        return gateway_.place_order(request);
    } catch (const std::exception& e) {
        Fill failed;
        failed.error = e.what();
        return failed;
    }
}

Fill ArbitrageStateMachine::simulate_fill(const OrderRequest& request) {
    Fill fill;
    fill.success = true;
    fill.size = request.size;
    fill.price = request.limit_price;
    fill.fee = estimate_fee(request.size, request.limit_price, settings_.taker_fee_rate);
    fill.order_id = "dry-run-" + std::to_string(++simulated_orders_);
    return fill;
}

void ArbitrageStateMachine::complete_entry(const Fill& spot, const Fill& perp, double spread) {
    if (spot.success && perp.success && sizes_match(spot.size, perp.size)) {
        Position opened;
        opened.size = spot.size;
        opened.entry_spot_price = spot.price;
        opened.entry_perp_price = perp.price;
        opened.entry_spread = spread;
        opened.entry_time = iso_now();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            position_ = opened;
            entry_fees_ = spot.fee + perp.fee;
        }
        events_.record_entry(opened.size, spot.price, perp.price, spread);
        set_state(ArbState::InPosition);
        return;
    }

    std::string reason;
    if (!spot.success) reason += "spot leg failed: " + spot.error + "; ";
    if (!perp.success) reason += "perp leg failed: " + perp.error + "; ";
    if (spot.success && perp.success) {
        reason += "filled sizes differ (spot " + std::to_string(spot.size)
                + ", perp " + std::to_string(perp.size) + "); ";
    }

    set_state(ArbState::Error);
    std::cerr << "[C++] Arbitrage entry failed, manual cleanup may be needed: " << reason << std::endl;
    events_.record_error("Entry failed, " + reason + "manual cleanup may be needed",
                         {{"phase", "entry"}, {"spot", fill_to_json(spot)}, {"perp", fill_to_json(perp)}});
}

void ArbitrageStateMachine::complete_exit(const Position& position, const Fill& spot, const Fill& perp) {
    if (spot.success && perp.success
        && sizes_match(spot.size, position.size) && sizes_match(perp.size, position.size)) {
        double entry_fees = 0.0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry_fees = entry_fees_;
        }

        // Long spot, short perp
        const double spot_pnl = (spot.price - position.entry_spot_price) * position.size;
        const double perp_pnl = (position.entry_perp_price - perp.price) * position.size;
        const double gross_pnl = spot_pnl + perp_pnl;
        const double total_fees = entry_fees + spot.fee + perp.fee;
        const double net_pnl = gross_pnl - total_fees;

        std::cout << "[C++] Arbitrage closed: spot P&L " << spot_pnl << ", perp P&L " << perp_pnl
                  << ", fees " << total_fees << ", net " << net_pnl << std::endl;

        events_.record_exit(position.size, spot.price, perp.price, net_pnl);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            position_.reset();
            entry_fees_ = 0.0;
        }
        set_state(ArbState::Flat);
        return;
    }

    std::string reason;
    if (!spot.success) reason += "spot leg failed: " + spot.error + "; ";
    if (!perp.success) reason += "perp leg failed: " + perp.error + "; ";
    if (spot.success && perp.success) {
        reason += "partial close (spot " + std::to_string(spot.size) + ", perp " + std::to_string(perp.size)
                + ", position " + std::to_string(position.size) + "); ";
    }

    set_state(ArbState::Error);
    std::cerr << "[C++] Arbitrage exit failed, position still open: " << reason << std::endl;
    events_.record_error("Exit failed, " + reason + "manual cleanup may be needed",
                         {{"phase", "exit"}, {"spot", fill_to_json(spot)}, {"perp", fill_to_json(perp)}});
}
