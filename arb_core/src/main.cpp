#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "arbitrage_state_machine.hpp"
#include "bot_config.hpp"
#include "event_bus.hpp"
#include "market_data_stream.hpp"
#include "order_gateway.hpp"
#include "parsers/hyperliquid_parser.hpp"

namespace {
    std::atomic<bool> g_stop_requested{false};

    void signal_handler(int) {
        g_stop_requested.store(true);
    }

    // Sleeps in small steps so Ctrl+C cuts it short. False when interrupted.
    bool sleep_unless_stopped(std::chrono::milliseconds total) {
        auto deadline = std::chrono::steady_clock::now() + total;
        while (std::chrono::steady_clock::now() < deadline) {
            if (g_stop_requested) return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        return !g_stop_requested;
    }

    // Streams both books for a while and prints every spread seen
    int stream_prices(MarketDataStream& stream, const BotConfig& config, std::chrono::seconds duration) {
        std::atomic<long long> updates{0};
        stream.set_price_callback([&updates, &config](const PriceState& prices) {
            long long n = ++updates;
            double spread = prices.entry_spread();
            std::cout << "[C++] [" << n << "] Spot $" << prices.spot.best_ask
                      << " | Perp $" << prices.perp.best_bid
                      << " | Spread " << (spread >= 0.0 ? "+" : "") << spread * 100.0 << "%"
                      << (spread >= config.min_spread_threshold ? " ENTRY" : "") << std::endl;
        });

        std::cout << "[C++] Streaming prices for " << duration.count() << "s..." << std::endl;
        std::thread reader([&stream] { stream.connect(); });
        sleep_unless_stopped(duration);
        stream.disconnect();
        reader.join();

        std::cout << "[C++] Received " << updates.load() << " price updates" << std::endl;
        return updates.load() > 0 ? 0 : 1;
    }
}

int main(int argc, char* argv[]) {
    std::string config_path;
    bool test_only = false;
    bool live = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--test") test_only = true;
        else if (arg == "--live") live = true;
        else config_path = arg;
    }

    BotConfig config;
    std::shared_ptr<const IActionSigner> signer;
    try {
        if (!config_path.empty()) {
            config = load_config(config_path);
            std::cout << "[C++] Loaded config from " << config_path << std::endl;
        }
        if (live) config.dry_run = false;
        if (!config.dry_run && !test_only) signer = make_live_signer(config);
    } catch (const ConfigError& e) {
        std::cerr << "[C++] " << e.what() << std::endl;
        return 1;
    }

    std::cout << "[C++] Spot " << config.spot_symbol << " / Perp " << config.perp_symbol
              << " | entry " << config.min_spread_threshold * 100.0 << "%"
              << " | exit " << config.exit_threshold * 100.0 << "%"
              << " | max $" << config.max_position_usd
              << " | " << (config.dry_run ? "DRY RUN" : "LIVE") << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto parser = std::make_shared<HyperliquidParser>();
    MarketDataStream stream(stream_settings(config), parser);

    if (test_only) {
        if (!stream.test_connection()) return 1;
        return stream_prices(stream, config, std::chrono::seconds(10));
    }

    if (!config.dry_run) {
        std::cout << "[C++] WARNING: LIVE TRADING with real funds as " << signer->address()
                  << ". Starting in 5s, Ctrl+C to cancel..." << std::endl;
        if (!sleep_unless_stopped(std::chrono::seconds(5))) {
            std::cout << "[C++] Cancelled" << std::endl;
            return 0;
        }
    }

    EventBus events(config.events_file);

    OrderGateway gateway(gateway_settings(config), signer);
    gateway.connect();
    if (!gateway.wait_ready(std::chrono::seconds(config.order_timeout_s))) {
        if (!config.dry_run) {
            std::cerr << "[C++] Order gateway not ready, refusing to trade live" << std::endl;
            return 1;
        }
        std::cerr << "[C++] Order gateway not ready yet, funding checks fail until it connects" << std::endl;
    }

    if (!config.dry_run) {
        // Resolve asset ids now so a bad symbol fails before the first entry
        try {
            std::cout << "[C++] Assets: " << config.spot_symbol << "=" << gateway.asset_for(config.spot_symbol)
                      << ", " << config.perp_symbol << "=" << gateway.asset_for(config.perp_symbol) << std::endl;
        } catch (const GatewayError& e) {
            std::cerr << "[C++] " << e.what() << std::endl;
            return 1;
        }
    }

    ArbitrageStateMachine machine(strategy_settings(config), gateway, events);
    stream.set_price_callback([&machine](const PriceState& prices) {
        machine.on_price_update(prices);
    });

    // disconnect() is not signal-safe, so hand it to a thread.
    // The stream latches the request, so one call is enough even before connect().
    std::atomic<bool> finished{false};
    std::thread watcher([&] {
        while (!finished && !g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (g_stop_requested) stream.disconnect();
    });

    stream.connect();

    finished = true;
    watcher.join();
    gateway.stop();

    std::cout << "[C++] Stopped in state " << ArbitrageStateMachine::state_name(machine.state()) << std::endl;
    return 0;
}
