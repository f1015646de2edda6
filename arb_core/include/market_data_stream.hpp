#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <ixwebsocket/IXWebSocket.h>
#include "entities/price_state.hpp"
#include "parsers/imessage_parser.hpp"
#include "reconnect_backoff.hpp"

struct StreamSettings {
    std::string url;
    std::string spot_symbol;
    std::string perp_symbol;
    int reconnect_delay_s = 5;
    int reconnect_max_delay_s = 60;
    int ping_interval_s = 20;
    int connect_timeout_s = 5;
    int test_timeout_s = 5;
};

// L2 book feed for the spot and perp legs over one websocket.
// The price callback runs on the thread that called connect().
class MarketDataStream {
public:
    MarketDataStream(StreamSettings settings, std::shared_ptr<IMessageParser> parser);
    ~MarketDataStream();

    void set_price_callback(std::function<void(const PriceState&)> cb);

    // Blocks: connect, subscribe, read, reconnect with backoff until disconnect().
    // Returns at once if disconnect() already ran; a stream is not restartable.
    void connect();

    // Idempotent, callable from any thread before, during or after connect().
    // Wakes a pending backoff wait and closes the socket.
    void disconnect();

    // One-shot health check on a separate socket. Leaves the price state alone.
    bool test_connection();

    PriceState get_prices() const;
    bool is_connected() const { return connected_; }

    // Handle one inbound text frame (socket thread)
    void on_frame(const std::string& payload);

    static std::string subscription_message(const std::string& symbol);

private:
    void on_message(const ix::WebSocketMessagePtr& msg);
    void wait_backoff(std::chrono::seconds delay);

    StreamSettings settings_;
    std::shared_ptr<IMessageParser> parser_;
    ix::WebSocket webSocket;
    ReconnectBackoff backoff_;

    std::function<void(const PriceState&)> price_callback_;

    mutable std::mutex state_mutex_;
    PriceState price_state_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> connected_{false};
};
