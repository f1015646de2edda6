#include "market_data_stream.hpp"
#include <iostream>
#include <utility>
#include <ixwebsocket/IXNetSystem.h>
#include <nlohmann/json.hpp>

MarketDataStream::MarketDataStream(StreamSettings settings, std::shared_ptr<IMessageParser> parser)
    : settings_(std::move(settings)),
      parser_(std::move(parser)),
      backoff_(std::chrono::seconds(settings_.reconnect_delay_s),
               std::chrono::seconds(settings_.reconnect_max_delay_s))
{
    ix::initNetSystem();
    price_state_.spot.symbol = settings_.spot_symbol;
    price_state_.perp.symbol = settings_.perp_symbol;
}

MarketDataStream::~MarketDataStream() {
    disconnect();
    ix::uninitNetSystem();
}

void MarketDataStream::set_price_callback(std::function<void(const PriceState&)> cb) {
    price_callback_ = std::move(cb);
}

std::string MarketDataStream::subscription_message(const std::string& symbol) {
    nlohmann::json sub;
    sub["method"] = "subscribe";
    sub["subscription"] = {{"type", "l2Book"}, {"coin", symbol}};
    return sub.dump();
}

void MarketDataStream::connect() {
    if (stop_requested_) {
        std::cout << "[C++] MarketDataStream stop already requested, not connecting" << std::endl;
        return;
    }

    webSocket.setUrl(settings_.url);
    webSocket.setPingInterval(settings_.ping_interval_s);
    // Reconnects are driven from here so the backoff is ours, not the library's
    webSocket.disableAutomaticReconnection();
    webSocket.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        this->on_message(msg);
    });

    while (!stop_requested_) {
        std::cout << "[C++] MarketDataStream connecting to " << settings_.url << "..." << std::endl;
        ix::WebSocketInitResult result = webSocket.connect(settings_.connect_timeout_s);

        if (result.success && stop_requested_) {
            // disconnect() ran while the handshake was in flight
            webSocket.close();
            break;
        }

        if (result.success) {
            backoff_.reset();
            connected_ = true;

            for (const std::string& symbol : {settings_.spot_symbol, settings_.perp_symbol}) {
                if (!webSocket.send(subscription_message(symbol)).success) {
                    std::cerr << "[C++] MarketDataStream failed to subscribe " << symbol << std::endl;
                }
            }
            std::cout << "[C++] MarketDataStream subscribed to L2 books: "
                      << settings_.spot_symbol << ", " << settings_.perp_symbol << std::endl;

            // Returns once the socket is closed
            webSocket.run();
            connected_ = false;
            if (!stop_requested_) {
                std::cerr << "[C++] MarketDataStream session ended" << std::endl;
            }
        } else {
            std::cerr << "[C++] MarketDataStream connect failed: " << result.errorStr << std::endl;
        }

        if (stop_requested_) break;

        std::chrono::seconds delay = backoff_.next_delay();
        std::cout << "[C++] MarketDataStream reconnecting in " << delay.count() << "s..." << std::endl;
        wait_backoff(delay);
    }

    connected_ = false;
}

void MarketDataStream::wait_backoff(std::chrono::seconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
}

void MarketDataStream::disconnect() {
    bool already = false;
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        already = stop_requested_.exchange(true);
    }
    wait_cv_.notify_all();

    // No-op when the socket is not open
    webSocket.close();
    if (!already) {
        std::cout << "[C++] MarketDataStream disconnected" << std::endl;
    }
}

PriceState MarketDataStream::get_prices() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return price_state_;
}

void MarketDataStream::on_message(const ix::WebSocketMessagePtr& msg) {
    if (msg->type == ix::WebSocketMessageType::Message) {
        try {
            on_frame(msg->str);
        } catch (const std::exception& e) {
            std::cerr << "[C++] MarketDataStream error handling message: " << e.what() << std::endl;
        }
    }
    else if (msg->type == ix::WebSocketMessageType::Open) {
        std::cout << "[C++] MarketDataStream connected!" << std::endl;
    }
    else if (msg->type == ix::WebSocketMessageType::Close) {
        std::cout << "[C++] MarketDataStream closed: " << msg->closeInfo.code
                  << " " << msg->closeInfo.reason << std::endl;
    }
    else if (msg->type == ix::WebSocketMessageType::Error) {
        std::cerr << "[C++] MarketDataStream WS error: " << msg->errorInfo.reason << std::endl;
    }
}

void MarketDataStream::on_frame(const std::string& payload) {
    OrderBookSnapshot depth;
    std::string error;

    ParseResultType result = parser_->parse(payload, depth, error);

    if (result == ParseResultType::Malformed) {
        std::cerr << "[C++] MarketDataStream failed to parse message: " << error << std::endl;
        return;
    }
    if (result == ParseResultType::SubscriptionAck) {
        std::cout << "[C++] MarketDataStream subscription confirmed" << std::endl;
        return;
    }
    if (result != ParseResultType::Depth) return;

    OrderBookState book;
    book.symbol = depth.symbol;
    if (!depth.bids.empty()) {
        book.best_bid = depth.bids[0].price;
        book.bid_size = depth.bids[0].quantity;
    }
    if (!depth.asks.empty()) {
        book.best_ask = depth.asks[0].price;
        book.ask_size = depth.asks[0].quantity;
    }
    book.last_update = depth.local_timestamp;

    PriceState snapshot;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (depth.symbol == settings_.spot_symbol) {
            price_state_.spot = book;
        } else if (depth.symbol == settings_.perp_symbol) {
            price_state_.perp = book;
        } else {
            return;
        }
        snapshot = price_state_;
    }

    if (snapshot.is_ready() && price_callback_) {
        price_callback_(snapshot);
    }
}

bool MarketDataStream::test_connection() {
    std::cout << "[C++] MarketDataStream testing connection to " << settings_.url << "..." << std::endl;

    std::mutex m;
    std::condition_variable cv;
    bool received = false;
    bool failed = false;
    std::string first_channel;
    std::string failure;

    ix::WebSocket check_socket;
    check_socket.setUrl(settings_.url);
    check_socket.disableAutomaticReconnection();

    const std::string sub = subscription_message(settings_.perp_symbol);
    check_socket.setOnMessageCallback([&](const ix::WebSocketMessagePtr& msg) {
        if (msg->type == ix::WebSocketMessageType::Open) {
            if (!check_socket.send(sub).success) {
                std::lock_guard<std::mutex> lock(m);
                failed = true;
                failure = "subscribe send failed";
                cv.notify_all();
            }
        }
        else if (msg->type == ix::WebSocketMessageType::Message) {
            nlohmann::json j = nlohmann::json::parse(msg->str, nullptr, false);
            std::lock_guard<std::mutex> lock(m);
            if (received) return;
            received = true;
            if (j.is_object() && j.contains("channel") && j["channel"].is_string()) {
                first_channel = j["channel"].get<std::string>();
            }
            cv.notify_all();
        }
        else if (msg->type == ix::WebSocketMessageType::Error) {
            std::lock_guard<std::mutex> lock(m);
            failed = true;
            failure = msg->errorInfo.reason;
            cv.notify_all();
        }
    });

    check_socket.start();

    bool ok = false;
    {
        std::unique_lock<std::mutex> lock(m);
        cv.wait_for(lock, std::chrono::seconds(settings_.test_timeout_s),
                    [&] { return received || failed; });
        ok = received;
        if (!ok && !failed) failure = "timeout";
    }

    check_socket.stop();

    if (ok) {
        std::cout << "[C++] Connection test successful, first channel: " << first_channel << std::endl;
    } else {
        std::cerr << "[C++] Connection test failed: " << failure << std::endl;
    }
    return ok;
}
