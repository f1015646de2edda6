#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <ixwebsocket/IXWebSocketServer.h>
#include <nlohmann/json.hpp>
#include "market_data_stream.hpp"
#include "parsers/hyperliquid_parser.hpp"

namespace {

// Nothing listens here, so every connect attempt is refused
const char* kDeadUrl = "ws://127.0.0.1:1";

std::string book_frame(const std::string& coin, const std::string& bid, const std::string& ask) {
    nlohmann::json levels = nlohmann::json::array();
    levels.push_back(bid.empty() ? nlohmann::json::array()
                                 : nlohmann::json::array({{{"px", bid}, {"sz", "1"}, {"n", 1}}}));
    levels.push_back(ask.empty() ? nlohmann::json::array()
                                 : nlohmann::json::array({{{"px", ask}, {"sz", "2"}, {"n", 1}}}));

    nlohmann::json frame;
    frame["channel"] = "l2Book";
    frame["data"] = {{"coin", coin}, {"time", 1700000000000LL}, {"levels", levels}};
    return frame.dump();
}

bool wait_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (done()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return done();
}

// Local exchange stand-in: answers every l2Book subscription with one book
// for that coin. With drop_after_perp the connection is closed right after
// the perp book went out.
class BookServer {
public:
    explicit BookServer(bool drop_after_perp) : drop_after_perp_(drop_after_perp) {
        for (int port = 18700; port < 18800 && !server_; ++port) {
            auto server = std::make_unique<ix::WebSocketServer>(port, "127.0.0.1");
            if (server->listen().first) {
                server_ = std::move(server);
                port_ = port;
            }
        }
        if (!server_) return;

        server_->setOnClientMessageCallback([this](std::shared_ptr<ix::ConnectionState>,
                                                   ix::WebSocket& webSocket,
                                                   const ix::WebSocketMessagePtr& msg) {
            if (msg->type == ix::WebSocketMessageType::Open) {
                ++connections;
                return;
            }
            if (msg->type != ix::WebSocketMessageType::Message) return;

            nlohmann::json sub = nlohmann::json::parse(msg->str, nullptr, false);
            if (sub.is_discarded() || !sub.contains("subscription")) return;
            const std::string coin = sub["subscription"].value("coin", "");

            if (coin == "HYPE") {
                webSocket.send(book_frame(coin, "10.02", "10.03"));
                if (drop_after_perp_) webSocket.close();
            } else {
                webSocket.send(book_frame(coin, "9.99", "10.00"));
            }
        });
        server_->start();
    }

    ~BookServer() {
        if (server_) server_->stop();
    }

    bool listening() const { return server_ != nullptr; }
    std::string url() const { return "ws://127.0.0.1:" + std::to_string(port_); }

    std::atomic<int> connections{0};

private:
    bool drop_after_perp_;
    int port_ = 0;
    std::unique_ptr<ix::WebSocketServer> server_;
};

}  // namespace

class MarketDataStreamTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.url = kDeadUrl;
        settings_.spot_symbol = "@107";
        settings_.perp_symbol = "HYPE";
        stream_ = std::make_unique<MarketDataStream>(settings_, std::make_shared<HyperliquidParser>());
        stream_->set_price_callback([this](const PriceState& p) { updates_.push_back(p); });
    }

    StreamSettings settings_;
    std::unique_ptr<MarketDataStream> stream_;
    std::vector<PriceState> updates_;
};

TEST_F(MarketDataStreamTest, CallbackOnlyWhenBothLegsValid) {
    stream_->on_frame(book_frame("HYPE", "10.02", "10.03"));
    EXPECT_TRUE(updates_.empty());
    EXPECT_FALSE(stream_->get_prices().is_ready());

    stream_->on_frame(book_frame("@107", "9.99", "10.00"));
    ASSERT_EQ(updates_.size(), 1u);
    EXPECT_DOUBLE_EQ(updates_[0].spot.best_ask, 10.00);
    EXPECT_DOUBLE_EQ(updates_[0].perp.best_bid, 10.02);
    EXPECT_NEAR(updates_[0].entry_spread(), 0.0020, 1e-12);

    stream_->on_frame(book_frame("HYPE", "10.04", "10.05"));
    ASSERT_EQ(updates_.size(), 2u);
    EXPECT_DOUBLE_EQ(updates_[1].perp.best_bid, 10.04);
}

TEST_F(MarketDataStreamTest, SnapshotReplacesLegWholesale) {
    stream_->on_frame(book_frame("HYPE", "10.02", "10.03"));
    stream_->on_frame(book_frame("@107", "9.99", "10.00"));
    ASSERT_EQ(updates_.size(), 1u);

    // Bids vanish: the leg is no longer valid and no update is emitted
    stream_->on_frame(book_frame("HYPE", "", "10.03"));
    EXPECT_EQ(updates_.size(), 1u);

    PriceState p = stream_->get_prices();
    EXPECT_EQ(p.perp.best_bid, 0.0);
    EXPECT_DOUBLE_EQ(p.perp.best_ask, 10.03);
    EXPECT_FALSE(p.is_ready());
}

TEST_F(MarketDataStreamTest, TopLevelSizesKept) {
    stream_->on_frame(book_frame("@107", "9.99", "10.00"));
    PriceState p = stream_->get_prices();
    EXPECT_DOUBLE_EQ(p.spot.bid_size, 1.0);
    EXPECT_DOUBLE_EQ(p.spot.ask_size, 2.0);
    EXPECT_GT(p.spot.last_update, 0);
    EXPECT_EQ(p.spot.symbol, "@107");
}

TEST_F(MarketDataStreamTest, AcksAndGarbageIgnored) {
    stream_->on_frame(book_frame("HYPE", "10.02", "10.03"));
    stream_->on_frame(book_frame("@107", "9.99", "10.00"));
    PriceState before = stream_->get_prices();
    updates_.clear();

    stream_->on_frame(R"({"channel":"subscriptionResponse","data":{"method":"subscribe"}})");
    stream_->on_frame("not json at all");
    stream_->on_frame(R"({"channel":"l2Book","data":{"levels":[[],[]]}})");
    stream_->on_frame(R"({"channel":"trades","data":[]})");

    EXPECT_TRUE(updates_.empty());
    PriceState after = stream_->get_prices();
    EXPECT_EQ(after.perp.best_bid, before.perp.best_bid);
    EXPECT_EQ(after.spot.best_ask, before.spot.best_ask);
}

TEST_F(MarketDataStreamTest, UntrackedCoinIgnored) {
    stream_->on_frame(book_frame("BTC", "60000", "60001"));
    EXPECT_TRUE(updates_.empty());

    PriceState p = stream_->get_prices();
    EXPECT_EQ(p.spot.best_bid, 0.0);
    EXPECT_EQ(p.perp.best_bid, 0.0);
}

TEST_F(MarketDataStreamTest, DisconnectIsIdempotent) {
    EXPECT_FALSE(stream_->is_connected());
    stream_->disconnect();
    stream_->disconnect();
    EXPECT_FALSE(stream_->is_connected());
}

TEST_F(MarketDataStreamTest, DisconnectCancelsBackoffWait) {
    settings_.reconnect_delay_s = 30;
    settings_.reconnect_max_delay_s = 60;
    settings_.connect_timeout_s = 1;
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());

    std::thread runner([&stream] { stream.connect(); });

    // Let the refused connect land in the 30s backoff wait
    std::this_thread::sleep_for(std::chrono::milliseconds(500));

    auto start = std::chrono::steady_clock::now();
    stream.disconnect();
    runner.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_FALSE(stream.is_connected());
}

TEST_F(MarketDataStreamTest, DisconnectBeforeConnectIsKept) {
    settings_.connect_timeout_s = 1;
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());
    stream.disconnect();

    auto start = std::chrono::steady_clock::now();
    stream.connect();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(1));
    EXPECT_FALSE(stream.is_connected());
}

TEST_F(MarketDataStreamTest, ConnectionTestSucceedsAndLeavesPricesAlone) {
    BookServer server(false);
    ASSERT_TRUE(server.listening());

    settings_.url = server.url();
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());

    EXPECT_TRUE(stream.test_connection());

    PriceState p = stream.get_prices();
    EXPECT_EQ(p.spot.best_ask, 0.0);
    EXPECT_EQ(p.perp.best_bid, 0.0);
    EXPECT_FALSE(stream.is_connected());
}

TEST_F(MarketDataStreamTest, StreamsBooksUntilDisconnect) {
    BookServer server(false);
    ASSERT_TRUE(server.listening());

    settings_.url = server.url();
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());
    std::atomic<int> updates{0};
    stream.set_price_callback([&updates](const PriceState&) { ++updates; });

    std::thread runner([&stream] { stream.connect(); });
    EXPECT_TRUE(wait_until([&] { return updates > 0; }, std::chrono::seconds(5)));
    EXPECT_TRUE(stream.is_connected());

    PriceState p = stream.get_prices();
    EXPECT_DOUBLE_EQ(p.spot.best_ask, 10.00);
    EXPECT_DOUBLE_EQ(p.perp.best_bid, 10.02);

    auto start = std::chrono::steady_clock::now();
    stream.disconnect();
    runner.join();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
    EXPECT_FALSE(stream.is_connected());
    EXPECT_EQ(server.connections.load(), 1);
}

TEST_F(MarketDataStreamTest, BackoffResetsAfterSuccessfulSession) {
    BookServer server(true);
    ASSERT_TRUE(server.listening());

    // Without a reset the waits grow 1s, 2s, 4s and the fourth session
    // starts after ~7s; with it every wait is 1s.
    settings_.url = server.url();
    settings_.reconnect_delay_s = 1;
    settings_.reconnect_max_delay_s = 8;
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());

    std::thread runner([&stream] { stream.connect(); });
    bool reached = wait_until([&] { return server.connections >= 4; }, std::chrono::milliseconds(5500));
    stream.disconnect();
    runner.join();

    EXPECT_TRUE(reached) << "sessions seen: " << server.connections.load();
}

TEST_F(MarketDataStreamTest, ConnectionTestFailsAgainstDeadEndpoint) {
    settings_.test_timeout_s = 1;
    MarketDataStream stream(settings_, std::make_shared<HyperliquidParser>());
    stream.on_frame(book_frame("HYPE", "10.02", "10.03"));

    EXPECT_FALSE(stream.test_connection());

    PriceState p = stream.get_prices();
    EXPECT_DOUBLE_EQ(p.perp.best_bid, 10.02);
    EXPECT_EQ(p.spot.best_bid, 0.0);
}

TEST(MarketDataStreamSubscriptionTest, MessageFormat) {
    nlohmann::json sub = nlohmann::json::parse(MarketDataStream::subscription_message("@107"));
    EXPECT_EQ(sub["method"], "subscribe");
    EXPECT_EQ(sub["subscription"]["type"], "l2Book");
    EXPECT_EQ(sub["subscription"]["coin"], "@107");
}
