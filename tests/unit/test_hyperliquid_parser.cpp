#include <gtest/gtest.h>
#include "parsers/hyperliquid_parser.hpp"

class HyperliquidParserTest : public ::testing::Test {
protected:
    HyperliquidParser parser_;
    OrderBookSnapshot depth_;
    std::string error_;

    ParseResultType parse(const std::string& payload) {
        depth_ = OrderBookSnapshot{};
        error_.clear();
        return parser_.parse(payload, depth_, error_);
    }
};

TEST_F(HyperliquidParserTest, L2BookTopOfBook) {
    const std::string frame = R"({"channel":"l2Book","data":{"coin":"HYPE","time":1700000000123,
        "levels":[[{"px":"25.101","sz":"12.5","n":3},{"px":"25.100","sz":"40","n":1}],
                  [{"px":"25.105","sz":"7.25","n":2}]]}})";

    ASSERT_EQ(parse(frame), ParseResultType::Depth);
    EXPECT_EQ(depth_.symbol, "HYPE");
    EXPECT_EQ(depth_.timestamp, 1700000000123LL);
    EXPECT_GT(depth_.local_timestamp, 0);

    ASSERT_EQ(depth_.bids.size(), 2u);
    ASSERT_EQ(depth_.asks.size(), 1u);
    EXPECT_DOUBLE_EQ(depth_.bids[0].price, 25.101);
    EXPECT_DOUBLE_EQ(depth_.bids[0].quantity, 12.5);
    EXPECT_DOUBLE_EQ(depth_.asks[0].price, 25.105);
    EXPECT_DOUBLE_EQ(depth_.asks[0].quantity, 7.25);
}

TEST_F(HyperliquidParserTest, NumericLevelsAccepted) {
    const std::string frame = R"({"channel":"l2Book","data":{"coin":"@107","time":1,
        "levels":[[{"px":10.5,"sz":1}],[{"px":10.6,"sz":2}]]}})";

    ASSERT_EQ(parse(frame), ParseResultType::Depth);
    EXPECT_DOUBLE_EQ(depth_.bids[0].price, 10.5);
    EXPECT_DOUBLE_EQ(depth_.asks[0].quantity, 2.0);
}

TEST_F(HyperliquidParserTest, EmptySideParses) {
    const std::string frame = R"({"channel":"l2Book","data":{"coin":"HYPE","time":1,
        "levels":[[],[{"px":"25.105","sz":"1"}]]}})";

    ASSERT_EQ(parse(frame), ParseResultType::Depth);
    EXPECT_TRUE(depth_.bids.empty());
    EXPECT_EQ(depth_.asks.size(), 1u);
}

TEST_F(HyperliquidParserTest, SubscriptionResponse) {
    const std::string frame = R"({"channel":"subscriptionResponse",
        "data":{"method":"subscribe","subscription":{"type":"l2Book","coin":"HYPE"}}})";
    EXPECT_EQ(parse(frame), ParseResultType::SubscriptionAck);
}

TEST_F(HyperliquidParserTest, OtherChannelIgnored) {
    EXPECT_EQ(parse(R"({"channel":"pong"})"), ParseResultType::None);
    EXPECT_EQ(parse(R"({"method":"pong"})"), ParseResultType::None);
}

TEST_F(HyperliquidParserTest, GarbageIsMalformed) {
    EXPECT_EQ(parse("this is not json"), ParseResultType::Malformed);
    EXPECT_FALSE(error_.empty());

    EXPECT_EQ(parse("[1,2,3]"), ParseResultType::Malformed);
    EXPECT_FALSE(error_.empty());
}

TEST_F(HyperliquidParserTest, L2BookWithoutCoinIsMalformed) {
    EXPECT_EQ(parse(R"({"channel":"l2Book","data":{"time":1,"levels":[[],[]]}})"),
              ParseResultType::Malformed);
    EXPECT_FALSE(error_.empty());
}

TEST_F(HyperliquidParserTest, L2BookWithoutLevelsIsMalformed) {
    EXPECT_EQ(parse(R"({"channel":"l2Book","data":{"coin":"HYPE","time":1}})"),
              ParseResultType::Malformed);
}

TEST_F(HyperliquidParserTest, ParserIsReusable) {
    const std::string good = R"({"channel":"l2Book","data":{"coin":"HYPE","time":1,
        "levels":[[{"px":"1","sz":"1"}],[{"px":"2","sz":"1"}]]}})";

    ASSERT_EQ(parse(good), ParseResultType::Depth);
    ASSERT_EQ(parse("{broken"), ParseResultType::Malformed);
    ASSERT_EQ(parse(good), ParseResultType::Depth);
    EXPECT_DOUBLE_EQ(depth_.asks[0].price, 2.0);
}
