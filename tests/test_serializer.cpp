#include "broker/Serializer.hpp"
#include "common/DateTime.hpp"
#include "TestAssert.hpp"

using namespace tsepush;

namespace {

    Instrument make_instrument() {
        Instrument instrument;
        instrument.identification.isin = "IRO1FOLD0001";
        instrument.thresholds = {1100, 900};

        TradeCandle& candle = instrument.trade_candle;
        candle.close_price = 1020;
        candle.last_price = 1025;
        candle.max_price = 1050;
        candle.min_price = 990;
        candle.open_price = 1010;
        candle.previous_price = 1000;
        candle.trade_num = 12;
        candle.trade_value = 3468000;
        candle.trade_volume = 3400;
        candle.last_trade_time = parse_trade_time("2024-05-17T09:05:00");

        instrument.order_book.rows[0].demand = {1, 100, 1000};
        instrument.order_book.rows[0].supply = {2, 200, 1010};
        instrument.order_book.rows[3].demand = {4, 40, 970};

        instrument.client_type.legal.buy = {1, 10};
        instrument.client_type.legal.sell = {2, 20};
        instrument.client_type.natural.buy = {3, 30};
        instrument.client_type.natural.sell = {4, 40};
        return instrument;
    }

    const char* TRADE_JSON = "\"trade\":[1020,1025,\"2024-05-17T09:05:00\",1050,990,1010,1000,12,3468000,3400]";
    const char* BOOK_JSON =
        "\"orderbook\":[[0,1,1000,100,2,1010,200],[1,0,0,0,0,0,0],[2,0,0,0,0,0,0],[3,4,970,40,0,0,0],[4,0,0,0,0,0,0]]";
    const char* CLIENT_TYPE_JSON = "\"clienttype\":[1,10,2,20,3,30,4,40]";

    bool test_trade_fields() {
        std::string out;
        serializer::append_trade(out, make_instrument().trade_candle);
        CHECK_STR_EQ(out, TRADE_JSON);

        TradeCandle empty;
        out.clear();
        serializer::append_trade(out, empty);
        CHECK_STR_EQ(out, "\"trade\":[0,0,null,0,0,0,0,0,0,0]");
        return true;
    }

    bool test_trade_time_with_microseconds() {
        TradeCandle candle;
        candle.last_trade_time = parse_trade_time("2024/05/17 12:29:59.12");
        std::string out;
        serializer::append_trade(out, candle);
        CHECK_STR_EQ(out, "\"trade\":[0,0,\"2024-05-17T12:29:59.120000\",0,0,0,0,0,0,0]");
        return true;
    }

    bool test_snapshot_all_channel_order() {
        std::vector<std::optional<Instrument>> instruments{make_instrument()};
        std::string expected = std::string("{\"IRO1FOLD0001\":{\"thresholds\":[1100,900],") + TRADE_JSON + "," +
                               BOOK_JSON + "," + CLIENT_TYPE_JSON + "}}";
        CHECK_STR_EQ(serializer::snapshot_response(instruments, SubscriptionChannel::All), expected);
        return true;
    }

    bool test_snapshot_single_channels() {
        std::vector<std::optional<Instrument>> instruments{std::nullopt, make_instrument()};
        CHECK_STR_EQ(serializer::snapshot_response(instruments, SubscriptionChannel::Trade),
                     std::string("{\"IRO1FOLD0001\":{") + TRADE_JSON + "}}");
        CHECK_STR_EQ(serializer::snapshot_response(instruments, SubscriptionChannel::OrderBook),
                     std::string("{\"IRO1FOLD0001\":{") + BOOK_JSON + "}}");
        CHECK_STR_EQ(serializer::snapshot_response(instruments, SubscriptionChannel::ClientType),
                     std::string("{\"IRO1FOLD0001\":{") + CLIENT_TYPE_JSON + "}}");
        CHECK_STR_EQ(serializer::snapshot_response({std::nullopt}, SubscriptionChannel::Trade), "{}");
        return true;
    }

    bool test_snapshot_multiple_instruments() {
        Instrument second;
        second.identification.isin = "IRO1IKCO0001";
        std::vector<std::optional<Instrument>> instruments{make_instrument(), second};
        CHECK_STR_EQ(serializer::snapshot_response(instruments, SubscriptionChannel::ClientType),
                     std::string("{\"IRO1FOLD0001\":{") + CLIENT_TYPE_JSON +
                     "},\"IRO1IKCO0001\":{\"clienttype\":[0,0,0,0,0,0,0,0]}}");
        return true;
    }

    bool test_order_book_update_carries_changed_ranks_only() {
        ChangeNotification notification{Channel::OrderBook, "IRO1FOLD0001", {0, 3}, make_instrument()};
        CHECK_STR_EQ(serializer::change_update(notification),
                     "{\"IRO1FOLD0001\":{\"orderbook\":[[0,1,1000,100,2,1010,200],[3,4,970,40,0,0,0]]}}");
        return true;
    }

    bool test_other_updates() {
        ChangeNotification trade{Channel::Trade, "IRO1FOLD0001", {}, make_instrument()};
        CHECK_STR_EQ(serializer::change_update(trade), std::string("{\"IRO1FOLD0001\":{") + TRADE_JSON + "}}");

        ChangeNotification limits{Channel::Thresholds, "IRO1FOLD0001", {}, make_instrument()};
        CHECK_STR_EQ(serializer::change_update(limits), "{\"IRO1FOLD0001\":{\"thresholds\":[1100,900]}}");

        ChangeNotification ct{Channel::ClientType, "IRO1FOLD0001", {}, make_instrument()};
        CHECK_STR_EQ(serializer::change_update(ct), std::string("{\"IRO1FOLD0001\":{") + CLIENT_TYPE_JSON + "}}");
        return true;
    }

    bool test_json_string_escaping() {
        std::string out;
        serializer::append_json_string(out, "a\"b\\c\nd\x01");
        CHECK_STR_EQ(out, "\"a\\\"b\\\\c\\nd\\u0001\"");
        return true;
    }

}

int main() {
    return tsepush::testing::run_all("Serializer Unit Test", {
        {"trade fields", test_trade_fields},
        {"trade time microseconds", test_trade_time_with_microseconds},
        {"all channel order", test_snapshot_all_channel_order},
        {"single channels", test_snapshot_single_channels},
        {"multiple instruments", test_snapshot_multiple_instruments},
        {"order book update", test_order_book_update_carries_changed_ranks_only},
        {"trade, thresholds and client type updates", test_other_updates},
        {"json string escaping", test_json_string_escaping},
    });
}
