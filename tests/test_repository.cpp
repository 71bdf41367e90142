#include "repository/MarketRepository.hpp"
#include "TestAssert.hpp"
#include <stdexcept>

using namespace tsepush;

namespace {

    const std::string ISIN_A = "IRO1FOLD0001";
    const std::string ISIN_B = "IRO1IKCO0001";

    struct RecordingSink : ChangeSink {
        std::vector<ChangeNotification> received;
        bool throw_on_change = false;

        void on_change(const ChangeNotification& notification) override {
            received.push_back(notification);
            if (throw_on_change) throw std::runtime_error("sink failure");
        }
    };

    TradeTime make_time(int hour, int minute, int second, int day = 17) {
        TradeTime t;
        t.year = 2024;
        t.month = 5;
        t.day = day;
        t.hour = hour;
        t.minute = minute;
        t.second = second;
        return t;
    }

    TradeCandle make_candle(int64_t last, const TradeTime& time) {
        TradeCandle candle;
        candle.previous_price = 1000;
        candle.open_price = 1010;
        candle.close_price = last;
        candle.last_price = last;
        candle.min_price = 990;
        candle.max_price = 1050;
        candle.trade_num = 12;
        candle.trade_volume = 3400;
        candle.trade_value = last * 3400;
        candle.last_trade_time = time;
        return candle;
    }

    OrderBookRow make_row(int64_t bid, int64_t ask) {
        OrderBookRow row;
        row.demand = {1, 100, bid};
        row.supply = {2, 200, ask};
        return row;
    }

    Identification make_id(const std::string& isin, int64_t code = 0) {
        Identification id;
        id.isin = isin;
        id.tsetmc_code = code;
        return id;
    }

    bool test_add_instrument() {
        MarketRepository repo;
        CHECK(repo.add_instrument(make_id(ISIN_A)));
        CHECK_FALSE(repo.add_instrument(make_id(ISIN_A)));
        CHECK_FALSE(repo.add_instrument(make_id("SHORT")));
        CHECK_EQ(repo.size(), size_t{1});
        auto snap = repo.snapshot(ISIN_A);
        CHECK(snap.has_value());
        CHECK(!snap->trade_candle.last_trade_time.has_value());
        return true;
    }

    bool test_trade_unknown_isin_is_rejected() {
        MarketRepository repo;
        RecordingSink sink;
        repo.register_change_sink(&sink);
        CHECK_FALSE(repo.apply_trade(ISIN_A, make_candle(1020, make_time(9, 5, 0))));
        CHECK(sink.received.empty());
        CHECK_EQ(repo.size(), size_t{0});
        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_trade_duplicate_time_of_day_is_dropped() {
        MarketRepository repo;
        RecordingSink sink;
        repo.add_instrument(make_id(ISIN_A));
        repo.register_change_sink(&sink);

        CHECK(repo.apply_trade(ISIN_A, make_candle(1020, make_time(9, 5, 0))));
        CHECK_EQ(sink.received.size(), size_t{1});
        CHECK(sink.received[0].channel == Channel::Trade);
        CHECK_EQ(sink.received[0].instrument.trade_candle.last_price, int64_t{1020});

        // Same time-of-day on another date, different prices: still a duplicate
        CHECK_FALSE(repo.apply_trade(ISIN_A, make_candle(1030, make_time(9, 5, 0, 18))));
        CHECK_EQ(sink.received.size(), size_t{1});
        CHECK_EQ(repo.snapshot(ISIN_A)->trade_candle.last_price, int64_t{1020});

        CHECK(repo.apply_trade(ISIN_A, make_candle(1030, make_time(9, 5, 1))));
        CHECK_EQ(sink.received.size(), size_t{2});
        CHECK_EQ(repo.snapshot(ISIN_A)->trade_candle.last_price, int64_t{1030});

        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_trade_without_time_is_applied_once() {
        MarketRepository repo;
        RecordingSink sink;
        repo.add_instrument(make_id(ISIN_A));
        repo.register_change_sink(&sink);

        TradeCandle candle = make_candle(1020, make_time(9, 5, 0));
        candle.last_trade_time.reset();
        CHECK(repo.apply_trade(ISIN_A, candle));
        CHECK_FALSE(repo.apply_trade(ISIN_A, candle));
        CHECK_EQ(sink.received.size(), size_t{1});

        // A different timeless candle is still a change
        candle.last_price = 1025;
        CHECK(repo.apply_trade(ISIN_A, candle));
        CHECK_EQ(sink.received.size(), size_t{2});
        CHECK_EQ(repo.snapshot(ISIN_A)->trade_candle.last_price, int64_t{1025});

        // An untouched record ignores the empty candle
        repo.add_instrument(make_id(ISIN_B));
        CHECK_FALSE(repo.apply_trade(ISIN_B, TradeCandle{}));
        CHECK_EQ(sink.received.size(), size_t{2});

        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_order_book_reports_changed_ranks() {
        MarketRepository repo;
        RecordingSink sink;
        repo.add_instrument(make_id(ISIN_A));
        repo.register_change_sink(&sink);

        std::vector<OrderBookRow> rows(constants::ORDER_BOOK_DEPTH);
        rows[0] = make_row(1000, 1010);
        rows[2] = make_row(980, 1030);

        auto changed = repo.apply_order_book_snapshot(ISIN_A, rows);
        CHECK_EQ(changed.size(), size_t{2});
        CHECK_EQ(changed[0], size_t{0});
        CHECK_EQ(changed[1], size_t{2});
        CHECK_EQ(sink.received.size(), size_t{1});
        CHECK(sink.received[0].channel == Channel::OrderBook);
        CHECK(sink.received[0].changed_rows == changed);

        // Identical snapshot: nothing changes
        CHECK(repo.apply_order_book_snapshot(ISIN_A, rows).empty());
        CHECK_EQ(sink.received.size(), size_t{1});

        rows[2] = make_row(985, 1030);
        changed = repo.apply_order_book_snapshot(ISIN_A, rows);
        CHECK_EQ(changed.size(), size_t{1});
        CHECK_EQ(changed[0], size_t{2});
        CHECK_EQ(repo.snapshot(ISIN_A)->order_book.rows[2].demand.price, int64_t{985});
        CHECK_EQ(repo.snapshot(ISIN_A)->order_book.rows[0].demand.price, int64_t{1000});

        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_order_book_extra_rows_ignored() {
        MarketRepository repo;
        repo.add_instrument(make_id(ISIN_A));

        std::vector<OrderBookRow> rows;
        for (int i = 0; i < 7; ++i) rows.push_back(make_row(1000 - i, 1010 + i));
        auto changed = repo.apply_order_book_snapshot(ISIN_A, rows);
        CHECK_EQ(changed.size(), constants::ORDER_BOOK_DEPTH);
        CHECK_EQ(changed.back(), constants::ORDER_BOOK_DEPTH - 1);
        return true;
    }

    bool test_client_type_and_thresholds_diff() {
        MarketRepository repo;
        RecordingSink sink;
        repo.add_instrument(make_id(ISIN_A));
        repo.register_change_sink(&sink);

        ClientType ct;
        CHECK_FALSE(repo.apply_client_type_snapshot(ISIN_A, ct));
        ct.natural.buy = {10, 5000};
        CHECK(repo.apply_client_type_snapshot(ISIN_A, ct));
        CHECK_FALSE(repo.apply_client_type_snapshot(ISIN_A, ct));

        PriceThresholds limits{1100, 900};
        CHECK(repo.apply_thresholds(ISIN_A, limits));
        CHECK_FALSE(repo.apply_thresholds(ISIN_A, limits));
        CHECK_FALSE(repo.apply_thresholds(ISIN_B, limits));

        CHECK_EQ(sink.received.size(), size_t{2});
        CHECK(sink.received[0].channel == Channel::ClientType);
        CHECK(sink.received[1].channel == Channel::Thresholds);
        CHECK_EQ(sink.received[1].instrument.thresholds.max_price, int64_t{1100});

        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_market_watch_creates_records() {
        MarketRepository repo;
        RecordingSink sink;
        repo.register_change_sink(&sink);

        MarketWatchTrade entry;
        entry.identification = make_id(ISIN_B, 65883838195688438LL);
        entry.trade_candle = make_candle(2200, make_time(0, 0, 0));
        entry.last_trade_time = make_time(10, 15, 30);
        entry.order_book_rows = {make_row(2190, 2210)};

        CHECK_EQ(repo.apply_market_watch({entry}), size_t{2});
        CHECK_EQ(repo.size(), size_t{1});

        int year = 0, month = 0, day = 0;
        utils::local_today(year, month, day);
        auto snap = repo.snapshot(ISIN_B);
        CHECK(snap.has_value());
        CHECK(snap->trade_candle.last_trade_time.has_value());
        CHECK_EQ(snap->trade_candle.last_trade_time->year, year);
        CHECK_EQ(snap->trade_candle.last_trade_time->day, day);
        CHECK_EQ(snap->trade_candle.last_trade_time->hour, 10);

        // Second scan with nothing new
        CHECK_EQ(repo.apply_market_watch({entry}), size_t{0});

        MarketWatchClientType ct_entry;
        ct_entry.tsetmc_code = 65883838195688438LL;
        ct_entry.client_type.legal.sell = {3, 700};
        MarketWatchClientType unknown;
        unknown.tsetmc_code = 42;
        unknown.client_type.legal.sell = {1, 1};
        CHECK_EQ(repo.apply_client_types({ct_entry, unknown}), size_t{1});
        CHECK_EQ(repo.snapshot(ISIN_B)->client_type.legal.sell.volume, int64_t{700});

        repo.register_change_sink(nullptr);
        return true;
    }

    bool test_snapshot_list_is_index_aligned() {
        MarketRepository repo;
        repo.add_instrument(make_id(ISIN_A));
        auto snaps = repo.snapshot(std::vector<std::string>{ISIN_B, ISIN_A});
        CHECK_EQ(snaps.size(), size_t{2});
        CHECK(!snaps[0].has_value());
        CHECK(snaps[1].has_value());
        CHECK_STR_EQ(snaps[1]->identification.isin, ISIN_A);
        return true;
    }

    bool test_throwing_sink_does_not_break_update() {
        MarketRepository repo;
        RecordingSink sink;
        sink.throw_on_change = true;
        repo.add_instrument(make_id(ISIN_A));
        repo.register_change_sink(&sink);

        CHECK(repo.apply_thresholds(ISIN_A, PriceThresholds{1100, 900}));
        CHECK_EQ(repo.snapshot(ISIN_A)->thresholds.min_price, int64_t{900});
        CHECK_EQ(sink.received.size(), size_t{1});

        repo.register_change_sink(nullptr);
        CHECK(repo.apply_thresholds(ISIN_A, PriceThresholds{1200, 900}));
        CHECK_EQ(sink.received.size(), size_t{1});
        return true;
    }

}

int main() {
    return tsepush::testing::run_all("MarketRepository Unit Test", {
        {"add_instrument", test_add_instrument},
        {"trade for unknown isin", test_trade_unknown_isin_is_rejected},
        {"duplicate trade time-of-day", test_trade_duplicate_time_of_day_is_dropped},
        {"trade without time", test_trade_without_time_is_applied_once},
        {"order book changed ranks", test_order_book_reports_changed_ranks},
        {"order book extra rows", test_order_book_extra_rows_ignored},
        {"client type and thresholds diff", test_client_type_and_thresholds_diff},
        {"market watch bulk scan", test_market_watch_creates_records},
        {"snapshot list", test_snapshot_list_is_index_aligned},
        {"throwing change sink", test_throwing_sink_does_not_break_update},
    });
}
