#pragma once

#include "common/Utils.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsepush {

    // Function: Identification
    // Description: Immutable identity of one instrument.
    //              isin is the 12 character key of both feed protocols,
    //              tsetmc_code is only used by the market-wide bulk scan.
    struct Identification {
        std::string isin;
        int64_t tsetmc_code = 0;
        std::string ticker;
        std::string name;
    };

    // Date and time-of-day of the last trade, local exchange time.
    struct TradeTime {
        int year = 0;
        int month = 0;
        int day = 0;
        int hour = 0;
        int minute = 0;
        int second = 0;
        int microsecond = 0;

        bool same_time_of_day(const TradeTime& other) const {
            return hour == other.hour && minute == other.minute &&
                   second == other.second && microsecond == other.microsecond;
        }

        bool operator==(const TradeTime&) const = default;
    };

    // Function: TradeCandle
    // Description: Intraday aggregate trade statistics. Prices are integers in Rials.
    struct TradeCandle {
        int64_t previous_price = 0;
        int64_t open_price = 0;
        int64_t close_price = 0;
        int64_t last_price = 0;
        int64_t min_price = 0;
        int64_t max_price = 0;
        int64_t trade_num = 0;
        int64_t trade_volume = 0;
        int64_t trade_value = 0;
        std::optional<TradeTime> last_trade_time;

        bool operator==(const TradeCandle&) const = default;
    };

    struct OrderBookSide {
        int64_t num = 0;
        int64_t volume = 0;
        int64_t price = 0;

        bool operator==(const OrderBookSide&) const = default;
    };

    struct OrderBookRow {
        OrderBookSide demand;
        OrderBookSide supply;

        bool operator==(const OrderBookRow&) const = default;
    };

    // Rank 0 is the best row.
    struct OrderBook {
        std::array<OrderBookRow, constants::ORDER_BOOK_DEPTH> rows{};

        bool operator==(const OrderBook&) const = default;
    };

    struct ClientTypeSide {
        int64_t num = 0;
        int64_t volume = 0;

        bool operator==(const ClientTypeSide&) const = default;
    };

    struct ClientTypeClass {
        ClientTypeSide buy;
        ClientTypeSide sell;

        bool operator==(const ClientTypeClass&) const = default;
    };

    // Legal (institutional) vs natural (individual) investor activity.
    struct ClientType {
        ClientTypeClass legal;
        ClientTypeClass natural;

        bool operator==(const ClientType&) const = default;
    };

    struct PriceThresholds {
        int64_t max_price = 0;
        int64_t min_price = 0;

        bool operator==(const PriceThresholds&) const = default;
    };

    // Function: Instrument
    // Description: The full record kept per instrument by the repository.
    struct Instrument {
        Identification identification;
        TradeCandle trade_candle;
        OrderBook order_book;
        ClientType client_type;
        PriceThresholds thresholds;
    };

    // One row of the market-wide bulk scan. Carries only the time-of-day of the last trade.
    struct MarketWatchTrade {
        Identification identification;
        TradeCandle trade_candle;
        TradeTime last_trade_time;
        std::vector<OrderBookRow> order_book_rows;
    };

    struct MarketWatchClientType {
        int64_t tsetmc_code = 0;
        ClientType client_type;
    };

    // Data categories of an instrument that change independently.
    enum class Channel : uint8_t {
        Trade,
        OrderBook,
        ClientType,
        Thresholds
    };

    inline const char* channel_name(Channel channel) {
        switch (channel) {
            case Channel::Trade: return "trade";
            case Channel::OrderBook: return "orderbook";
            case Channel::ClientType: return "clienttype";
            case Channel::Thresholds: return "thresholds";
        }
        return "unknown";
    }

}
