#include "broker/Serializer.hpp"
#include "common/DateTime.hpp"
#include <algorithm>
#include <cstdio>
#include <initializer_list>

namespace tsepush::serializer {

    namespace {

        void append_int(std::string& out, int64_t value) {
            char buf[24];
            int n = snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(value));
            out.append(buf, static_cast<size_t>(n));
        }

        // Writes "a,b,c" for the given values
        void append_ints(std::string& out, std::initializer_list<int64_t> values) {
            bool first = true;
            for (int64_t v : values) {
                if (!first) out.push_back(',');
                append_int(out, v);
                first = false;
            }
        }

        void append_row(std::string& out, size_t rank, const OrderBookRow& row) {
            out.push_back('[');
            append_ints(out, {
                static_cast<int64_t>(rank),
                row.demand.num, row.demand.price, row.demand.volume,
                row.supply.num, row.supply.price, row.supply.volume
            });
            out.push_back(']');
        }

    }

    void append_json_string(std::string& out, std::string_view text) {
        out.push_back('"');
        for (char c : text) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        out += buf;
                    } else {
                        out.push_back(c);
                    }
            }
        }
        out.push_back('"');
    }

    void append_trade(std::string& out, const TradeCandle& candle) {
        out += "\"trade\":[";
        append_ints(out, {candle.close_price, candle.last_price});
        out.push_back(',');
        if (candle.last_trade_time) {
            append_json_string(out, format_trade_time(*candle.last_trade_time));
        } else {
            out += "null";
        }
        out.push_back(',');
        append_ints(out, {
            candle.max_price, candle.min_price, candle.open_price, candle.previous_price,
            candle.trade_num, candle.trade_value, candle.trade_volume
        });
        out.push_back(']');
    }

    void append_thresholds(std::string& out, const PriceThresholds& thresholds) {
        out += "\"thresholds\":[";
        append_ints(out, {thresholds.max_price, thresholds.min_price});
        out.push_back(']');
    }

    void append_client_type(std::string& out, const ClientType& ct) {
        out += "\"clienttype\":[";
        append_ints(out, {
            ct.legal.buy.num, ct.legal.buy.volume, ct.legal.sell.num, ct.legal.sell.volume,
            ct.natural.buy.num, ct.natural.buy.volume, ct.natural.sell.num, ct.natural.sell.volume
        });
        out.push_back(']');
    }

    void append_order_book(std::string& out, const OrderBook& book, const std::vector<size_t>* ranks) {
        out += "\"orderbook\":[";
        bool first = true;
        for (size_t rank = 0; rank < book.rows.size(); ++rank) {
            if (ranks && std::find(ranks->begin(), ranks->end(), rank) == ranks->end()) {
                continue;
            }
            if (!first) out.push_back(',');
            append_row(out, rank, book.rows[rank]);
            first = false;
        }
        out.push_back(']');
    }

    void append_instrument(std::string& out, const Instrument& instrument, SubscriptionChannel channel) {
        append_json_string(out, instrument.identification.isin);
        out += ":{";
        switch (channel) {
            case SubscriptionChannel::All:
                append_thresholds(out, instrument.thresholds);
                out.push_back(',');
                append_trade(out, instrument.trade_candle);
                out.push_back(',');
                append_order_book(out, instrument.order_book, nullptr);
                out.push_back(',');
                append_client_type(out, instrument.client_type);
                break;
            case SubscriptionChannel::Trade:
                append_trade(out, instrument.trade_candle);
                break;
            case SubscriptionChannel::OrderBook:
                append_order_book(out, instrument.order_book, nullptr);
                break;
            case SubscriptionChannel::ClientType:
                append_client_type(out, instrument.client_type);
                break;
        }
        out.push_back('}');
    }

    std::string snapshot_response(const std::vector<std::optional<Instrument>>& instruments, SubscriptionChannel channel) {
        std::string out = "{";
        bool first = true;
        for (const auto& instrument : instruments) {
            if (!instrument) continue;
            if (!first) out.push_back(',');
            append_instrument(out, *instrument, channel);
            first = false;
        }
        out.push_back('}');
        return out;
    }

    std::string change_update(const ChangeNotification& notification) {
        std::string out = "{";
        append_json_string(out, notification.isin);
        out += ":{";
        const Instrument& instrument = notification.instrument;
        switch (notification.channel) {
            case Channel::Trade:
                append_trade(out, instrument.trade_candle);
                break;
            case Channel::OrderBook:
                append_order_book(out, instrument.order_book, &notification.changed_rows);
                break;
            case Channel::ClientType:
                append_client_type(out, instrument.client_type);
                break;
            case Channel::Thresholds:
                append_thresholds(out, instrument.thresholds);
                break;
        }
        out += "}}";
        return out;
    }

}
