#pragma once

#include "broker/Command.hpp"
#include "common/Types.hpp"
#include "repository/MarketRepository.hpp"
#include <string>
#include <optional>
#include <string_view>
#include <vector>

namespace tsepush {

    // Downstream wire format: {"<isin>":{"<channel>":[fields...]}}
    namespace serializer {

        void append_trade(std::string& out, const TradeCandle& candle);
        void append_thresholds(std::string& out, const PriceThresholds& thresholds);
        void append_client_type(std::string& out, const ClientType& client_type);

        // Function: append_order_book
        // Description: Writes "orderbook":[[rank, d.num, d.price, d.volume, s.num, s.price, s.volume],...].
        // Inputs: ranks - Rows to include, nullptr for the whole book.
        void append_order_book(std::string& out, const OrderBook& book, const std::vector<size_t>* ranks);

        // Function: append_instrument
        // Description: Writes "<isin>":{...} restricted to the requested channel.
        //              `All` writes thresholds, trade, orderbook and clienttype.
        void append_instrument(std::string& out, const Instrument& instrument, SubscriptionChannel channel);

        // Function: snapshot_response
        // Description: Initial response to a subscribe command. Unknown instruments are skipped.
        // Outputs: "{}" when no instrument is known.
        std::string snapshot_response(const std::vector<std::optional<Instrument>>& instruments, SubscriptionChannel channel);

        // Function: change_update
        // Description: Push message for one notification. Order book pushes carry only the changed ranks.
        std::string change_update(const ChangeNotification& notification);

        void append_json_string(std::string& out, std::string_view text);

    }

}
