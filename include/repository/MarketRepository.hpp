#pragma once

#include "common/Types.hpp"
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tsepush {

    // Function: ChangeNotification
    // Description: Emitted by the repository after it mutated one channel of one instrument.
    //              `instrument` is a copy taken in the same critical section as the mutation.
    struct ChangeNotification {
        Channel channel;
        std::string isin;
        std::vector<size_t> changed_rows; // order book ranks, empty for other channels
        Instrument instrument;
    };

    // Observer of repository changes. At most one is installed at a time.
    class ChangeSink {
    public:
        virtual ~ChangeSink() = default;
        virtual void on_change(const ChangeNotification& notification) = 0;
    };

    // Function: MarketRepository
    // Description: Sole owner of the instrument records, keyed by ISIN.
    //              Every apply_* compares against the stored state under one lock and
    //              only mutates, and notifies, when observable state changes.
    //              Notifications are dispatched after the lock is released.
    class MarketRepository {
    public:
        MarketRepository() = default;
        MarketRepository(const MarketRepository&) = delete;
        MarketRepository& operator=(const MarketRepository&) = delete;

        // Function: add_instrument
        // Description: Seeds an empty record for an instrument.
        // Outputs: false if the ISIN is already present or malformed.
        bool add_instrument(const Identification& identification);

        // Function: apply_trade
        // Description: Streaming trade update. Unknown ISINs are rejected.
        //              An update carrying the stored time-of-day is a duplicate.
        // Outputs: true if the candle was overwritten.
        bool apply_trade(const std::string& isin, const TradeCandle& candle);

        bool apply_thresholds(const std::string& isin, const PriceThresholds& thresholds);

        bool apply_client_type_snapshot(const std::string& isin, const ClientType& client_type);

        // Function: apply_order_book_snapshot
        // Description: Overwrites only the rows that differ and reports their ranks.
        // Outputs: The changed ranks, empty when nothing changed or the ISIN is unknown.
        std::vector<size_t> apply_order_book_snapshot(const std::string& isin, const std::vector<OrderBookRow>& rows);

        // Function: apply_market_watch
        // Description: Bulk scan of the whole market. Creates records for new ISINs.
        // Outputs: Number of notifications emitted.
        size_t apply_market_watch(const std::vector<MarketWatchTrade>& entries);

        // Function: apply_client_types
        // Description: Bulk client type scan keyed by TSETMC code. Unknown codes are skipped.
        // Outputs: Number of notifications emitted.
        size_t apply_client_types(const std::vector<MarketWatchClientType>& entries);

        std::optional<Instrument> snapshot(const std::string& isin) const;

        // One lock acquisition for the whole list, result is index aligned with `isins`.
        std::vector<std::optional<Instrument>> snapshot(const std::vector<std::string>& isins) const;

        size_t size() const;

        // Function: register_change_sink
        // Description: Installs the observer. Passing nullptr detaches it.
        //              Without a sink, notifications are dropped.
        void register_change_sink(ChangeSink* sink);

    private:
        Instrument* find_locked(const std::string& isin);

        // Both return true when they changed the stored state.
        static bool update_trade_locked(Instrument& instrument, const TradeCandle& candle);
        static std::vector<size_t> update_order_book_locked(Instrument& instrument, const std::vector<OrderBookRow>& rows);

        void notify(const std::vector<ChangeNotification>& notifications);

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Instrument> instruments_;
        std::unordered_map<int64_t, std::string> isin_by_tsetmc_code_;

        std::atomic<ChangeSink*> sink_{nullptr};
    };

}
