#include "repository/MarketRepository.hpp"
#include "common/Logger.hpp"
#include <exception>

namespace tsepush {

    bool MarketRepository::add_instrument(const Identification& identification) {
        if (identification.isin.size() != constants::ISIN_LENGTH) {
            LOG_ERROR("Repository: refusing instrument with malformed isin [%s]", identification.isin.c_str());
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        Instrument instrument;
        instrument.identification = identification;
        auto [it, inserted] = instruments_.emplace(identification.isin, std::move(instrument));
        if (!inserted) return false;
        if (identification.tsetmc_code != 0) {
            isin_by_tsetmc_code_[identification.tsetmc_code] = identification.isin;
        }
        return true;
    }

    bool MarketRepository::apply_trade(const std::string& isin, const TradeCandle& candle) {
        std::vector<ChangeNotification> notifications;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Instrument* instrument = find_locked(isin);
            if (!instrument) {
                LOG_WARN("Repository: trade for unknown isin [%s]", isin.c_str());
                return false;
            }
            if (!update_trade_locked(*instrument, candle)) {
                return false;
            }
            notifications.push_back({Channel::Trade, isin, {}, *instrument});
        }
        notify(notifications);
        return true;
    }

    bool MarketRepository::apply_thresholds(const std::string& isin, const PriceThresholds& thresholds) {
        std::vector<ChangeNotification> notifications;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Instrument* instrument = find_locked(isin);
            if (!instrument) {
                LOG_WARN("Repository: thresholds for unknown isin [%s]", isin.c_str());
                return false;
            }
            if (instrument->thresholds == thresholds) {
                return false;
            }
            instrument->thresholds = thresholds;
            notifications.push_back({Channel::Thresholds, isin, {}, *instrument});
        }
        notify(notifications);
        return true;
    }

    bool MarketRepository::apply_client_type_snapshot(const std::string& isin, const ClientType& client_type) {
        std::vector<ChangeNotification> notifications;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Instrument* instrument = find_locked(isin);
            if (!instrument) {
                LOG_WARN("Repository: client type for unknown isin [%s]", isin.c_str());
                return false;
            }
            if (instrument->client_type == client_type) {
                return false;
            }
            instrument->client_type = client_type;
            notifications.push_back({Channel::ClientType, isin, {}, *instrument});
        }
        notify(notifications);
        return true;
    }

    std::vector<size_t> MarketRepository::apply_order_book_snapshot(const std::string& isin, const std::vector<OrderBookRow>& rows) {
        std::vector<ChangeNotification> notifications;
        std::vector<size_t> changed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Instrument* instrument = find_locked(isin);
            if (!instrument) {
                LOG_WARN("Repository: order book for unknown isin [%s]", isin.c_str());
                return changed;
            }
            changed = update_order_book_locked(*instrument, rows);
            if (changed.empty()) {
                return changed;
            }
            notifications.push_back({Channel::OrderBook, isin, changed, *instrument});
        }
        notify(notifications);
        return changed;
    }

    size_t MarketRepository::apply_market_watch(const std::vector<MarketWatchTrade>& entries) {
        int year = 0, month = 0, day = 0;
        utils::local_today(year, month, day);

        std::vector<ChangeNotification> notifications;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : entries) {
                const std::string& isin = entry.identification.isin;
                if (isin.size() != constants::ISIN_LENGTH) {
                    LOG_WARN("Repository: market watch row with malformed isin [%s]", isin.c_str());
                    continue;
                }

                Instrument* instrument = find_locked(isin);
                if (!instrument) {
                    Instrument fresh;
                    fresh.identification = entry.identification;
                    instrument = &instruments_.emplace(isin, std::move(fresh)).first->second;
                    if (entry.identification.tsetmc_code != 0) {
                        isin_by_tsetmc_code_[entry.identification.tsetmc_code] = isin;
                    }
                    LOG_INFO("Repository: new instrument [%s] from market watch", isin.c_str());
                }

                // The scan only reports time-of-day, the date is today's
                TradeCandle candle = entry.trade_candle;
                TradeTime time = entry.last_trade_time;
                time.year = year;
                time.month = month;
                time.day = day;
                candle.last_trade_time = time;

                if (update_trade_locked(*instrument, candle)) {
                    notifications.push_back({Channel::Trade, isin, {}, *instrument});
                }

                std::vector<size_t> changed = update_order_book_locked(*instrument, entry.order_book_rows);
                if (!changed.empty()) {
                    notifications.push_back({Channel::OrderBook, isin, std::move(changed), *instrument});
                }
            }
        }
        size_t count = notifications.size();
        notify(notifications);
        return count;
    }

    size_t MarketRepository::apply_client_types(const std::vector<MarketWatchClientType>& entries) {
        std::vector<ChangeNotification> notifications;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : entries) {
                auto code = isin_by_tsetmc_code_.find(entry.tsetmc_code);
                if (code == isin_by_tsetmc_code_.end()) {
                    continue;
                }
                Instrument* instrument = find_locked(code->second);
                if (!instrument || instrument->client_type == entry.client_type) {
                    continue;
                }
                instrument->client_type = entry.client_type;
                notifications.push_back({Channel::ClientType, code->second, {}, *instrument});
            }
        }
        size_t count = notifications.size();
        notify(notifications);
        return count;
    }

    std::optional<Instrument> MarketRepository::snapshot(const std::string& isin) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = instruments_.find(isin);
        if (it == instruments_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::optional<Instrument>> MarketRepository::snapshot(const std::vector<std::string>& isins) const {
        std::vector<std::optional<Instrument>> out;
        out.reserve(isins.size());
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& isin : isins) {
            auto it = instruments_.find(isin);
            if (it == instruments_.end()) {
                out.emplace_back(std::nullopt);
            } else {
                out.emplace_back(it->second);
            }
        }
        return out;
    }

    size_t MarketRepository::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instruments_.size();
    }

    void MarketRepository::register_change_sink(ChangeSink* sink) {
        ChangeSink* previous = sink_.exchange(sink, std::memory_order_acq_rel);
        if (previous != nullptr && sink != nullptr && previous != sink) {
            LOG_WARN("Repository: replacing the registered change sink");
        }
    }

    Instrument* MarketRepository::find_locked(const std::string& isin) {
        auto it = instruments_.find(isin);
        return it == instruments_.end() ? nullptr : &it->second;
    }

    bool MarketRepository::update_trade_locked(Instrument& instrument, const TradeCandle& candle) {
        TradeCandle& stored = instrument.trade_candle;
        // Candles without a trade time can only be compared whole
        if (stored == candle) {
            return false;
        }
        if (stored.last_trade_time && candle.last_trade_time &&
            stored.last_trade_time->same_time_of_day(*candle.last_trade_time)) {
            return false;
        }
        stored = candle;
        return true;
    }

    std::vector<size_t> MarketRepository::update_order_book_locked(Instrument& instrument, const std::vector<OrderBookRow>& rows) {
        std::vector<size_t> changed;
        auto& stored = instrument.order_book.rows;
        if (rows.size() > stored.size()) {
            LOG_WARN("Repository: %zu order book rows for [%s], keeping the first %zu",
                     rows.size(), instrument.identification.isin.c_str(), stored.size());
        }
        for (size_t rank = 0; rank < rows.size() && rank < stored.size(); ++rank) {
            if (rows[rank] != stored[rank]) {
                stored[rank] = rows[rank];
                changed.push_back(rank);
            }
        }
        return changed;
    }

    void MarketRepository::notify(const std::vector<ChangeNotification>& notifications) {
        ChangeSink* sink = sink_.load(std::memory_order_acquire);
        if (sink == nullptr) {
            return;
        }
        for (const auto& notification : notifications) {
            try {
                sink->on_change(notification);
            } catch (const std::exception& e) {
                LOG_ERROR("Repository: change sink failed for [%s] %s: %s",
                          notification.isin.c_str(), channel_name(notification.channel), e.what());
            }
        }
    }

}
