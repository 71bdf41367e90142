#include "broker/SubscriptionBroker.hpp"
#include "broker/Serializer.hpp"
#include "common/Logger.hpp"
#include <algorithm>
#include <exception>

namespace tsepush {

    namespace {

        void toggle(std::unordered_set<SubscriberPtr>& set, Action action, const SubscriberPtr& subscriber) {
            switch (action) {
                case Action::Subscribe: set.insert(subscriber); break;
                case Action::Unsubscribe: set.erase(subscriber); break;
            }
        }

    }

    SubscriptionBroker::SubscriptionBroker(MarketRepository& repository)
        : repository_(repository) {
        repository_.register_change_sink(this);
    }

    SubscriptionBroker::~SubscriptionBroker() {
        repository_.register_change_sink(nullptr);
    }

    std::unordered_set<SubscriberPtr>& SubscriptionBroker::subscribers_of(ChannelRecord& record, Channel channel) {
        switch (channel) {
            case Channel::Trade: return record.trade;
            case Channel::OrderBook: return record.order_book;
            case Channel::ClientType: return record.client_type;
            case Channel::Thresholds: return record.thresholds;
        }
        return record.trade;
    }

    void SubscriptionBroker::apply_locked(ChannelRecord& record, const Command& command, const SubscriberPtr& subscriber) {
        switch (command.channel) {
            case SubscriptionChannel::All:
                toggle(record.trade, command.action, subscriber);
                toggle(record.order_book, command.action, subscriber);
                toggle(record.client_type, command.action, subscriber);
                toggle(record.thresholds, command.action, subscriber);
                break;
            case SubscriptionChannel::Trade:
                toggle(record.trade, command.action, subscriber);
                break;
            case SubscriptionChannel::OrderBook:
                toggle(record.order_book, command.action, subscriber);
                break;
            case SubscriptionChannel::ClientType:
                toggle(record.client_type, command.action, subscriber);
                break;
        }
    }

    std::optional<std::string> SubscriptionBroker::handle_message(const SubscriberPtr& subscriber, std::string_view message) {
        LOG_INFO("Received message [%.*s] from [%s]",
                 static_cast<int>(std::min<size_t>(message.size(), 128)), message.data(), subscriber->name().c_str());

        auto command = parse_command(message);
        if (!command) {
            return std::nullopt;
        }

        // A repeated ISIN would otherwise show up twice in the response
        std::vector<std::string> isins;
        isins.reserve(command->isins.size());
        for (auto& isin : command->isins) {
            if (std::find(isins.begin(), isins.end(), isin) == isins.end()) {
                isins.push_back(std::move(isin));
            }
        }
        command->isins = std::move(isins);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& isin : command->isins) {
                auto it = channels_.find(isin);
                if (it == channels_.end()) {
                    if (command->action == Action::Unsubscribe) continue;
                    it = channels_.emplace(isin, ChannelRecord{}).first;
                    LOG_INFO("New channel for [%s]", isin.c_str());
                }
                apply_locked(it->second, *command, subscriber);
            }
        }

        switch (command->action) {
            case Action::Unsubscribe:
                return std::nullopt;
            case Action::Subscribe: {
                // Interest is recorded before the snapshot is taken, so no change can fall in between
                auto instruments = repository_.snapshot(command->isins);
                bool any = std::any_of(instruments.begin(), instruments.end(),
                                       [](const std::optional<Instrument>& i) { return i.has_value(); });
                if (!any) {
                    return std::nullopt;
                }
                return serializer::snapshot_response(instruments, command->channel);
            }
        }
        return std::nullopt;
    }

    void SubscriptionBroker::remove_subscriber(const SubscriberPtr& subscriber) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [isin, record] : channels_) {
            record.trade.erase(subscriber);
            record.order_book.erase(subscriber);
            record.client_type.erase(subscriber);
            record.thresholds.erase(subscriber);
        }
    }

    void SubscriptionBroker::on_change(const ChangeNotification& notification) {
        std::vector<SubscriberPtr> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = channels_.find(notification.isin);
            if (it == channels_.end()) {
                return;
            }
            const auto& set = subscribers_of(it->second, notification.channel);
            targets.assign(set.begin(), set.end());
        }
        if (targets.empty()) {
            return;
        }

        auto payload = std::make_shared<const std::string>(serializer::change_update(notification));
        for (const auto& subscriber : targets) {
            try {
                if (!subscriber->deliver(payload)) {
                    LOG_WARN("Push of [%s] %s refused by [%s]",
                             notification.isin.c_str(), channel_name(notification.channel), subscriber->name().c_str());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Push of [%s] %s to [%s] failed: %s",
                          notification.isin.c_str(), channel_name(notification.channel), subscriber->name().c_str(), e.what());
            }
        }
    }

    size_t SubscriptionBroker::subscriber_count(const std::string& isin, Channel channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(isin);
        if (it == channels_.end()) {
            return 0;
        }
        const ChannelRecord& record = it->second;
        switch (channel) {
            case Channel::Trade: return record.trade.size();
            case Channel::OrderBook: return record.order_book.size();
            case Channel::ClientType: return record.client_type.size();
            case Channel::Thresholds: return record.thresholds.size();
        }
        return 0;
    }

    size_t SubscriptionBroker::channel_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return channels_.size();
    }

}
