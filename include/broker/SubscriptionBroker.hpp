#pragma once

#include "broker/Command.hpp"
#include "repository/MarketRepository.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tsepush {

    // Function: Subscriber
    // Description: One downstream connection as seen by the broker.
    class Subscriber {
    public:
        virtual ~Subscriber() = default;

        // Function: deliver
        // Description: Queues one text frame for sending. Must not block on the network.
        // Outputs: false if the frame was refused (closed or overloaded connection).
        virtual bool deliver(std::shared_ptr<const std::string> payload) = 0;

        virtual const std::string& name() const = 0;
    };

    using SubscriberPtr = std::shared_ptr<Subscriber>;

    // Per instrument subscriber sets, one per data channel.
    struct ChannelRecord {
        std::unordered_set<SubscriberPtr> trade;
        std::unordered_set<SubscriberPtr> order_book;
        std::unordered_set<SubscriberPtr> client_type;
        std::unordered_set<SubscriberPtr> thresholds;
    };

    // Function: SubscriptionBroker
    // Description: Tracks which subscriber wants which channel of which instrument,
    //              answers subscribe commands with a snapshot from the repository and
    //              fans repository changes out to the matching subscribers.
    //              Its lock is never held while calling into the repository or a subscriber.
    class SubscriptionBroker : public ChangeSink {
    public:
        // Registers itself as the repository's change sink.
        explicit SubscriptionBroker(MarketRepository& repository);
        ~SubscriptionBroker() override;

        SubscriptionBroker(const SubscriptionBroker&) = delete;
        SubscriptionBroker& operator=(const SubscriptionBroker&) = delete;

        // Function: handle_message
        // Description: Applies one downstream command for `subscriber`.
        // Outputs: The initial snapshot to send back, or std::nullopt when nothing is sent
        //          (unsubscribe, malformed command, no known instrument).
        std::optional<std::string> handle_message(const SubscriberPtr& subscriber, std::string_view message);

        // Function: remove_subscriber
        // Description: Drops the subscriber from every set of every channel record.
        void remove_subscriber(const SubscriberPtr& subscriber);

        // Function: on_change
        // Description: Serializes the change once and delivers it to every subscriber
        //              of that instrument and channel. A failed delivery only affects that subscriber.
        void on_change(const ChangeNotification& notification) override;

        size_t subscriber_count(const std::string& isin, Channel channel) const;
        size_t channel_count() const;

    private:
        static std::unordered_set<SubscriberPtr>& subscribers_of(ChannelRecord& record, Channel channel);
        static void apply_locked(ChannelRecord& record, const Command& command, const SubscriberPtr& subscriber);

        MarketRepository& repository_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, ChannelRecord> channels_;
    };

}
