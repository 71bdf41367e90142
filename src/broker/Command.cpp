#include "broker/Command.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"

namespace tsepush {

    namespace {

        std::optional<Action> parse_action(std::string_view text) {
            if (text == "0") return Action::Unsubscribe;
            if (text == "1") return Action::Subscribe;
            return std::nullopt;
        }

        std::optional<SubscriptionChannel> parse_channel(std::string_view text) {
            if (text == "all") return SubscriptionChannel::All;
            if (text == "trade") return SubscriptionChannel::Trade;
            if (text == "orderbook") return SubscriptionChannel::OrderBook;
            if (text == "clienttype") return SubscriptionChannel::ClientType;
            return std::nullopt;
        }

        // Keeps log lines bounded when a client sends garbage
        std::string preview(std::string_view text) {
            constexpr size_t MAX_PREVIEW = 96;
            if (text.size() <= MAX_PREVIEW) return std::string(text);
            return std::string(text.substr(0, MAX_PREVIEW)) + "...";
        }

    }

    const char* subscription_channel_name(SubscriptionChannel channel) {
        switch (channel) {
            case SubscriptionChannel::All: return "all";
            case SubscriptionChannel::Trade: return "trade";
            case SubscriptionChannel::OrderBook: return "orderbook";
            case SubscriptionChannel::ClientType: return "clienttype";
        }
        return "unknown";
    }

    std::optional<Command> parse_command(std::string_view message) {
        auto parts = utils::split(message, '.');
        if (parts.size() != 3) {
            LOG_ERROR("Message [%s] has unacceptable format.", preview(message).c_str());
            return std::nullopt;
        }

        auto action = parse_action(parts[0]);
        if (!action) {
            LOG_ERROR("Action [%s] is not acceptable.", preview(parts[0]).c_str());
            return std::nullopt;
        }

        auto channel = parse_channel(parts[1]);
        if (!channel) {
            LOG_ERROR("Channel [%s] is not acceptable.", preview(parts[1]).c_str());
            return std::nullopt;
        }

        Command command{*action, *channel, {}};
        for (std::string_view isin : utils::split(parts[2], ',')) {
            if (isin.size() != constants::ISIN_LENGTH) {
                LOG_ERROR("Isin [%s] is not acceptable.", preview(isin).c_str());
                return std::nullopt;
            }
            command.isins.emplace_back(isin);
        }
        return command;
    }

}
