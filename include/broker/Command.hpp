#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsepush {

    enum class Action : uint8_t {
        Unsubscribe,
        Subscribe
    };

    // Channel names a downstream client may ask for. `All` fans into every data channel.
    enum class SubscriptionChannel : uint8_t {
        All,
        Trade,
        OrderBook,
        ClientType
    };

    // Function: Command
    // Description: A validated "<action>.<channel>.<isin1>,<isin2>,..." request.
    struct Command {
        Action action;
        SubscriptionChannel channel;
        std::vector<std::string> isins;
    };

    // Function: parse_command
    // Description: Validates and parses one downstream text frame.
    //              Requires exactly three dot separated fields, action "0" or "1",
    //              a known channel and only 12 character ISINs.
    //              Every rejection is logged.
    // Outputs: The command, or std::nullopt when the frame must be ignored.
    std::optional<Command> parse_command(std::string_view message);

    const char* subscription_channel_name(SubscriptionChannel channel);

}
