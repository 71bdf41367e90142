#include "broker/Command.hpp"
#include "TestAssert.hpp"

using namespace tsepush;

namespace {

    bool test_valid_subscribe() {
        auto command = parse_command("1.trade.IRO1FOLD0001,IRO1IKCO0001");
        CHECK(command.has_value());
        CHECK(command->action == Action::Subscribe);
        CHECK(command->channel == SubscriptionChannel::Trade);
        CHECK_EQ(command->isins.size(), size_t{2});
        CHECK_STR_EQ(command->isins[0], "IRO1FOLD0001");
        CHECK_STR_EQ(command->isins[1], "IRO1IKCO0001");
        return true;
    }

    bool test_every_channel() {
        CHECK(parse_command("1.all.IRO1FOLD0001")->channel == SubscriptionChannel::All);
        CHECK(parse_command("1.orderbook.IRO1FOLD0001")->channel == SubscriptionChannel::OrderBook);
        CHECK(parse_command("1.clienttype.IRO1FOLD0001")->channel == SubscriptionChannel::ClientType);
        CHECK(parse_command("0.trade.IRO1FOLD0001")->action == Action::Unsubscribe);
        return true;
    }

    bool test_wrong_field_count() {
        CHECK_FALSE(parse_command("").has_value());
        CHECK_FALSE(parse_command("1.trade").has_value());
        CHECK_FALSE(parse_command("1.trade.IRO1FOLD0001.extra").has_value());
        return true;
    }

    bool test_bad_action_and_channel() {
        CHECK_FALSE(parse_command("2.trade.IRO1FOLD0001").has_value());
        CHECK_FALSE(parse_command("subscribe.trade.IRO1FOLD0001").has_value());
        CHECK_FALSE(parse_command("1.thresholds.IRO1FOLD0001").has_value());
        CHECK_FALSE(parse_command("1.Trade.IRO1FOLD0001").has_value());
        CHECK_FALSE(parse_command("1.bogus.IRO1FOLD0001").has_value());
        return true;
    }

    bool test_bad_isin_rejects_whole_command() {
        CHECK_FALSE(parse_command("1.trade.IRO1FOLD0001,SHORT").has_value());
        CHECK_FALSE(parse_command("1.trade.IRO1FOLD00011").has_value());
        CHECK_FALSE(parse_command("1.trade.IRO1FOLD001").has_value());
        CHECK_FALSE(parse_command("1.trade.").has_value());
        CHECK_FALSE(parse_command("1.trade.IRO1FOLD0001,").has_value());
        return true;
    }

    bool test_long_garbage_is_handled() {
        std::string garbage(10000, 'x');
        CHECK_FALSE(parse_command(garbage).has_value());
        return true;
    }

}

int main() {
    return tsepush::testing::run_all("Command Parser Unit Test", {
        {"valid subscribe", test_valid_subscribe},
        {"every channel", test_every_channel},
        {"wrong field count", test_wrong_field_count},
        {"bad action and channel", test_bad_action_and_channel},
        {"bad isin", test_bad_isin_rejects_whole_command},
        {"long garbage", test_long_garbage_is_handled},
    });
}
