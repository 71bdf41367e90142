#include "common/Backoff.hpp"
#include "common/Config.hpp"
#include "common/DateTime.hpp"
#include "TestAssert.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace tsepush;

namespace {

    bool test_defaults() {
        Config config;
        CHECK_EQ(config.upstream_port, constants::DEFAULT_UPSTREAM_PORT);
        CHECK_EQ(config.listen_port, constants::DEFAULT_LISTEN_PORT);
        CHECK_EQ(config.max_pending_bytes, constants::DEFAULT_MAX_PENDING_BYTES);
        CHECK(!config.session_end_minute.has_value());
        return true;
    }

    bool test_apply_values() {
        Config config;
        CHECK(apply_config_value(config, "upstream_host", "feed.example"));
        CHECK(apply_config_value(config, "listen_port", "0"));
        CHECK(apply_config_value(config, "io_threads", "4"));
        CHECK(apply_config_value(config, "log_level", "debug"));
        CHECK(apply_config_value(config, "session_end", "12:35"));
        CHECK_STR_EQ(config.upstream_host, "feed.example");
        CHECK_EQ(config.listen_port, uint16_t{0});
        CHECK_EQ(config.io_threads, 4);
        CHECK(config.log_level == LogLevel::DEBUG);
        CHECK_EQ(*config.session_end_minute, 12 * 60 + 35);

        CHECK_FALSE(apply_config_value(config, "upstream_port", "0"));
        CHECK_FALSE(apply_config_value(config, "upstream_port", "70000"));
        CHECK_FALSE(apply_config_value(config, "io_threads", "many"));
        CHECK_FALSE(apply_config_value(config, "session_end", "25:00"));
        CHECK_FALSE(apply_config_value(config, "log_level", "loud"));
        CHECK_FALSE(apply_config_value(config, "no_such_key", "1"));
        CHECK_EQ(config.upstream_port, constants::DEFAULT_UPSTREAM_PORT);
        return true;
    }

    bool test_load_config_file() {
        const char* path = "test_config_tmp.conf";
        {
            std::ofstream out(path);
            out << "# relay settings\n"
                << "upstream_host = 10.0.0.5\n"
                << "upstream_port=9000\n"
                << "\n"
                << "garbage line\n"
                << "max_pending_bytes = 65536\n"
                << "reconnect_min_ms = 2000\n"
                << "reconnect_max_ms = 1000\n";
        }
        Config config = load_config(path);
        std::remove(path);

        CHECK_STR_EQ(config.upstream_host, "10.0.0.5");
        CHECK_EQ(config.upstream_port, uint16_t{9000});
        CHECK_EQ(config.max_pending_bytes, size_t{65536});
        CHECK_EQ(config.reconnect_max_ms, 2000);
        return true;
    }

    bool test_instrument_list() {
        std::vector<std::string> errors;
        auto list = parse_instrument_list(
            "# isin,tsetmc_code,ticker\n"
            "IRO1FOLD0001,46348559193224090,FOLD\n"
            "  IRO1IKCO0001  \r\n"
            "SHORT,1\n"
            "IRO1KHOD0001,abc\n"
            "\n", &errors);
        CHECK_EQ(list.size(), size_t{2});
        CHECK_STR_EQ(list[0].isin, "IRO1FOLD0001");
        CHECK_EQ(list[0].tsetmc_code, int64_t{46348559193224090LL});
        CHECK_STR_EQ(list[0].ticker, "FOLD");
        CHECK_STR_EQ(list[1].isin, "IRO1IKCO0001");
        CHECK_EQ(list[1].tsetmc_code, int64_t{0});
        CHECK_EQ(errors.size(), size_t{2});
        return true;
    }

    bool test_missing_instrument_file_throws() {
        bool thrown = false;
        try {
            load_instrument_list("/nonexistent/instruments.txt");
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        CHECK(thrown);
        return true;
    }

    bool test_trade_time_parsing() {
        auto t = parse_trade_time("2024-05-17T09:05:07");
        CHECK(t.has_value());
        CHECK_EQ(t->year, 2024);
        CHECK_EQ(t->second, 7);
        CHECK_EQ(t->microsecond, 0);

        t = parse_trade_time("2024/05/17 09:05:07.123456789+03:30");
        CHECK(t.has_value());
        CHECK_EQ(t->microsecond, 123456);
        CHECK_STR_EQ(format_trade_time(*t), "2024-05-17T09:05:07.123456");

        CHECK(parse_trade_time("2024-05-17T09:05:07Z").has_value());
        CHECK_FALSE(parse_trade_time("2024-05/17T09:05:07").has_value());
        CHECK_FALSE(parse_trade_time("2024-13-17T09:05:07").has_value());
        CHECK_FALSE(parse_trade_time("2024-05-17T24:00:00").has_value());
        CHECK_FALSE(parse_trade_time("2024-05-17T09:05:07.").has_value());
        CHECK_FALSE(parse_trade_time("2024-05-17").has_value());
        CHECK_FALSE(parse_trade_time("").has_value());
        return true;
    }

    bool test_reconnect_backoff() {
        ReconnectBackoff backoff(500, 3000);
        CHECK_EQ(backoff.next().count(), 500);
        CHECK_EQ(backoff.next().count(), 1000);
        CHECK_EQ(backoff.next().count(), 2000);
        CHECK_EQ(backoff.next().count(), 3000);
        CHECK_EQ(backoff.next().count(), 3000);
        backoff.reset();
        CHECK_EQ(backoff.next().count(), 500);
        return true;
    }

}

int main() {
    return tsepush::testing::run_all("Config Unit Test", {
        {"defaults", test_defaults},
        {"apply values", test_apply_values},
        {"load config file", test_load_config_file},
        {"instrument list", test_instrument_list},
        {"missing instrument file", test_missing_instrument_file_throws},
        {"trade time parsing", test_trade_time_parsing},
        {"reconnect backoff", test_reconnect_backoff},
    });
}
