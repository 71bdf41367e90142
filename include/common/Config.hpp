#pragma once

#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "common/Utils.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsepush {

    // Function: Config
    // Description: Process configuration. Defaults come from constants, then an
    //              optional key=value file, then TSEPUSH_* environment variables.
    struct Config {
        std::string upstream_host = constants::DEFAULT_UPSTREAM_HOST;
        uint16_t upstream_port = constants::DEFAULT_UPSTREAM_PORT;
        std::string listen_address = constants::DEFAULT_LISTEN_ADDRESS;
        uint16_t listen_port = constants::DEFAULT_LISTEN_PORT;
        int io_threads = constants::DEFAULT_IO_THREADS;

        std::string instruments_file = "instruments.txt";
        std::string capture_file;           // empty disables capture
        std::string log_file = "tse_pusher.log";
        LogLevel log_level = LogLevel::INFO;

        int send_timeout_ms = constants::DEFAULT_SEND_TIMEOUT_MS;
        size_t max_pending_bytes = constants::DEFAULT_MAX_PENDING_BYTES; // queued bytes per session

        std::optional<int> session_end_minute; // minutes of day, unset runs until signalled

        int reconnect_min_ms = constants::DEFAULT_RECONNECT_MIN_MS;
        int reconnect_max_ms = constants::DEFAULT_RECONNECT_MAX_MS;
    };

    // Function: apply_config_value
    // Description: Applies one key/value pair to the config.
    // Outputs: false if the key is unknown or the value does not parse.
    bool apply_config_value(Config& config, std::string_view key, std::string_view value);

    // Function: load_config
    // Description: Builds the config from defaults, the optional file and the environment.
    //              Unreadable files and bad values are reported on stderr and skipped.
    // Inputs: path - key=value file, may be empty.
    Config load_config(const std::string& path);

    // Function: parse_instrument_list
    // Description: Parses the instrument universe, one "isin[,tsetmc_code[,ticker]]"
    //              per line. Blank lines and '#' comments are skipped, malformed lines
    //              are reported in `errors`.
    std::vector<Identification> parse_instrument_list(std::string_view text, std::vector<std::string>* errors = nullptr);

    // Function: load_instrument_list
    // Description: Reads and parses the instrument universe file.
    // Outputs: Throws std::runtime_error if the file cannot be opened.
    std::vector<Identification> load_instrument_list(const std::string& path);

    std::optional<LogLevel> parse_log_level(std::string_view text);

}
