#pragma once

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsepush::constants {
    constexpr size_t ISIN_LENGTH = 12;
    constexpr size_t ORDER_BOOK_DEPTH = 5;

    constexpr const char* DEFAULT_UPSTREAM_HOST = "127.0.0.1";
    constexpr uint16_t DEFAULT_UPSTREAM_PORT = 8765;
    constexpr const char* DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
    constexpr uint16_t DEFAULT_LISTEN_PORT = 8766;
    constexpr int DEFAULT_IO_THREADS = 2;

    // Upstream connect timeout
    constexpr int UPSTREAM_CONNECT_TIMEOUT_SECS = 10;
    constexpr int UPSTREAM_PING_INTERVAL_SECS = 15;

    // Downstream session limits
    constexpr int DEFAULT_SEND_TIMEOUT_MS = 5000;
    constexpr size_t DEFAULT_MAX_PENDING_BYTES = size_t{64} << 20;

    constexpr int DEFAULT_RECONNECT_MIN_MS = 500;
    constexpr int DEFAULT_RECONNECT_MAX_MS = 30000;
}

namespace tsepush::utils {

    // Function: wall_clock_us
    // Description: Microseconds since the Unix epoch.
    inline int64_t wall_clock_us() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    inline void format_log_timestamp(int64_t timestamp_us, char* out, size_t len) {
        std::time_t secs = static_cast<std::time_t>(timestamp_us / 1000000);
        std::tm tm_local{};
        localtime_r(&secs, &tm_local);
        size_t n = std::strftime(out, len, "%Y-%m-%d %H:%M:%S", &tm_local);
        if (n > 0 && n < len) {
            snprintf(out + n, len - n, ".%06lld", static_cast<long long>(timestamp_us % 1000000));
        }
    }

    // Function: local_today
    // Description: Today's local calendar date as (year, month, day).
    inline void local_today(int& year, int& month, int& day) {
        std::time_t now = std::time(nullptr);
        std::tm tm_local{};
        localtime_r(&now, &tm_local);
        year = tm_local.tm_year + 1900;
        month = tm_local.tm_mon + 1;
        day = tm_local.tm_mday;
    }

    // Function: local_minutes_of_day
    // Description: Minutes elapsed since local midnight.
    inline int local_minutes_of_day() {
        std::time_t now = std::time(nullptr);
        std::tm tm_local{};
        localtime_r(&now, &tm_local);
        return tm_local.tm_hour * 60 + tm_local.tm_min;
    }

    // Function: split
    // Description: Splits on a single character delimiter, keeping empty fields.
    inline std::vector<std::string_view> split(std::string_view text, char delim) {
        std::vector<std::string_view> parts;
        size_t start = 0;
        while (true) {
            size_t end = text.find(delim, start);
            if (end == std::string_view::npos) {
                parts.push_back(text.substr(start));
                break;
            }
            parts.push_back(text.substr(start, end - start));
            start = end + 1;
        }
        return parts;
    }

    inline std::string_view trim(std::string_view text) {
        while (!text.empty() && (text.front() == ' ' || text.front() == '\t' || text.front() == '\r')) {
            text.remove_prefix(1);
        }
        while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
            text.remove_suffix(1);
        }
        return text;
    }

    // Function: parse_int
    // Description: Parses a whole string as a signed integer.
    inline std::optional<int64_t> parse_int(std::string_view text) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    // Function: parse_hh_mm
    // Description: Parses "HH:MM" into minutes of day.
    inline std::optional<int> parse_hh_mm(std::string_view text) {
        auto parts = split(text, ':');
        if (parts.size() != 2) return std::nullopt;
        auto hh = parse_int(parts[0]);
        auto mm = parse_int(parts[1]);
        if (!hh || !mm || *hh < 0 || *hh > 23 || *mm < 0 || *mm > 59) return std::nullopt;
        return static_cast<int>(*hh * 60 + *mm);
    }

}
