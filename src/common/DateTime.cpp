#include "common/DateTime.hpp"
#include <charconv>
#include <cstdio>

namespace tsepush {

    namespace {

        // Reads exactly `width` digits at `pos`.
        bool read_fixed(std::string_view text, size_t& pos, size_t width, int& out) {
            if (pos + width > text.size()) return false;
            for (size_t i = 0; i < width; ++i) {
                char c = text[pos + i];
                if (c < '0' || c > '9') return false;
            }
            auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + width, out);
            if (ec != std::errc()) return false;
            pos += width;
            return true;
        }

        bool expect(std::string_view text, size_t& pos, char a, char b = '\0') {
            if (pos >= text.size()) return false;
            char c = text[pos];
            if (c != a && (b == '\0' || c != b)) return false;
            ++pos;
            return true;
        }

        bool valid_offset(std::string_view rest) {
            if (rest.empty() || rest == "Z") return true;
            if (rest.size() != 6 || (rest[0] != '+' && rest[0] != '-') || rest[3] != ':') return false;
            size_t pos = 1;
            int hh = 0, mm = 0;
            if (!read_fixed(rest, pos, 2, hh)) return false;
            ++pos;
            return read_fixed(rest, pos, 2, mm);
        }

    }

    std::optional<TradeTime> parse_trade_time(std::string_view text) {
        TradeTime t;
        size_t pos = 0;

        if (!read_fixed(text, pos, 4, t.year)) return std::nullopt;
        if (pos >= text.size()) return std::nullopt;
        char date_sep = text[pos];
        if (date_sep != '-' && date_sep != '/') return std::nullopt;
        ++pos;
        if (!read_fixed(text, pos, 2, t.month)) return std::nullopt;
        if (!expect(text, pos, date_sep)) return std::nullopt;
        if (!read_fixed(text, pos, 2, t.day)) return std::nullopt;
        if (!expect(text, pos, 'T', ' ')) return std::nullopt;
        if (!read_fixed(text, pos, 2, t.hour)) return std::nullopt;
        if (!expect(text, pos, ':')) return std::nullopt;
        if (!read_fixed(text, pos, 2, t.minute)) return std::nullopt;
        if (!expect(text, pos, ':')) return std::nullopt;
        if (!read_fixed(text, pos, 2, t.second)) return std::nullopt;

        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            size_t digits = 0;
            int micro = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                if (digits < 6) {
                    micro = micro * 10 + (text[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (size_t i = digits; i < 6; ++i) micro *= 10;
            t.microsecond = micro;
        }

        if (!valid_offset(text.substr(pos))) return std::nullopt;

        if (t.month < 1 || t.month > 12 || t.day < 1 || t.day > 31 ||
            t.hour > 23 || t.minute > 59 || t.second > 59) {
            return std::nullopt;
        }
        return t;
    }

    std::string format_trade_time(const TradeTime& time) {
        char buf[40];
        int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d",
                         time.year, time.month, time.day, time.hour, time.minute, time.second);
        if (time.microsecond != 0 && n > 0 && static_cast<size_t>(n) < sizeof(buf)) {
            snprintf(buf + n, sizeof(buf) - n, ".%06d", time.microsecond);
        }
        return std::string(buf);
    }

}
