#include "common/Config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tsepush {

    namespace {

        template<typename T>
        bool assign_number(T& target, std::string_view value, int64_t min, int64_t max) {
            auto parsed = utils::parse_int(value);
            if (!parsed || *parsed < min || *parsed > max) return false;
            target = static_cast<T>(*parsed);
            return true;
        }

        struct EnvKey {
            const char* env;
            const char* key;
        };

        constexpr EnvKey ENV_KEYS[] = {
            {"TSEPUSH_UPSTREAM_HOST", "upstream_host"},
            {"TSEPUSH_UPSTREAM_PORT", "upstream_port"},
            {"TSEPUSH_LISTEN_ADDRESS", "listen_address"},
            {"TSEPUSH_LISTEN_PORT", "listen_port"},
            {"TSEPUSH_IO_THREADS", "io_threads"},
            {"TSEPUSH_INSTRUMENTS_FILE", "instruments_file"},
            {"TSEPUSH_CAPTURE_FILE", "capture_file"},
            {"TSEPUSH_LOG_FILE", "log_file"},
            {"TSEPUSH_LOG_LEVEL", "log_level"},
            {"TSEPUSH_SEND_TIMEOUT_MS", "send_timeout_ms"},
            {"TSEPUSH_MAX_PENDING_BYTES", "max_pending_bytes"},
            {"TSEPUSH_SESSION_END", "session_end"},
            {"TSEPUSH_RECONNECT_MIN_MS", "reconnect_min_ms"},
            {"TSEPUSH_RECONNECT_MAX_MS", "reconnect_max_ms"},
        };

    }

    std::optional<LogLevel> parse_log_level(std::string_view text) {
        if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
        if (text == "info" || text == "INFO") return LogLevel::INFO;
        if (text == "warn" || text == "WARN" || text == "warning") return LogLevel::WARNING;
        if (text == "error" || text == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    bool apply_config_value(Config& config, std::string_view key, std::string_view value) {
        if (key == "upstream_host") { config.upstream_host = std::string(value); return !value.empty(); }
        if (key == "upstream_port") return assign_number(config.upstream_port, value, 1, 65535);
        if (key == "listen_address") { config.listen_address = std::string(value); return !value.empty(); }
        if (key == "listen_port") return assign_number(config.listen_port, value, 0, 65535);
        if (key == "io_threads") return assign_number(config.io_threads, value, 1, 64);
        if (key == "instruments_file") { config.instruments_file = std::string(value); return true; }
        if (key == "capture_file") { config.capture_file = std::string(value); return true; }
        if (key == "log_file") { config.log_file = std::string(value); return true; }
        if (key == "log_level") {
            auto level = parse_log_level(value);
            if (!level) return false;
            config.log_level = *level;
            return true;
        }
        if (key == "send_timeout_ms") return assign_number(config.send_timeout_ms, value, 1, 600000);
        if (key == "max_pending_bytes") return assign_number(config.max_pending_bytes, value, 4096, int64_t{1} << 32);
        if (key == "session_end") {
            if (value.empty()) {
                config.session_end_minute.reset();
                return true;
            }
            auto minute = utils::parse_hh_mm(value);
            if (!minute) return false;
            config.session_end_minute = *minute;
            return true;
        }
        if (key == "reconnect_min_ms") return assign_number(config.reconnect_min_ms, value, 1, 3600000);
        if (key == "reconnect_max_ms") return assign_number(config.reconnect_max_ms, value, 1, 3600000);
        return false;
    }

    Config load_config(const std::string& path) {
        Config config;

        if (!path.empty()) {
            std::ifstream f(path);
            if (!f) {
                std::cerr << "[Config] Cannot open " << path << ", using defaults" << std::endl;
            }
            std::string line;
            int line_no = 0;
            while (std::getline(f, line)) {
                ++line_no;
                std::string_view view = utils::trim(line);
                if (view.empty() || view[0] == '#') continue;
                size_t eq = view.find('=');
                if (eq == std::string_view::npos) {
                    std::cerr << "[Config] " << path << ":" << line_no << ": missing '='" << std::endl;
                    continue;
                }
                std::string_view key = utils::trim(view.substr(0, eq));
                std::string_view value = utils::trim(view.substr(eq + 1));
                if (!apply_config_value(config, key, value)) {
                    std::cerr << "[Config] " << path << ":" << line_no << ": bad entry '" << key << "'" << std::endl;
                }
            }
        }

        // Environment wins over the file
        for (const auto& entry : ENV_KEYS) {
            const char* value = std::getenv(entry.env);
            if (value == nullptr) continue;
            if (!apply_config_value(config, entry.key, value)) {
                std::cerr << "[Config] Ignoring " << entry.env << "=" << value << std::endl;
            }
        }

        if (config.reconnect_max_ms < config.reconnect_min_ms) {
            config.reconnect_max_ms = config.reconnect_min_ms;
        }
        return config;
    }

    std::vector<Identification> parse_instrument_list(std::string_view text, std::vector<std::string>* errors) {
        std::vector<Identification> out;
        int line_no = 0;
        for (std::string_view raw : utils::split(text, '\n')) {
            ++line_no;
            std::string_view line = utils::trim(raw);
            if (line.empty() || line[0] == '#') continue;

            auto fields = utils::split(line, ',');
            Identification id;
            id.isin = std::string(utils::trim(fields[0]));
            if (id.isin.size() != constants::ISIN_LENGTH) {
                if (errors) errors->push_back("line " + std::to_string(line_no) + ": bad isin '" + id.isin + "'");
                continue;
            }
            if (fields.size() > 1 && !utils::trim(fields[1]).empty()) {
                auto code = utils::parse_int(utils::trim(fields[1]));
                if (!code) {
                    if (errors) errors->push_back("line " + std::to_string(line_no) + ": bad tsetmc code");
                    continue;
                }
                id.tsetmc_code = *code;
            }
            if (fields.size() > 2) {
                id.ticker = std::string(utils::trim(fields[2]));
            }
            out.push_back(std::move(id));
        }
        return out;
    }

    std::vector<Identification> load_instrument_list(const std::string& path) {
        std::ifstream f(path);
        if (!f) {
            throw std::runtime_error("cannot open instrument list " + path);
        }
        std::stringstream buffer;
        buffer << f.rdbuf();

        std::vector<std::string> errors;
        auto instruments = parse_instrument_list(buffer.str(), &errors);
        for (const auto& error : errors) {
            LOG_WARN("Instrument list %s: %s", path.c_str(), error.c_str());
        }
        return instruments;
    }

}
