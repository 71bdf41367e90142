#include "feed_handler/FeedClient.hpp"
#include "common/DateTime.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include <ixwebsocket/IXNetSystem.h>
#include <charconv>
#include <chrono>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace tsepush {

    namespace {
        constexpr size_t THRESHOLDS_FIELDS = 2;
        constexpr size_t TRADE_FIELDS = 10;
    }

    FeedClient::FeedClient(MarketRepository& repository, std::vector<std::string> isins, const std::string& capture_path)
        : repository_(repository), isins_(std::move(isins)), subscribed_(isins_.begin(), isins_.end()) {
        // Initialize network system (required for Windows, harmless on Linux)
        ix::initNetSystem();
        if (!capture_path.empty()) {
            capture_file_.open(capture_path, std::ios::binary | std::ios::app);
            capture_enabled_ = capture_file_.is_open();
            if (!capture_enabled_) {
                LOG_ERROR("Feed: cannot open capture file %s", capture_path.c_str());
            }
        }
    }

    FeedClient::~FeedClient() {
        stop();
        if (capture_file_.is_open()) capture_file_.close();
        ix::uninitNetSystem();
    }

    void FeedClient::connect(const std::string& host, uint16_t port) {
        url_ = "ws://" + host + ":" + std::to_string(port);
        webSocket_.setUrl(url_);
        webSocket_.setPingInterval(constants::UPSTREAM_PING_INTERVAL_SECS);
        // Reconnection is decided by the supervisor, not by the socket
        webSocket_.disableAutomaticReconnection();

        webSocket_.setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
            if (msg->type == ix::WebSocketMessageType::Message) {
                frames_received_.fetch_add(1, std::memory_order_relaxed);
                LOG_DEBUG("Feed received %zu bytes", msg->str.size());
                if (this->capture_enabled_) {
                    this->capture(msg->str);
                }
                this->process_message(msg->str);
            } else if (msg->type == ix::WebSocketMessageType::Open) {
                LOG_INFO("Feed: connected to %s", this->url_.c_str());
            } else if (msg->type == ix::WebSocketMessageType::Close) {
                LOG_INFO("Feed: disconnected. Code: %d Reason: %s",
                         static_cast<int>(msg->closeInfo.code), msg->closeInfo.reason.c_str());
            } else if (msg->type == ix::WebSocketMessageType::Error) {
                LOG_ERROR("Feed: error: %s", msg->errorInfo.reason.c_str());
            }
        });

        ix::WebSocketInitResult result = webSocket_.connect(constants::UPSTREAM_CONNECT_TIMEOUT_SECS);
        if (!result.success) {
            throw std::runtime_error("cannot connect to " + url_ + ": " + result.errorStr);
        }
    }

    std::string FeedClient::subscribe_request() const {
        std::string request = "1.all.";
        for (size_t i = 0; i < isins_.size(); ++i) {
            if (i > 0) request.push_back(',');
            request += isins_[i];
        }
        return request;
    }

    void FeedClient::subscribe() {
        if (isins_.empty()) {
            LOG_WARN("Feed: empty instrument universe, nothing to subscribe");
            return;
        }
        LOG_INFO("Feed: subscribing to data for %zu instruments.", isins_.size());
        ix::WebSocketSendInfo info = webSocket_.sendText(subscribe_request());
        if (!info.success) {
            LOG_ERROR("Feed: subscribe request could not be sent");
        }
    }

    void FeedClient::run() {
        webSocket_.run();
        LOG_INFO("Feed: receive loop ended after %llu frames",
                 static_cast<unsigned long long>(frames_received()));
    }

    void FeedClient::stop() {
        if (webSocket_.getReadyState() == ix::ReadyState::Open) {
            webSocket_.close();
        }
    }

    void FeedClient::capture(std::string_view message) {
        uint64_t ts = static_cast<uint64_t>(utils::wall_clock_us()) * 1000;
        uint32_t len = static_cast<uint32_t>(message.size());
        capture_file_.write(reinterpret_cast<const char*>(&ts), sizeof(ts));
        capture_file_.write(reinterpret_cast<const char*>(&len), sizeof(len));
        capture_file_.write(message.data(), len);
    }

    size_t FeedClient::process_message(std::string_view message) {
        // Optimization: Reuse a thread-local buffer to avoid allocation
        static thread_local std::vector<char> buffer;
        static thread_local simdjson::dom::parser parser;

        if (buffer.size() < message.size() + simdjson::SIMDJSON_PADDING) {
            buffer.resize(message.size() + simdjson::SIMDJSON_PADDING);
        }
        std::memcpy(buffer.data(), message.data(), message.size());
        std::memset(buffer.data() + message.size(), 0, simdjson::SIMDJSON_PADDING);

        simdjson::dom::element doc;
        auto error = parser.parse(buffer.data(), message.size(), false).get(doc);
        if (error) {
            LOG_ERROR("Feed: JSON parse error: %s", simdjson::error_message(error));
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return 0;
        }

        simdjson::dom::object frame;
        if (doc.get(frame) != simdjson::SUCCESS) {
            LOG_ERROR("Feed: frame is not a JSON object");
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return 0;
        }

        size_t applied = 0;
        for (auto entry : frame) {
            std::string isin(entry.key);
            if (subscribed_.find(isin) == subscribed_.end()) {
                LOG_ERROR("Feed: update for unsubscribed isin [%s]", isin.c_str());
                decode_errors_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            simdjson::dom::object channels;
            if (entry.value.get(channels) != simdjson::SUCCESS) {
                LOG_ERROR("Feed: channels of [%s] are not an object", isin.c_str());
                decode_errors_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }

            for (auto channel : channels) {
                if (handle_channel(isin, channel.key, channel.value)) {
                    ++applied;
                }
            }
        }
        return applied;
    }

    bool FeedClient::handle_channel(const std::string& isin, std::string_view channel, simdjson::dom::element data) {
        if (channel == "thresholds") {
            return handle_thresholds(isin, data);
        }
        if (channel == "trade") {
            return handle_trade(isin, data);
        }
        if (channel == "orderbook") {
            // TODO: decode once the upstream order book field order is confirmed from a feed capture
            LOG_WARN("Feed: order book decoding is not implemented, skipping [%s]", isin.c_str());
            return false;
        }
        if (channel == "clienttype") {
            return false;
        }
        LOG_ERROR("Feed: unknown message channel: %.*s", static_cast<int>(channel.size()), channel.data());
        decode_errors_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    bool FeedClient::handle_thresholds(const std::string& isin, simdjson::dom::element data) {
        simdjson::dom::array fields;
        if (data.get(fields) != simdjson::SUCCESS || fields.size() != THRESHOLDS_FIELDS) {
            LOG_ERROR("Feed: malformed thresholds for [%s]", isin.c_str());
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        auto max_price = extract_int(fields.at(0).value_unsafe());
        auto min_price = extract_int(fields.at(1).value_unsafe());
        if (!max_price || !min_price) {
            LOG_ERROR("Feed: non numeric thresholds for [%s]", isin.c_str());
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        PriceThresholds thresholds;
        thresholds.max_price = *max_price;
        thresholds.min_price = *min_price;
        repository_.apply_thresholds(isin, thresholds);
        return true;
    }

    bool FeedClient::handle_trade(const std::string& isin, simdjson::dom::element data) {
        simdjson::dom::array fields;
        if (data.get(fields) != simdjson::SUCCESS || fields.size() != TRADE_FIELDS) {
            LOG_ERROR("Feed: malformed trade for [%s]", isin.c_str());
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        // [close, last, last_trade_time, max, min, open, previous, trade_num, trade_value, trade_volume]
        std::optional<int64_t> values[TRADE_FIELDS];
        std::string_view time_text;
        size_t index = 0;
        for (simdjson::dom::element field : fields) {
            if (index == 2) {
                if (field.get(time_text) != simdjson::SUCCESS) {
                    LOG_ERROR("Feed: trade time of [%s] is not a string", isin.c_str());
                    decode_errors_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
            } else {
                values[index] = extract_int(field);
                if (!values[index]) {
                    LOG_ERROR("Feed: trade field %zu of [%s] is not numeric", index, isin.c_str());
                    decode_errors_.fetch_add(1, std::memory_order_relaxed);
                    return false;
                }
            }
            ++index;
        }

        auto last_trade_time = parse_trade_time(time_text);
        if (!last_trade_time) {
            LOG_ERROR("Feed: bad trade time [%.*s] for [%s]",
                      static_cast<int>(time_text.size()), time_text.data(), isin.c_str());
            decode_errors_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        TradeCandle candle;
        candle.close_price = *values[0];
        candle.last_price = *values[1];
        candle.last_trade_time = *last_trade_time;
        candle.max_price = *values[3];
        candle.min_price = *values[4];
        candle.open_price = *values[5];
        candle.previous_price = *values[6];
        candle.trade_num = *values[7];
        candle.trade_value = *values[8];
        candle.trade_volume = *values[9];
        repository_.apply_trade(isin, candle);
        return true;
    }

    std::optional<int64_t> FeedClient::extract_int(simdjson::dom::element value) {
        switch (value.type()) {
            case simdjson::dom::element_type::INT64:
                return value.get_int64().value_unsafe();
            case simdjson::dom::element_type::UINT64: {
                uint64_t v = value.get_uint64().value_unsafe();
                if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return std::nullopt;
                return static_cast<int64_t>(v);
            }
            case simdjson::dom::element_type::DOUBLE: {
                double d = value.get_double().value_unsafe();
                if (!(d > -9.2e18 && d < 9.2e18)) return std::nullopt;
                return static_cast<int64_t>(d);
            }
            case simdjson::dom::element_type::STRING: {
                std::string_view sv = value.get_string().value_unsafe();
                if (auto parsed = utils::parse_int(sv)) return parsed;
                double d = 0.0;
                auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), d);
                if (ec != std::errc() || ptr != sv.data() + sv.size() || sv.empty()) return std::nullopt;
                if (!(d > -9.2e18 && d < 9.2e18)) return std::nullopt;
                return static_cast<int64_t>(d);
            }
            default:
                return std::nullopt;
        }
    }

}
