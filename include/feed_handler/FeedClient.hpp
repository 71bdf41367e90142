#pragma once

#include "common/Types.hpp"
#include "repository/MarketRepository.hpp"

// Parsing and Networking
#include <simdjson.h>
#include <ixwebsocket/IXWebSocket.h>

// Standard Library
#include <atomic>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tsepush {

    // Function: FeedClient
    // Description: Upstream push feed client. Subscribes to the whole instrument
    //              universe over one WebSocket and forwards decoded trade and
    //              threshold updates to the repository by ISIN.
    class FeedClient {
    public:
        // Inputs: repository - Destination of decoded updates.
        //         isins - Instrument universe. Frames for any other ISIN are skipped.
        //         capture_path - Raw frame capture file, empty disables capture.
        FeedClient(MarketRepository& repository, std::vector<std::string> isins, const std::string& capture_path = "");
        ~FeedClient();

        FeedClient(const FeedClient&) = delete;
        FeedClient& operator=(const FeedClient&) = delete;

        // Function: connect
        // Description: Opens ws://host:port. Blocks up to the connect timeout.
        // Outputs: Throws std::runtime_error if the connection cannot be established.
        void connect(const std::string& host, uint16_t port);

        // Function: subscribe
        // Description: Sends "1.all.<isin1>,<isin2>,..." for the whole universe.
        void subscribe();

        // Function: run
        // Description: Receives and decodes frames on the calling thread until the connection closes.
        void run();

        // Function: stop
        // Description: Closes the connection. Safe from any thread, makes run() return.
        void stop();

        // Function: process_message
        // Description: Decodes one frame: {"<isin>":{"<channel>":[fields...]}}.
        //              Exposed for replay and testing.
        // Outputs: Number of channel entries applied to the repository.
        size_t process_message(std::string_view message);

        // Function: subscribe_request
        // Description: The subscribe frame for the configured universe.
        std::string subscribe_request() const;

        uint64_t frames_received() const { return frames_received_.load(std::memory_order_relaxed); }
        uint64_t decode_errors() const { return decode_errors_.load(std::memory_order_relaxed); }

    private:
        bool handle_channel(const std::string& isin, std::string_view channel, simdjson::dom::element data);
        bool handle_thresholds(const std::string& isin, simdjson::dom::element data);
        bool handle_trade(const std::string& isin, simdjson::dom::element data);
        void capture(std::string_view message);

        static std::optional<int64_t> extract_int(simdjson::dom::element value);

        MarketRepository& repository_;
        std::vector<std::string> isins_;
        std::unordered_set<std::string> subscribed_;

        // Networking handles
        ix::WebSocket webSocket_;
        std::string url_;

        // Capture
        std::ofstream capture_file_;
        bool capture_enabled_ = false;

        std::atomic<uint64_t> frames_received_{0};
        std::atomic<uint64_t> decode_errors_{0};
    };

}
