#include "broker/SubscriptionBroker.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include "feed_handler/FeedClient.hpp"
#include "repository/MarketRepository.hpp"
#include "server/RelayServer.hpp"
#include <simdjson.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

// Replay Engine
// Reads a raw upstream capture and feeds it through a fresh relay with the recorded timing.

struct RecordedMessage {
    uint64_t timestamp; // ns
    std::string data;
};

std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running = false;
}

// Function: collect_isins
// Description: Every top level key of every frame, in sorted order.
std::vector<std::string> collect_isins(const std::vector<RecordedMessage>& messages) {
    simdjson::dom::parser parser;
    std::set<std::string> found;
    for (const auto& msg : messages) {
        simdjson::dom::object frame;
        if (parser.parse(msg.data).get(frame) != simdjson::SUCCESS) continue;
        for (auto entry : frame) {
            if (entry.key.size() == tsepush::constants::ISIN_LENGTH) {
                found.emplace(entry.key);
            }
        }
    }
    return std::vector<std::string>(found.begin(), found.end());
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <capture> [speed] [config]" << std::endl;
        return 1;
    }
    double speed = argc > 2 ? std::atof(argv[2]) : 1.0;
    if (speed < 0.0) speed = 0.0;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    tsepush::Config config = tsepush::load_config(argc > 3 ? argv[3] : "");
    tsepush::AsyncLogger::instance().set_level(config.log_level);
    tsepush::AsyncLogger::instance().start(config.log_file);

    std::cout << "Loading " << argv[1] << "..." << std::endl;
    std::ifstream file(argv[1], std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open " << argv[1] << std::endl;
        tsepush::AsyncLogger::instance().stop();
        return 1;
    }

    std::vector<RecordedMessage> messages;
    messages.reserve(100000);

    while (file.peek() != EOF) {
        uint64_t ts;
        uint32_t len;
        file.read(reinterpret_cast<char*>(&ts), sizeof(ts));
        file.read(reinterpret_cast<char*>(&len), sizeof(len));

        if (file.gcount() != sizeof(len)) break;

        std::string data(len, '\0');
        file.read(&data[0], len);
        if (static_cast<uint32_t>(file.gcount()) != len) break;
        messages.push_back({ts, std::move(data)});
    }
    std::cout << "Loaded " << messages.size() << " messages." << std::endl;

    if (messages.empty()) {
        tsepush::AsyncLogger::instance().stop();
        return 0;
    }

    // Setup relay
    tsepush::MarketRepository repository;
    std::vector<std::string> isins = collect_isins(messages);
    for (const auto& isin : isins) {
        tsepush::Identification identification;
        identification.isin = isin;
        repository.add_instrument(identification);
    }
    LOG_INFO("Replay: seeded %zu instruments", isins.size());

    tsepush::SubscriptionBroker broker(repository);
    tsepush::RelayServer server(broker, config);
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "Relay server failed to start: " << e.what() << std::endl;
        tsepush::AsyncLogger::instance().stop();
        return 1;
    }

    // No connect(): the client is only used for decoding.
    tsepush::FeedClient feed(repository, isins);

    std::cout << "Starting Replay on port " << server.port() << "..." << std::endl;

    auto start = std::chrono::steady_clock::now();
    uint64_t first_msg_ts = messages[0].timestamp;

    for (const auto& msg : messages) {
        if (!keep_running) break;
        if (speed > 0.0 && msg.timestamp > first_msg_ts) {
            auto target = start + std::chrono::nanoseconds(
                static_cast<int64_t>(static_cast<double>(msg.timestamp - first_msg_ts) / speed));
            while (keep_running && std::chrono::steady_clock::now() < target) {
                auto remaining = target - std::chrono::steady_clock::now();
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(remaining, std::chrono::milliseconds(100)));
            }
        }
        feed.process_message(msg.data);
    }

    std::cout << "Replay Complete. Serving until interrupted." << std::endl;
    LOG_INFO("Replay complete, %llu decode errors", static_cast<unsigned long long>(feed.decode_errors()));

    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    server.stop();
    tsepush::AsyncLogger::instance().stop();

    return 0;
}
