#include "broker/SubscriptionBroker.hpp"
#include "common/Backoff.hpp"
#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Utils.hpp"
#include "feed_handler/FeedClient.hpp"
#include "repository/MarketRepository.hpp"
#include "server/RelayServer.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <thread>

std::atomic<bool> keep_running{true};

void signal_handler(int) {
    keep_running = false;
}

// Function: supervise_feed
// Description: Keeps the upstream connection alive. Connects, subscribes and
//              receives until the connection drops, then waits out the backoff.
// Inputs: feed - Upstream client.
//         config - Upstream address and backoff bounds.
void supervise_feed(tsepush::FeedClient& feed, const tsepush::Config& config) {
    tsepush::ReconnectBackoff backoff(config.reconnect_min_ms, config.reconnect_max_ms);
    while (keep_running) {
        try {
            feed.connect(config.upstream_host, config.upstream_port);
            backoff.reset();
            if (!keep_running) {
                feed.stop();
                break;
            }
            feed.subscribe();
            feed.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Feed: %s", e.what());
        }
        if (!keep_running) break;

        auto delay = backoff.next();
        LOG_WARN("Feed: reconnecting in %lld ms", static_cast<long long>(delay.count()));
        auto deadline = std::chrono::steady_clock::now() + delay;
        while (keep_running && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

// Function: main
// Description: Entry point. Loads config and the instrument universe, starts the
//              relay server and the upstream feed, runs until signalled or until
//              the configured session end.
// Inputs: argv[1] - Optional config file.
// Outputs: Returns 0 on clean shutdown, 1 on startup failure.
int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    tsepush::Config config = tsepush::load_config(argc > 1 ? argv[1] : "");

    // Start Async Logger
    tsepush::AsyncLogger::instance().set_level(config.log_level);
    tsepush::AsyncLogger::instance().start(config.log_file);
    LOG_INFO("Starting TSE pusher...");

    std::vector<tsepush::Identification> universe;
    try {
        universe = tsepush::load_instrument_list(config.instruments_file);
    } catch (const std::exception& e) {
        std::cerr << "[System] " << e.what() << std::endl;
        LOG_ERROR("%s", e.what());
        tsepush::AsyncLogger::instance().stop();
        return 1;
    }

    tsepush::MarketRepository repository;
    std::vector<std::string> isins;
    isins.reserve(universe.size());
    for (const auto& identification : universe) {
        if (repository.add_instrument(identification)) {
            isins.push_back(identification.isin);
        }
    }
    LOG_INFO("Loaded %zu instruments from %s", isins.size(), config.instruments_file.c_str());

    tsepush::SubscriptionBroker broker(repository);
    tsepush::RelayServer server(broker, config);
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[System] Relay server failed to start: " << e.what() << std::endl;
        LOG_ERROR("Relay server failed to start: %s", e.what());
        tsepush::AsyncLogger::instance().stop();
        return 1;
    }

    tsepush::FeedClient feed(repository, isins, config.capture_file);
    std::thread feed_thread(supervise_feed, std::ref(feed), std::cref(config));

    std::cout << "Relaying " << isins.size() << " instruments on port " << server.port() << "..." << std::endl;

    // Only a session end crossed while running stops the process
    bool before_session_end = config.session_end_minute &&
                              tsepush::utils::local_minutes_of_day() < *config.session_end_minute;
    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (before_session_end && tsepush::utils::local_minutes_of_day() >= *config.session_end_minute) {
            LOG_INFO("Session end reached");
            break;
        }
    }
    keep_running = false;

    std::cout << "Stopping pusher..." << std::endl;
    LOG_INFO("Stopping pusher...");
    feed.stop();
    if (feed_thread.joinable()) feed_thread.join();
    server.stop();
    LOG_INFO("Feed frames: %llu, decode errors: %llu",
             static_cast<unsigned long long>(feed.frames_received()),
             static_cast<unsigned long long>(feed.decode_errors()));
    tsepush::AsyncLogger::instance().stop();

    return 0;
}
