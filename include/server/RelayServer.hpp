#pragma once

#include "broker/SubscriptionBroker.hpp"
#include "common/Config.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

namespace beast = boost::beast;     // from <boost/beast.hpp>
namespace net = boost::asio;        // from <boost/asio.hpp>
using tcp = net::ip::tcp;           // from <boost/asio/ip/tcp.hpp>

namespace tsepush {

    class Session;

    // Function: RelayServer
    // Description: Downstream WebSocket endpoint. Accepts connections, runs one
    //              Session per connection and routes their commands to the broker.
    class RelayServer {
    public:
        // Function: RelayServer
        // Description: Constructor. Nothing is bound until start().
        // Inputs: broker - Receives commands and session removals.
        //         config - listen_address, listen_port, io_threads, send_timeout_ms, max_pending_bytes.
        RelayServer(SubscriptionBroker& broker, const Config& config);

        ~RelayServer();

        RelayServer(const RelayServer&) = delete;
        RelayServer& operator=(const RelayServer&) = delete;

        // Function: start
        // Description: Binds, listens and starts the I/O threads.
        // Outputs: Throws beast::system_error if the address cannot be bound.
        void start();

        // Function: stop
        // Description: Closes the acceptor and every session, then joins the I/O threads.
        void stop();

        // The bound port, useful when listening on port 0.
        uint16_t port() const { return port_.load(); }

        size_t session_count();

    private:
        void do_accept();
        void on_accept(beast::error_code ec, tcp::socket socket);

        SubscriptionBroker& broker_;
        Config config_;

        net::io_context ioc_;
        tcp::acceptor acceptor_;
        std::vector<std::thread> threads_;
        std::atomic<uint16_t> port_{0};
        std::atomic<bool> running_{false};

        std::mutex sessions_mutex_;
        std::vector<std::weak_ptr<Session>> sessions_;
    };

}
