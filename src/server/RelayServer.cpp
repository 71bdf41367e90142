#include "server/RelayServer.hpp"
#include "common/Logger.hpp"
#include "server/WriteGuard.hpp"
#include <algorithm>
#include <chrono>
#include <deque>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/websocket.hpp>

namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>

namespace tsepush {

    // Function: Session
    // Description: One downstream connection. All socket work runs on the session's strand.
    //              deliver() may be called from any thread. A session is dropped when a
    //              single write outlives the send timeout or when its queued bytes pass
    //              max_pending_bytes, so a burst to a reading client never closes it.
    class Session : public Subscriber, public std::enable_shared_from_this<Session> {
    public:
        Session(tcp::socket&& socket, SubscriptionBroker& broker, int send_timeout_ms, size_t max_pending_bytes)
            : ws_(std::move(socket)),
              deadline_(ws_.get_executor()),
              broker_(broker),
              send_timeout_(std::chrono::milliseconds(send_timeout_ms)),
              max_pending_bytes_(max_pending_bytes) {
            beast::error_code ec;
            auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
            name_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
        }

        void run() {
            net::dispatch(ws_.get_executor(), [self = shared_from_this()]() { self->on_run(); });
        }

        bool deliver(std::shared_ptr<const std::string> payload) override {
            if (closed_.load(std::memory_order_acquire)) {
                return false;
            }
            const size_t size = payload->size();
            if (pending_bytes_.fetch_add(size, std::memory_order_acq_rel) + size > max_pending_bytes_) {
                pending_bytes_.fetch_sub(size, std::memory_order_acq_rel);
                if (!overflowed_.exchange(true, std::memory_order_acq_rel)) {
                    LOG_WARN("Session [%s] outbound queue over %zu bytes, closing", name_.c_str(), max_pending_bytes_);
                    close();
                }
                return false;
            }
            net::post(ws_.get_executor(), [self = shared_from_this(), payload = std::move(payload)]() mutable {
                self->enqueue(std::move(payload));
            });
            return true;
        }

        const std::string& name() const override { return name_; }

        // Thread safe. Tears the connection down on the strand.
        void close() {
            net::post(ws_.get_executor(), [self = shared_from_this()]() { self->on_closed("closed by server"); });
        }

        bool closed() const { return closed_.load(std::memory_order_acquire); }

    private:
        void on_run() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.async_accept([self = shared_from_this()](beast::error_code ec) { self->on_accept(ec); });
        }

        void on_accept(beast::error_code ec) {
            if (ec) {
                LOG_WARN("Session [%s] handshake failed: %s", name_.c_str(), ec.message().c_str());
                on_closed(nullptr);
                return;
            }
            LOG_INFO("Session [%s] connected", name_.c_str());
            do_read();
        }

        void do_read() {
            ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
        }

        void on_read(beast::error_code ec, std::size_t) {
            if (ec) {
                on_closed(ec == websocket::error::closed ? "closed by peer" : ec.message().c_str());
                return;
            }

            std::string message = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());

            auto response = broker_.handle_message(shared_from_this(), message);
            if (response) {
                pending_bytes_.fetch_add(response->size(), std::memory_order_acq_rel);
                enqueue(std::make_shared<const std::string>(std::move(*response)));
            }
            if (!closed_.load(std::memory_order_acquire)) {
                do_read();
            }
        }

        void enqueue(std::shared_ptr<const std::string> payload) {
            if (closed_.load(std::memory_order_acquire)) {
                pending_bytes_.fetch_sub(payload->size(), std::memory_order_acq_rel);
                return;
            }
            queue_.push_back(std::move(payload));
            if (!write_guard_.in_flight()) {
                do_write();
            }
        }

        void do_write() {
            const uint64_t generation = write_guard_.begin();
            deadline_.expires_after(send_timeout_);
            deadline_.async_wait([self = shared_from_this(), generation](beast::error_code ec) {
                if (!ec && self->write_guard_.expired(generation)) {
                    LOG_WARN("Session [%s] write timed out", self->name_.c_str());
                    self->on_closed("send timeout");
                }
            });

            ws_.text(true);
            ws_.async_write(net::buffer(*queue_.front()), [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
        }

        void on_write(beast::error_code ec) {
            write_guard_.finish();
            deadline_.cancel();
            if (ec) {
                on_closed(ec.message().c_str());
                return;
            }
            pending_bytes_.fetch_sub(queue_.front()->size(), std::memory_order_acq_rel);
            queue_.pop_front();
            if (!queue_.empty() && !closed_.load(std::memory_order_acquire)) {
                do_write();
            }
        }

        // Runs once. Unregisters from the broker and closes the socket so pending operations abort.
        // The queue is left alone, an in-flight write still references its front.
        void on_closed(const char* reason) {
            if (closed_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            if (reason) {
                LOG_INFO("Session [%s] ended: %s", name_.c_str(), reason);
            }
            broker_.remove_subscriber(shared_from_this());
            deadline_.cancel();
            beast::error_code ec;
            beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(ws_).socket().close(ec);
        }

        websocket::stream<beast::tcp_stream> ws_;
        beast::flat_buffer buffer_;
        net::steady_timer deadline_;
        std::deque<std::shared_ptr<const std::string>> queue_;
        WriteGuard write_guard_;

        SubscriptionBroker& broker_;
        std::string name_;
        std::chrono::milliseconds send_timeout_;
        size_t max_pending_bytes_;

        std::atomic<bool> closed_{false};
        std::atomic<bool> overflowed_{false};
        std::atomic<size_t> pending_bytes_{0};
    };

    RelayServer::RelayServer(SubscriptionBroker& broker, const Config& config)
        : broker_(broker),
          config_(config),
          ioc_(std::max(1, config.io_threads)),
          acceptor_(net::make_strand(ioc_)) {}

    RelayServer::~RelayServer() {
        stop();
    }

    void RelayServer::start() {
        if (running_) return;

        auto const address = net::ip::make_address(config_.listen_address);
        tcp::endpoint endpoint{address, config_.listen_port};

        // Throws beast::system_error on failure
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();

        running_ = true;
        do_accept();

        int thread_count = std::max(1, config_.io_threads);
        threads_.reserve(thread_count);
        for (int i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this]() {
                try {
                    ioc_.run();
                } catch (const std::exception& e) {
                    LOG_ERROR("Relay I/O thread error: %s", e.what());
                }
            });
        }
        LOG_INFO("Relay server listening on %s:%u with %d threads",
                 config_.listen_address.c_str(), static_cast<unsigned>(port_.load()), thread_count);
    }

    void RelayServer::do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
            on_accept(ec, std::move(socket));
        });
    }

    void RelayServer::on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                LOG_ERROR("Relay accept failed: %s", ec.message().c_str());
            }
            if (!running_ || !acceptor_.is_open()) return;
        } else {
            auto session = std::make_shared<Session>(std::move(socket), broker_, config_.send_timeout_ms,
                                                     config_.max_pending_bytes);
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                               [](const std::weak_ptr<Session>& w) { return w.expired(); }),
                                sessions_.end());
                sessions_.push_back(session);
            }
            session->run();
        }
        if (running_) {
            do_accept();
        }
    }

    void RelayServer::stop() {
        if (!running_.exchange(false)) return;
        LOG_INFO("Stopping relay server...");

        net::post(acceptor_.get_executor(), [this]() {
            beast::error_code ec;
            acceptor_.close(ec);
        });

        std::vector<std::shared_ptr<Session>> live;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            for (auto& weak : sessions_) {
                if (auto session = weak.lock()) live.push_back(std::move(session));
            }
            sessions_.clear();
        }
        for (auto& session : live) {
            session->close();
        }
        live.clear();

        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
        LOG_INFO("Relay server stopped");
    }

    size_t RelayServer::session_count() {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return static_cast<size_t>(std::count_if(sessions_.begin(), sessions_.end(), [](const std::weak_ptr<Session>& w) {
            auto session = w.lock();
            return session && !session->closed();
        }));
    }

}
