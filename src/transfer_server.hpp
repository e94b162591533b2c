#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

#include "log.hpp"
#include "registration_table.hpp"

class TransferHandler;

// Accepts peer connections and hands each one to a fixed pool of workers.
// Only reads the registration table.
class TransferServer {
public:
    struct Options {
        std::string listen_ip = "0.0.0.0";
        unsigned short port = 0;            // 0 picks an ephemeral port
        std::size_t max_connections = 4;    // worker pool size
        std::chrono::milliseconds shutdown_grace{5000};
    };

    TransferServer(const RegistrationTable& registrations,
                   Options options,
                   std::shared_ptr<Logger> logger = nullptr);
    ~TransferServer();

    // Binds with address reuse and starts the accept loop. False when the
    // listening socket cannot be set up.
    bool start();
    // Stops accepting, lets in-flight transfers finish within the grace
    // period, then cancels whatever is left.
    void stop();

    bool running() const { return running_.load(); }
    unsigned short port() const { return port_; }
    std::size_t active_transfers() const;

private:
    void do_accept();
    void dispatch(asio::ip::tcp::socket socket);
    void finished(const std::shared_ptr<TransferHandler>& handler);

    const RegistrationTable& registrations_;
    Options options_;
    std::shared_ptr<Logger> logger_;

    asio::io_context io_;
    std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
    std::thread accept_thread_;
    std::unique_ptr<asio::thread_pool> workers_;

    mutable std::mutex active_mutex_;
    std::condition_variable active_cv_;
    std::unordered_set<std::shared_ptr<TransferHandler>> active_; // queued or running

    std::atomic<bool> running_{false};
    unsigned short port_ = 0;
};
