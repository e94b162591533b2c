#include "transfer_server.hpp"
#include "transfer_handler.hpp"

#include <algorithm>

TransferServer::TransferServer(const RegistrationTable& registrations,
                               Options options,
                               std::shared_ptr<Logger> logger)
: registrations_(registrations),
  options_(std::move(options)),
  logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer-server"))
{
    options_.max_connections = std::max<std::size_t>(1, options_.max_connections);
}

TransferServer::~TransferServer(){
    stop();
}

bool TransferServer::start(){
    if(running_) return true;
    using tcp = asio::ip::tcp;
    try {
        tcp::endpoint endpoint(asio::ip::make_address(options_.listen_ip), options_.port);
        acceptor_ = std::make_unique<tcp::acceptor>(io_);
        acceptor_->open(endpoint.protocol());
        // Survive a quick restart while the old socket sits in TIME_WAIT.
        acceptor_->set_option(tcp::acceptor::reuse_address(true));
        acceptor_->bind(endpoint);
        acceptor_->listen();
        port_ = acceptor_->local_endpoint().port();
    } catch(const std::exception& e){
        logger_->error("Peer server cannot listen on {}:{}: {}", options_.listen_ip, options_.port, e.what());
        acceptor_.reset();
        return false;
    }

    workers_ = std::make_unique<asio::thread_pool>(options_.max_connections);
    running_ = true;
    io_.restart();
    do_accept();
    accept_thread_ = std::thread([this](){
        io_.run();
    });
    logger_->info("Peer server listening on port {} ({} workers)", port_, options_.max_connections);
    return true;
}

void TransferServer::do_accept(){
    acceptor_->async_accept([this](std::error_code ec, asio::ip::tcp::socket sock){
        if(!running_) return;
        if(ec){
            if(ec != asio::error::operation_aborted){
                logger_->error("Connection accept error: {}", ec.message());
            }
        } else {
            dispatch(std::move(sock));
        }
        if(running_ && acceptor_->is_open()){
            do_accept();
        }
    });
}

void TransferServer::dispatch(asio::ip::tcp::socket sock){
    auto handler = std::make_shared<TransferHandler>(std::move(sock), registrations_, logger_);
    logger_->debug("Accepted connection from {}", handler->remote());
    {
        std::lock_guard lg(active_mutex_);
        active_.insert(handler);
    }
    asio::post(*workers_, [this, handler](){
        handler->run();
        finished(handler);
    });
}

void TransferServer::finished(const std::shared_ptr<TransferHandler>& handler){
    std::lock_guard lg(active_mutex_);
    active_.erase(handler);
    active_cv_.notify_all();
}

std::size_t TransferServer::active_transfers() const {
    std::lock_guard lg(active_mutex_);
    return active_.size();
}

void TransferServer::stop(){
    if(!running_.exchange(false)) return;

    io_.stop();
    if(accept_thread_.joinable()){
        accept_thread_.join();
    }
    if(acceptor_){
        std::error_code ec;
        acceptor_->close(ec);
    }
    acceptor_.reset();

    bool drained = false;
    {
        std::unique_lock<std::mutex> lock(active_mutex_);
        drained = active_cv_.wait_for(lock, options_.shutdown_grace, [this](){ return active_.empty(); });
        if(!drained){
            logger_->warn("{} transfers still running after {} ms; cancelling",
                          active_.size(), options_.shutdown_grace.count());
            for(const auto& handler : active_){
                handler->cancel();
            }
        }
    }
    if(!drained){
        // Drop queued transfers that never started.
        workers_->stop();
    }
    workers_->join();
    workers_.reset();
    {
        std::lock_guard lg(active_mutex_);
        active_.clear();
    }
    logger_->info("Peer server on port {} stopped", port_);
}
