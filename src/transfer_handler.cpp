#include "transfer_handler.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <algorithm>
#include <array>
#include <fstream>

namespace {
constexpr std::size_t kStreamChunkSize = 64 * 1024;
}

TransferHandler::TransferHandler(asio::ip::tcp::socket socket,
                                 const RegistrationTable& registrations,
                                 std::shared_ptr<Logger> logger)
: socket_(std::move(socket)), registrations_(registrations), logger_(std::move(logger))
{
    std::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("<unknown>") : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

TransferHandler::~TransferHandler(){
    close();
}

void TransferHandler::run(){
    std::string file_name;
    try {
        file_name = read_request(socket_);
    } catch(const std::exception& ex){
        logger_->error("Transfer request from {} unreadable: {}", remote_, ex.what());
        close();
        return;
    }

    try {
        auto path = authorize(file_name);
        if(!path){
            refuse(file_name, "not registered");
            return;
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(*path, ec);
        if(ec){
            refuse(file_name, "size unavailable");
            return;
        }
        logger_->info("Sending {} ({} bytes) to {}", file_name, size, remote_);
        write_length(socket_, static_cast<std::int64_t>(size));
        stream_file(*path, size);
    } catch(const std::exception& ex){
        logger_->error("Transfer of {} to {} failed: {}", file_name, remote_, ex.what());
    }
    close();
}

std::optional<std::filesystem::path> TransferHandler::authorize(const std::string& file_name) const {
    auto registration = registrations_.find_by_name(file_name);
    if(!registration) return std::nullopt;
    std::error_code ec;
    if(std::filesystem::is_directory(registration->path, ec)) return std::nullopt;
    if(!is_readable_file(registration->path)) return std::nullopt;
    return registration->path;
}

void TransferHandler::refuse(const std::string& file_name, const char* reason){
    logger_->warn("File not found or inaccessible: '{}' requested by {} ({})", file_name, remote_, reason);
    try {
        write_length(socket_, kUnavailableLength);
    } catch(const std::exception& ex){
        logger_->error("Unable to refuse {}: {}", remote_, ex.what());
    }
    close();
}

void TransferHandler::stream_file(const std::filesystem::path& path, std::uint64_t size){
    std::ifstream in(path, std::ios::binary);
    if(!in){
        // The length is already on the wire; the peer will see a short transfer.
        logger_->error("Unable to open {} after announcing it to {}", path.string(), remote_);
        return;
    }
    std::array<char, kStreamChunkSize> buffer{};
    std::uint64_t sent = 0;
    while(sent < size){
        auto want = static_cast<std::streamsize>(std::min<std::uint64_t>(buffer.size(), size - sent));
        in.read(buffer.data(), want);
        auto got = in.gcount();
        if(got <= 0) break;
        asio::write(socket_, asio::buffer(buffer.data(), static_cast<std::size_t>(got)));
        sent += static_cast<std::uint64_t>(got);
    }
    if(sent != size){
        logger_->error("{} shrank during transfer to {}: sent {} of {} bytes", path.string(), remote_, sent, size);
    } else {
        logger_->debug("Finished sending {} to {}", path.string(), remote_);
    }
}

void TransferHandler::cancel(){
    std::lock_guard lg(socket_mutex_);
    std::error_code ec;
    if(!socket_.is_open()) return;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
}

void TransferHandler::close(){
    std::lock_guard lg(socket_mutex_);
    std::error_code ec;
    if(!socket_.is_open()) return;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}
