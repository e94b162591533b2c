#pragma once
#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "log.hpp"
#include "registration_table.hpp"

// Serves exactly one file over one accepted connection, then closes it.
class TransferHandler {
public:
    TransferHandler(asio::ip::tcp::socket socket,
                    const RegistrationTable& registrations,
                    std::shared_ptr<Logger> logger);
    ~TransferHandler();

    // Blocking; runs on a worker thread. Never throws.
    void run();
    // Unblocks a transfer stuck in socket I/O from another thread.
    void cancel();

    const std::string& remote() const { return remote_; }

private:
    std::optional<std::filesystem::path> authorize(const std::string& file_name) const;
    void refuse(const std::string& file_name, const char* reason);
    void stream_file(const std::filesystem::path& path, std::uint64_t size);
    void close();

    std::mutex socket_mutex_; // shutdown/close only, never held across I/O
    asio::ip::tcp::socket socket_;
    const RegistrationTable& registrations_;
    std::shared_ptr<Logger> logger_;
    std::string remote_;
};
