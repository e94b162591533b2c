#include "transfer_client.hpp"
#include "utils.hpp"
#include "wire_codec.hpp"

#include <asio.hpp>

#include <algorithm>
#include <array>
#include <fstream>

namespace {
constexpr std::size_t kReceiveChunkSize = 64 * 1024;
}

const char* to_string(TransferResult::Status status){
  switch(status){
    case TransferResult::Status::Completed: return "completed";
    case TransferResult::Status::Unavailable: return "unavailable";
    case TransferResult::Status::SizeMismatch: return "size mismatch";
    case TransferResult::Status::Failed: return "failed";
  }
  return "unknown";
}

TransferClient::TransferClient(std::shared_ptr<Logger> logger)
: logger_(logger ? std::move(logger) : std::make_shared<Logger>("transfer-client")) {}

TransferResult TransferClient::download(const std::string& host,
                                        unsigned short port,
                                        const std::string& file_name,
                                        const std::filesystem::path& destination_dir){
  TransferResult result;
  namespace fs = std::filesystem;

  auto base_name = fs::path(file_name).filename();
  if(base_name.empty()){
    result.error = "empty file name";
    logger_->error("Refusing to download '{}': {}", file_name, result.error);
    return result;
  }

  std::error_code fs_ec;
  fs::create_directories(destination_dir, fs_ec);
  if(fs_ec){
    result.error = "cannot create " + destination_dir.string() + ": " + fs_ec.message();
    logger_->error("{}", result.error);
    return result;
  }

  try {
    asio::io_context io;
    asio::ip::tcp::resolver resolver(io);
    asio::ip::tcp::socket sock(io);
    asio::connect(sock, resolver.resolve(host, std::to_string(port)));

    write_request(sock, file_name);
    result.declared_bytes = read_length(sock);
    // Zero-length files are indistinguishable from a refusal on this wire.
    if(result.declared_bytes <= 0){
      result.status = TransferResult::Status::Unavailable;
      result.error = "file unavailable at " + host + ":" + std::to_string(port);
      logger_->warn("Peer {}:{} has no file named '{}'", host, port, file_name);
      return result;
    }

    result.local_path = destination_dir / base_name;
    std::ofstream out(result.local_path, std::ios::binary | std::ios::trunc);
    if(!out){
      result.error = "cannot open " + result.local_path.string() + " for writing";
      logger_->error("{}", result.error);
      return result;
    }

    auto expected = static_cast<std::uint64_t>(result.declared_bytes);
    std::array<char, kReceiveChunkSize> buffer{};
    Sha256 digest;
    while(result.received_bytes < expected){
      auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), expected - result.received_bytes));
      std::error_code ec;
      std::size_t got = sock.read_some(asio::buffer(buffer.data(), want), ec);
      if(got > 0){
        out.write(buffer.data(), static_cast<std::streamsize>(got));
        if(!out){
          result.error = "write to " + result.local_path.string() + " failed";
          logger_->error("{}", result.error);
          return result;
        }
        digest.update(buffer.data(), got);
        result.received_bytes += got;
      }
      if(ec){
        if(ec != asio::error::eof){
          logger_->debug("Stream of {} ended early: {}", file_name, ec.message());
        }
        break;
      }
    }
    out.close();
    result.sha256 = digest.hex_digest();

    if(result.received_bytes != expected){
      result.status = TransferResult::Status::SizeMismatch;
      result.error = "received " + std::to_string(result.received_bytes) + " of " +
                     std::to_string(expected) + " bytes";
      logger_->warn("Download of {} incomplete: {}", file_name, result.error);
      return result;
    }

    result.status = TransferResult::Status::Completed;
    logger_->info("Downloaded {} ({} bytes, sha256 {}) to {}",
                  file_name, result.received_bytes, result.sha256, result.local_path.string());
  } catch(const std::exception& e){
    result.status = TransferResult::Status::Failed;
    result.error = e.what();
    logger_->error("Download of {} from {}:{} failed: {}", file_name, host, port, e.what());
  }
  return result;
}
