#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "log.hpp"

struct TransferResult {
  enum class Status {
    Completed,
    Unavailable,   // the peer answered with the sentinel length
    SizeMismatch,  // stream ended before the announced length
    Failed         // connect/local I/O error
  };

  Status status = Status::Failed;
  std::int64_t declared_bytes = 0;
  std::uint64_t received_bytes = 0;
  std::filesystem::path local_path;
  std::string sha256;
  std::string error;

  bool ok() const { return status == Status::Completed; }
};

const char* to_string(TransferResult::Status status);

// Fetches one named file from a peer's transfer server.
class TransferClient {
public:
  explicit TransferClient(std::shared_ptr<Logger> logger = nullptr);

  // Saves the file as destination_dir/<base name of file_name>, creating the
  // directory if needed. Blocking.
  TransferResult download(const std::string& host,
                          unsigned short port,
                          const std::string& file_name,
                          const std::filesystem::path& destination_dir);

private:
  std::shared_ptr<Logger> logger_;
};
