#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Absolute, lexically normalised form used as the identity of a shared file.
std::filesystem::path normalize_path(const std::filesystem::path& path);

bool is_hidden(const std::filesystem::path& path);
bool is_readable_file(const std::filesystem::path& path);

// Direct regular entries of `directory`; hidden entries only when asked for.
std::vector<std::filesystem::path> list_directory_files(const std::filesystem::path& directory,
                                                        bool include_hidden = false);

// Incremental SHA-256 over streamed bytes.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, std::size_t size);
  std::string hex_digest();

private:
  struct Context;
  std::unique_ptr<Context> ctx_;
};

std::string sha256_hex(const std::string& data);
std::string sha256_file_hex(const std::filesystem::path& path);
