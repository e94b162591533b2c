#pragma once
#include <asio.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Peer transfer framing, one request per connection:
//   client -> server   u16 big-endian byte count, then the UTF-8 file name
//   server -> client   i64 big-endian payload length, then exactly that many
//                      raw bytes; kUnavailableLength means no payload follows
inline constexpr std::size_t kRequestHeaderSize = 2;
inline constexpr std::size_t kLengthFieldSize = 8;
inline constexpr std::size_t kMaxFileNameBytes = 0xFFFF;
inline constexpr std::int64_t kUnavailableLength = -1;

using RequestHeader = std::array<std::uint8_t, kRequestHeaderSize>;
using LengthField = std::array<std::uint8_t, kLengthFieldSize>;

class WireError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

std::vector<std::uint8_t> encode_request(const std::string& file_name);
std::size_t decode_request_header(const RequestHeader& header);

LengthField encode_length(std::int64_t length);
std::int64_t decode_length(const LengthField& field);

// Blocking helpers over any asio SyncReadStream/SyncWriteStream. I/O failures
// surface as asio::system_error.
template<typename SyncWriteStream>
void write_request(SyncWriteStream& stream, const std::string& file_name) {
  auto frame = encode_request(file_name);
  asio::write(stream, asio::buffer(frame));
}

template<typename SyncReadStream>
std::string read_request(SyncReadStream& stream) {
  RequestHeader header{};
  asio::read(stream, asio::buffer(header));
  std::string name(decode_request_header(header), '\0');
  if(!name.empty()) {
    asio::read(stream, asio::buffer(&name[0], name.size()));
  }
  return name;
}

template<typename SyncWriteStream>
void write_length(SyncWriteStream& stream, std::int64_t length) {
  auto field = encode_length(length);
  asio::write(stream, asio::buffer(field));
}

template<typename SyncReadStream>
std::int64_t read_length(SyncReadStream& stream) {
  LengthField field{};
  asio::read(stream, asio::buffer(field));
  return decode_length(field);
}
