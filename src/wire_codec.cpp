#include "wire_codec.hpp"

std::vector<std::uint8_t> encode_request(const std::string& file_name) {
  if(file_name.size() > kMaxFileNameBytes) {
    throw WireError("file name exceeds " + std::to_string(kMaxFileNameBytes) + " bytes");
  }
  std::vector<std::uint8_t> frame;
  frame.reserve(kRequestHeaderSize + file_name.size());
  frame.push_back(static_cast<std::uint8_t>((file_name.size() >> 8) & 0xFF));
  frame.push_back(static_cast<std::uint8_t>(file_name.size() & 0xFF));
  frame.insert(frame.end(), file_name.begin(), file_name.end());
  return frame;
}

std::size_t decode_request_header(const RequestHeader& header) {
  return (static_cast<std::size_t>(header[0]) << 8) | header[1];
}

LengthField encode_length(std::int64_t length) {
  LengthField field{};
  auto bits = static_cast<std::uint64_t>(length);
  for(std::size_t i = 0; i < kLengthFieldSize; ++i) {
    field[kLengthFieldSize - 1 - i] = static_cast<std::uint8_t>(bits & 0xFF);
    bits >>= 8;
  }
  return field;
}

std::int64_t decode_length(const LengthField& field) {
  std::uint64_t bits = 0;
  for(auto byte : field) {
    bits = (bits << 8) | byte;
  }
  return static_cast<std::int64_t>(bits);
}
