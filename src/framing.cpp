#include "framing.hpp"

#include <array>
#include <string>

std::size_t max_payload_for(MessageType type, std::size_t chunk_limit) {
  if(type == MessageType::FileChunk) return chunk_limit;
  return kMaxControlPayload;
}

std::vector<std::uint8_t> encode_message(const Message& message, std::size_t chunk_limit) {
  const auto limit = max_payload_for(message.type, chunk_limit);
  if(message.payload.size() > limit) {
    throw ProtocolError(std::string(message_type_name(message.type)) + " body of " +
                        std::to_string(message.payload.size()) + " bytes exceeds limit of " +
                        std::to_string(limit));
  }
  const auto length = static_cast<std::uint32_t>(message.payload.size() + kTypeTagBytes);
  std::vector<std::uint8_t> frame;
  frame.reserve(kLengthPrefixBytes + length);
  frame.push_back(static_cast<std::uint8_t>((length >> 24) & 0xFF));
  frame.push_back(static_cast<std::uint8_t>((length >> 16) & 0xFF));
  frame.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
  frame.push_back(static_cast<std::uint8_t>(length & 0xFF));
  frame.push_back(static_cast<std::uint8_t>(message.type));
  frame.insert(frame.end(), message.payload.begin(), message.payload.end());
  return frame;
}

Message decode_message(ByteStream& stream, std::size_t max_payload) {
  std::array<std::uint8_t, kLengthPrefixBytes> prefix{};
  stream.read_exact(prefix.data(), prefix.size());
  const std::uint32_t length = (static_cast<std::uint32_t>(prefix[0]) << 24) |
                               (static_cast<std::uint32_t>(prefix[1]) << 16) |
                               (static_cast<std::uint32_t>(prefix[2]) << 8) |
                               static_cast<std::uint32_t>(prefix[3]);
  if(length < kTypeTagBytes) {
    throw ProtocolError("empty frame without type tag");
  }
  if(length - kTypeTagBytes > max_payload) {
    throw ProtocolError("declared frame length " + std::to_string(length) +
                        " exceeds limit of " + std::to_string(max_payload + kTypeTagBytes));
  }

  std::uint8_t tag = 0;
  stream.read_exact(&tag, kTypeTagBytes);
  if(!is_known_message_type(tag)) {
    throw ProtocolError("unknown message type " + std::to_string(tag));
  }

  Message message;
  message.type = static_cast<MessageType>(tag);
  if(length - kTypeTagBytes > max_payload_for(message.type, max_payload)) {
    throw ProtocolError(std::string(message_type_name(message.type)) +
                        " exceeds the control message limit");
  }
  message.payload.resize(length - kTypeTagBytes);
  if(!message.payload.empty()) {
    stream.read_exact(message.payload.data(), message.payload.size());
  }
  return message;
}

void write_message(ByteStream& stream, const Message& message, std::size_t chunk_limit) {
  auto frame = encode_message(message, chunk_limit);
  stream.write_all(frame.data(), frame.size());
}
