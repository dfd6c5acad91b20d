#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "byte_stream.hpp"
#include "protocol.hpp"

inline constexpr std::size_t kLengthPrefixBytes = 4;
inline constexpr std::size_t kTypeTagBytes = 1;

// Largest body accepted for a message type: the control cap for everything
// except FILE_CHUNK, which is bounded by the transfer's chunk size instead.
std::size_t max_payload_for(MessageType type, std::size_t chunk_limit = kMaxChunkSize);

// [u32 big-endian length][u8 type][body]; the length counts the tag byte.
// Throws ProtocolError when the body exceeds max_payload_for(type).
std::vector<std::uint8_t> encode_message(const Message& message,
                                         std::size_t chunk_limit = kMaxChunkSize);

// Reads one whole message or throws; callers never see a partial message.
// A declared length beyond `max_payload` + tag is rejected before any body
// byte is read or buffered. Raising `max_payload` above the control cap only
// admits larger FILE_CHUNK bodies; other types stay capped.
Message decode_message(ByteStream& stream, std::size_t max_payload = kMaxControlPayload);

void write_message(ByteStream& stream, const Message& message,
                   std::size_t chunk_limit = kMaxChunkSize);
