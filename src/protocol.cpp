#include "protocol.hpp"

#include <limits>

namespace {

void expect_type(const Message& message, MessageType type) {
  if(message.type != type) {
    throw ProtocolError(std::string("expected ") + message_type_name(type) +
                        " but received " + message_type_name(message.type));
  }
}

Message make_message(MessageType type, std::vector<std::uint8_t> payload = {}) {
  Message m;
  m.type = type;
  m.payload = std::move(payload);
  return m;
}

} // namespace

const char* message_type_name(MessageType type) {
  switch(type) {
    case MessageType::ListRequest: return "LIST_REQUEST";
    case MessageType::ListResponse: return "LIST_RESPONSE";
    case MessageType::DownloadRequest: return "DOWNLOAD_REQUEST";
    case MessageType::DownloadResponse: return "DOWNLOAD_RESPONSE";
    case MessageType::Error: return "ERROR";
    case MessageType::FileChunk: return "FILE_CHUNK";
    case MessageType::FileEnd: return "FILE_END";
    case MessageType::TransferCancel: return "TRANSFER_CANCEL";
    case MessageType::UploadAnnounce: return "UPLOAD_ANNOUNCE";
    case MessageType::UploadDecision: return "UPLOAD_DECISION";
    case MessageType::Ack: return "ACK";
  }
  return "UNKNOWN";
}

bool is_known_message_type(std::uint8_t tag) {
  return tag >= static_cast<std::uint8_t>(MessageType::ListRequest) &&
         tag <= static_cast<std::uint8_t>(MessageType::Ack);
}

PayloadWriter& PayloadWriter::put_u8(std::uint8_t value) {
  bytes_.push_back(value);
  return *this;
}

PayloadWriter& PayloadWriter::put_u32(std::uint32_t value) {
  for(int shift = 24; shift >= 0; shift -= 8) {
    bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
  }
  return *this;
}

PayloadWriter& PayloadWriter::put_u64(std::uint64_t value) {
  for(int shift = 56; shift >= 0; shift -= 8) {
    bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
  }
  return *this;
}

PayloadWriter& PayloadWriter::put_string(const std::string& value) {
  if(value.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw ProtocolError("string field too long");
  }
  put_u32(static_cast<std::uint32_t>(value.size()));
  bytes_.insert(bytes_.end(), value.begin(), value.end());
  return *this;
}

void PayloadReader::require(std::size_t count, const char* field) const {
  if(remaining() < count) {
    throw ProtocolError(std::string("payload too short for ") + field);
  }
}

std::uint8_t PayloadReader::get_u8() {
  require(1, "u8");
  return bytes_[offset_++];
}

std::uint32_t PayloadReader::get_u32() {
  require(4, "u32");
  std::uint32_t value = 0;
  for(int i = 0; i < 4; ++i) value = (value << 8) | bytes_[offset_++];
  return value;
}

std::uint64_t PayloadReader::get_u64() {
  require(8, "u64");
  std::uint64_t value = 0;
  for(int i = 0; i < 8; ++i) value = (value << 8) | bytes_[offset_++];
  return value;
}

std::string PayloadReader::get_string() {
  auto length = get_u32();
  require(length, "string");
  std::string value(reinterpret_cast<const char*>(bytes_.data() + offset_), length);
  offset_ += length;
  return value;
}

Message make_list_request() {
  return make_message(MessageType::ListRequest);
}

Message make_list_response(const std::vector<RemoteFile>& files) {
  // count (4) + truncated flag (1) are always present
  constexpr std::size_t kFixedBytes = 4 + 1;
  PayloadWriter entries;
  std::uint32_t count = 0;
  bool truncated = false;
  for(const auto& file : files) {
    const std::size_t entry_bytes = 4 + file.name.size() + 8;
    if(kFixedBytes + entries.size() + entry_bytes > kMaxControlPayload) {
      truncated = true;
      break;
    }
    entries.put_string(file.name).put_u64(file.size);
    ++count;
  }
  PayloadWriter body;
  body.put_u32(count);
  auto entry_bytes = entries.take();
  auto out = body.take();
  out.insert(out.end(), entry_bytes.begin(), entry_bytes.end());
  out.push_back(truncated ? 1 : 0);
  return make_message(MessageType::ListResponse, std::move(out));
}

Message make_download_request(const std::string& filename) {
  return make_message(MessageType::DownloadRequest, PayloadWriter().put_string(filename).take());
}

Message make_download_response(std::uint64_t size) {
  return make_message(MessageType::DownloadResponse, PayloadWriter().put_u64(size).take());
}

Message make_error(ErrorCode code) {
  return make_message(MessageType::Error,
                      PayloadWriter().put_u8(static_cast<std::uint8_t>(code)).put_string(describe(code)).take());
}

Message make_file_chunk(const std::uint8_t* data, std::size_t size) {
  return make_message(MessageType::FileChunk, std::vector<std::uint8_t>(data, data + size));
}

Message make_file_end(const std::string& sha256_hex) {
  return make_message(MessageType::FileEnd, PayloadWriter().put_string(sha256_hex).take());
}

Message make_transfer_cancel() {
  return make_message(MessageType::TransferCancel);
}

Message make_upload_announce(const std::string& filename, std::uint64_t size) {
  return make_message(MessageType::UploadAnnounce,
                      PayloadWriter().put_string(filename).put_u64(size).take());
}

Message make_upload_decision(bool accepted, ErrorCode reason) {
  return make_message(MessageType::UploadDecision,
                      PayloadWriter().put_u8(accepted ? 1 : 0).put_u8(static_cast<std::uint8_t>(reason)).take());
}

Message make_ack(std::uint64_t bytes) {
  return make_message(MessageType::Ack, PayloadWriter().put_u64(bytes).take());
}

FileListing parse_list_response(const Message& message) {
  expect_type(message, MessageType::ListResponse);
  PayloadReader reader(message.payload);
  FileListing listing;
  auto count = reader.get_u32();
  // each entry needs at least 12 bytes; reject counts the body cannot hold
  if(static_cast<std::uint64_t>(count) * 12 > reader.remaining()) {
    throw ProtocolError("listing entry count exceeds payload");
  }
  listing.files.reserve(count);
  for(std::uint32_t i = 0; i < count; ++i) {
    RemoteFile file;
    file.name = reader.get_string();
    file.size = reader.get_u64();
    listing.files.push_back(std::move(file));
  }
  if(reader.remaining() > 0) listing.truncated = reader.get_u8() != 0;
  return listing;
}

std::string parse_download_request(const Message& message) {
  expect_type(message, MessageType::DownloadRequest);
  PayloadReader reader(message.payload);
  return reader.get_string();
}

std::uint64_t parse_download_response(const Message& message) {
  expect_type(message, MessageType::DownloadResponse);
  PayloadReader reader(message.payload);
  return reader.get_u64();
}

ErrorReply parse_error(const Message& message) {
  expect_type(message, MessageType::Error);
  PayloadReader reader(message.payload);
  ErrorReply reply;
  reply.code = error_code_from_wire(reader.get_u8());
  if(reader.remaining() > 0) reply.category = reader.get_string();
  return reply;
}

std::string parse_file_end(const Message& message) {
  expect_type(message, MessageType::FileEnd);
  PayloadReader reader(message.payload);
  return reader.get_string();
}

UploadAnnounce parse_upload_announce(const Message& message) {
  expect_type(message, MessageType::UploadAnnounce);
  PayloadReader reader(message.payload);
  UploadAnnounce announce;
  announce.filename = reader.get_string();
  announce.size = reader.get_u64();
  return announce;
}

UploadDecision parse_upload_decision(const Message& message) {
  expect_type(message, MessageType::UploadDecision);
  PayloadReader reader(message.payload);
  UploadDecision decision;
  decision.accepted = reader.get_u8() != 0;
  decision.reason = error_code_from_wire(reader.get_u8());
  return decision;
}

std::uint64_t parse_ack(const Message& message) {
  expect_type(message, MessageType::Ack);
  PayloadReader reader(message.payload);
  return reader.get_u64();
}
