#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

// protocol.hpp
inline constexpr std::size_t kMaxControlPayload = 64 * 1024;
inline constexpr std::uint64_t kMaxTransferBytes = 2ULL * 1024 * 1024 * 1024;
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::size_t kMaxChunkSize = 1024 * 1024;

enum class MessageType : std::uint8_t {
  ListRequest = 1,
  ListResponse = 2,
  DownloadRequest = 3,
  DownloadResponse = 4,
  Error = 5,
  FileChunk = 6,
  FileEnd = 7,
  TransferCancel = 8,
  UploadAnnounce = 9,
  UploadDecision = 10,
  Ack = 11
};

const char* message_type_name(MessageType type);
bool is_known_message_type(std::uint8_t tag);

struct Message {
  MessageType type = MessageType::Ack;
  std::vector<std::uint8_t> payload; // body after the type tag

  bool operator==(const Message& other) const {
    return type == other.type && payload == other.payload;
  }
};

// Appends big-endian fixed-width integers and length-prefixed UTF-8 strings.
class PayloadWriter {
public:
  PayloadWriter& put_u8(std::uint8_t value);
  PayloadWriter& put_u32(std::uint32_t value);
  PayloadWriter& put_u64(std::uint64_t value);
  PayloadWriter& put_string(const std::string& value);

  std::size_t size() const { return bytes_.size(); }
  std::vector<std::uint8_t> take() { return std::move(bytes_); }

private:
  std::vector<std::uint8_t> bytes_;
};

// Bounds-checked reader; every overrun throws ProtocolError. Trailing bytes
// after the fields a caller asks for are ignored.
class PayloadReader {
public:
  explicit PayloadReader(const std::vector<std::uint8_t>& bytes) : bytes_(bytes) {}

  std::uint8_t get_u8();
  std::uint32_t get_u32();
  std::uint64_t get_u64();
  std::string get_string();

  std::size_t remaining() const { return bytes_.size() - offset_; }

private:
  void require(std::size_t count, const char* field) const;

  const std::vector<std::uint8_t>& bytes_;
  std::size_t offset_ = 0;
};

struct RemoteFile {
  std::string name;
  std::uint64_t size = 0;
};

struct FileListing {
  std::vector<RemoteFile> files;
  bool truncated = false;
};

struct UploadAnnounce {
  std::string filename;
  std::uint64_t size = 0;
};

struct UploadDecision {
  bool accepted = false;
  ErrorCode reason = ErrorCode::Ok;
};

struct ErrorReply {
  ErrorCode code = ErrorCode::InternalError;
  std::string category;
};

Message make_list_request();
// Adds entries while the body stays within the control cap.
Message make_list_response(const std::vector<RemoteFile>& files);
Message make_download_request(const std::string& filename);
Message make_download_response(std::uint64_t size);
// The text is always the generic category for the code.
Message make_error(ErrorCode code);
Message make_file_chunk(const std::uint8_t* data, std::size_t size);
Message make_file_end(const std::string& sha256_hex);
Message make_transfer_cancel();
Message make_upload_announce(const std::string& filename, std::uint64_t size);
Message make_upload_decision(bool accepted, ErrorCode reason);
Message make_ack(std::uint64_t bytes);

FileListing parse_list_response(const Message& message);
std::string parse_download_request(const Message& message);
std::uint64_t parse_download_response(const Message& message);
ErrorReply parse_error(const Message& message);
std::string parse_file_end(const Message& message);
UploadAnnounce parse_upload_announce(const Message& message);
UploadDecision parse_upload_decision(const Message& message);
std::uint64_t parse_ack(const Message& message);
