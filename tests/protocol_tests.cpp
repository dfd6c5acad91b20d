#include "address.hpp"
#include "errors.hpp"
#include "framing.hpp"
#include "path_safety.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"

#include <string>
#include <vector>

namespace {

using lantern::test::make_memory_pair;

Message round_trip(const Message& message, std::size_t max_payload = kMaxControlPayload) {
  auto pipe_a = make_memory_pair();
  auto& a = pipe_a.first;
  auto& b = pipe_a.second;
  write_message(*a, message);
  return decode_message(*b, max_payload);
}

template<typename Fn>
bool throws_protocol_error(Fn&& fn) {
  try {
    fn();
  } catch(const ProtocolError&) {
    return true;
  }
  return false;
}

template<typename Fn>
bool throws_path_violation(Fn&& fn) {
  try {
    fn();
  } catch(const PathSafetyViolation&) {
    return true;
  }
  return false;
}

bool test_round_trip_control_messages() {
  std::vector<Message> messages = {
    make_list_request(),
    make_download_request("report.pdf"),
    make_download_response(123456789ULL),
    make_error(ErrorCode::NotFound),
    make_upload_announce("movie.mkv", 2ULL * 1024 * 1024 * 1024),
    make_upload_decision(true, ErrorCode::Ok),
    make_ack(42),
    make_transfer_cancel(),
  };
  for(const auto& message : messages) {
    LANTERN_EXPECT(round_trip(message) == message);
  }
  return true;
}

bool test_round_trip_at_control_cap() {
  Message message;
  message.type = MessageType::ListResponse;
  message.payload = lantern::test::random_bytes(kMaxControlPayload);
  LANTERN_EXPECT(round_trip(message) == message);

  message.payload.clear();
  message.type = MessageType::ListRequest;
  LANTERN_EXPECT(round_trip(message) == message);
  return true;
}

bool test_encode_rejects_oversize_control() {
  Message message;
  message.type = MessageType::DownloadRequest;
  message.payload.assign(kMaxControlPayload + 1, 'x');
  LANTERN_EXPECT(throws_protocol_error([&]{ encode_message(message); }));
  return true;
}

bool test_decode_rejects_forged_length_before_reading_body() {
  auto pipe_a = make_memory_pair();
  auto& a = pipe_a.first;
  auto& b = pipe_a.second;
  const std::uint32_t length = static_cast<std::uint32_t>(kMaxControlPayload + 2);
  std::uint8_t prefix[5] = {
    static_cast<std::uint8_t>(length >> 24), static_cast<std::uint8_t>(length >> 16),
    static_cast<std::uint8_t>(length >> 8), static_cast<std::uint8_t>(length),
    static_cast<std::uint8_t>(MessageType::ListResponse)
  };
  a->write_all(prefix, sizeof(prefix));
  LANTERN_EXPECT(throws_protocol_error([&]{ decode_message(*b); }));
  // only the prefix was consumed; the tag byte is still buffered
  LANTERN_EXPECT(b->inbound().size() == 1);

  auto pipe_c = make_memory_pair();
  auto& c = pipe_c.first;
  auto& d = pipe_c.second;
  std::uint8_t huge[4] = {0xFF, 0xFF, 0xFF, 0xFF};
  c->write_all(huge, sizeof(huge));
  LANTERN_EXPECT(throws_protocol_error([&]{ decode_message(*d); }));
  return true;
}

bool test_decode_rejects_empty_and_unknown_frames() {
  auto pipe_a = make_memory_pair();
  auto& a = pipe_a.first;
  auto& b = pipe_a.second;
  std::uint8_t empty[4] = {0, 0, 0, 0};
  a->write_all(empty, sizeof(empty));
  LANTERN_EXPECT(throws_protocol_error([&]{ decode_message(*b); }));

  auto pipe_c = make_memory_pair();
  auto& c = pipe_c.first;
  auto& d = pipe_c.second;
  std::uint8_t unknown[5] = {0, 0, 0, 1, 0xEE};
  c->write_all(unknown, sizeof(unknown));
  LANTERN_EXPECT(throws_protocol_error([&]{ decode_message(*d); }));
  return true;
}

bool test_short_read_is_truncation() {
  auto pipe_a = make_memory_pair();
  auto& a = pipe_a.first;
  auto& b = pipe_a.second;
  auto frame = encode_message(make_download_request("partial.bin"));
  a->write_all(frame.data(), frame.size() - 3);
  a->close();
  bool truncated = false;
  try {
    decode_message(*b);
  } catch(const TruncatedMessageError&) {
    truncated = true;
  }
  LANTERN_EXPECT(truncated);
  return true;
}

bool test_file_chunk_limits() {
  auto data = lantern::test::random_bytes(kMaxControlPayload + 10);
  auto chunk = make_file_chunk(data.data(), data.size());
  // chunks are exempt from the control cap when the caller allows them
  LANTERN_EXPECT(round_trip(chunk, kMaxChunkSize) == chunk);
  // but not with the control limit
  LANTERN_EXPECT(throws_protocol_error([&]{ round_trip(chunk, kMaxControlPayload); }));
  // and a large max_payload never admits an oversized control message
  auto pipe_a = make_memory_pair();
  auto& a = pipe_a.first;
  auto& b = pipe_a.second;
  auto frame = encode_message(chunk);
  frame[4] = static_cast<std::uint8_t>(MessageType::Error);
  a->write_all(frame.data(), frame.size());
  LANTERN_EXPECT(throws_protocol_error([&]{ decode_message(*b, kMaxChunkSize); }));
  return true;
}

bool test_payload_fields() {
  std::vector<RemoteFile> files = {{"a.txt", 1}, {"b b.bin", 1ULL << 40}, {"\xc3\xa9t\xc3\xa9.png", 0}};
  auto listing = parse_list_response(make_list_response(files));
  LANTERN_EXPECT(!listing.truncated);
  LANTERN_EXPECT(listing.files.size() == 3);
  LANTERN_EXPECT(listing.files[1].name == "b b.bin");
  LANTERN_EXPECT(listing.files[1].size == (1ULL << 40));

  auto announce = parse_upload_announce(make_upload_announce("x.iso", 99));
  LANTERN_EXPECT(announce.filename == "x.iso" && announce.size == 99);

  auto decision = parse_upload_decision(make_upload_decision(false, ErrorCode::Rejected));
  LANTERN_EXPECT(!decision.accepted && decision.reason == ErrorCode::Rejected);

  auto err = parse_error(make_error(ErrorCode::NotFound));
  LANTERN_EXPECT(err.code == ErrorCode::NotFound);
  LANTERN_EXPECT(err.category == describe(ErrorCode::NotFound));

  // wrong type and short payloads are protocol errors
  LANTERN_EXPECT(throws_protocol_error([]{ parse_ack(make_list_request()); }));
  Message short_ack;
  short_ack.type = MessageType::Ack;
  short_ack.payload = {0, 1};
  LANTERN_EXPECT(throws_protocol_error([&]{ parse_ack(short_ack); }));
  Message lying_string;
  lying_string.type = MessageType::DownloadRequest;
  lying_string.payload = {0, 0, 0, 50, 'a'};
  LANTERN_EXPECT(throws_protocol_error([&]{ parse_download_request(lying_string); }));
  return true;
}

bool test_list_response_truncates_at_cap() {
  std::vector<RemoteFile> files;
  for(int i = 0; i < 5000; ++i) {
    files.push_back(RemoteFile{"file-with-a-fairly-long-name-" + std::to_string(i) + ".dat",
                               static_cast<std::uint64_t>(i)});
  }
  auto message = make_list_response(files);
  LANTERN_EXPECT(message.payload.size() <= kMaxControlPayload);
  auto listing = parse_list_response(message);
  LANTERN_EXPECT(listing.truncated);
  LANTERN_EXPECT(!listing.files.empty() && listing.files.size() < files.size());
  LANTERN_EXPECT(listing.files.front().name == files.front().name);
  return true;
}

bool test_unknown_wire_error_code() {
  LANTERN_EXPECT(error_code_from_wire(200) == ErrorCode::InternalError);
  LANTERN_EXPECT(error_code_from_wire(9) == ErrorCode::ServerBusy);
  return true;
}

bool test_sanitize_rejects_unsafe_names() {
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("../../etc/passwd"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename(std::string("a\0b", 3)); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("CON"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("con.txt"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("Lpt9"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("dir\\..\\boot.ini"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename(""); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("."); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename("/"); }));
  LANTERN_EXPECT(throws_path_violation([]{ sanitize_filename(".x.lantern-part"); }));
  return true;
}

bool test_sanitize_keeps_base_name() {
  LANTERN_EXPECT(sanitize_filename("report.pdf") == "report.pdf");
  LANTERN_EXPECT(sanitize_filename("/tmp/photos/cat.jpg") == "cat.jpg");
  LANTERN_EXPECT(sanitize_filename("C:\\Users\\me\\notes.txt") == "notes.txt");
  LANTERN_EXPECT(sanitize_filename("CONSOLE.log") == "CONSOLE.log");
  LANTERN_EXPECT(sanitize_filename("COM10") == "COM10");
  LANTERN_EXPECT(sanitize_filename("..hidden") == "..hidden");
  auto staging = staging_path_for("/srv/share/a.bin", "1f2e3d4c");
  LANTERN_EXPECT(staging == std::filesystem::path("/srv/share/.a.bin.1f2e3d4c.lantern-part"));
  LANTERN_EXPECT(is_internal_name(staging.filename().string()));
  return true;
}

bool test_host_port_parsing() {
  HostPort out;
  std::string error;
  LANTERN_EXPECT(parse_host_port("2001:db8::1:6000", out, error));
  LANTERN_EXPECT(out.host == "2001:db8::1" && out.port == 6000);

  LANTERN_EXPECT(parse_host_port("[fe80::1]:7000", out, error));
  LANTERN_EXPECT(out.host == "fe80::1" && out.port == 7000);

  LANTERN_EXPECT(parse_host_port("192.168.1.20:5000", out, error));
  LANTERN_EXPECT(out.host == "192.168.1.20" && out.port == 5000);

  LANTERN_EXPECT(parse_host_port("laptop", out, error, std::uint16_t(5000)));
  LANTERN_EXPECT(out.host == "laptop" && out.port == 5000);

  error.clear();
  LANTERN_EXPECT(!parse_host_port("host:99999", out, error));
  LANTERN_EXPECT(error.find("out of range") != std::string::npos);

  error.clear();
  LANTERN_EXPECT(!parse_host_port("host:notaport", out, error));
  LANTERN_EXPECT(error.find("not a number") != std::string::npos);

  LANTERN_EXPECT(!parse_host_port("host:0", out, error));
  LANTERN_EXPECT(!parse_host_port("host:", out, error));
  LANTERN_EXPECT(!parse_host_port(":5000", out, error));
  LANTERN_EXPECT(!parse_host_port("laptop", out, error));
  LANTERN_EXPECT(!parse_host_port("[::1", out, error));
  return true;
}

} // namespace

int main(int argc, char** argv) {
  lantern::test::LogCapture logs;
  std::vector<lantern::test::TestCase> tests = {
    {"round_trip_control_messages", test_round_trip_control_messages},
    {"round_trip_at_control_cap", test_round_trip_at_control_cap},
    {"encode_rejects_oversize_control", test_encode_rejects_oversize_control},
    {"decode_rejects_forged_length_before_reading_body", test_decode_rejects_forged_length_before_reading_body},
    {"decode_rejects_empty_and_unknown_frames", test_decode_rejects_empty_and_unknown_frames},
    {"short_read_is_truncation", test_short_read_is_truncation},
    {"file_chunk_limits", test_file_chunk_limits},
    {"payload_fields", test_payload_fields},
    {"list_response_truncates_at_cap", test_list_response_truncates_at_cap},
    {"unknown_wire_error_code", test_unknown_wire_error_code},
    {"sanitize_rejects_unsafe_names", test_sanitize_rejects_unsafe_names},
    {"sanitize_keeps_base_name", test_sanitize_keeps_base_name},
    {"host_port_parsing", test_host_port_parsing},
  };
  return lantern::test::run_suite("protocol", tests, logs, argc, argv);
}
