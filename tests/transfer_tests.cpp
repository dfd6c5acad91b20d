#include "framing.hpp"
#include "path_safety.hpp"
#include "protocol.hpp"
#include "test_runner_utils.hpp"
#include "transfer_engine.hpp"
#include "utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using lantern::test::TempDir;
using lantern::test::make_memory_pair;

std::shared_ptr<Logger> g_logger = std::make_shared<Logger>("transfer");

bool no_staging_left(const fs::path& dir) {
  std::error_code ec;
  for(auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if(is_internal_name(it->path().filename().string())) return false;
  }
  return true;
}

bool test_transfer_preserves_bytes() {
  TempDir src("lantern-xfer-src");
  TempDir dst("lantern-xfer-dst");
  // not a multiple of the chunk size, so the final chunk is short
  auto data = lantern::test::random_bytes(300 * 1024 + 17, 11);
  lantern::test::write_file(src / "payload.bin", data);

  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;

  auto receiving = std::async(std::launch::async, [&]{
    return recv_file(*receiver, dst / "payload.bin", data.size(), nullptr,
                     std::make_shared<CancelToken>(), g_logger.get());
  });
  auto sent = send_file(*sender, src / "payload.bin", 64 * 1024, nullptr,
                        std::make_shared<CancelToken>(), g_logger.get());
  auto received = receiving.get();

  LANTERN_EXPECT(sent.ok());
  LANTERN_EXPECT(received.ok());
  LANTERN_EXPECT(sent.bytes_moved == data.size());
  LANTERN_EXPECT(received.bytes_moved == data.size());
  LANTERN_EXPECT(lantern::test::read_file(dst / "payload.bin") == data);
  LANTERN_EXPECT(no_staging_left(dst.path()));
  return true;
}

bool test_empty_file_transfer() {
  TempDir src("lantern-xfer-src");
  TempDir dst("lantern-xfer-dst");
  lantern::test::write_file(src / "empty.txt", {});

  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto receiving = std::async(std::launch::async, [&]{
    return recv_file(*receiver, dst / "empty.txt", 0, nullptr, nullptr);
  });
  auto sent = send_file(*sender, src / "empty.txt", 0, nullptr, nullptr);
  auto received = receiving.get();
  LANTERN_EXPECT(sent.ok() && received.ok());
  LANTERN_EXPECT(fs::exists(dst / "empty.txt"));
  LANTERN_EXPECT(fs::file_size(dst / "empty.txt") == 0);
  return true;
}

bool test_progress_is_monotonic() {
  TempDir src("lantern-xfer-src");
  TempDir dst("lantern-xfer-dst");
  auto data = lantern::test::random_bytes(10 * 4096 + 1);
  lantern::test::write_file(src / "p.bin", data);

  std::vector<std::uint64_t> sender_progress;
  std::vector<std::uint64_t> receiver_progress;
  std::uint64_t reported_total = 0;

  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto receiving = std::async(std::launch::async, [&]{
    return recv_file(*receiver, dst / "p.bin", data.size(),
                     [&](std::uint64_t moved, std::uint64_t){ receiver_progress.push_back(moved); },
                     nullptr);
  });
  auto sent = send_file(*sender, src / "p.bin", 4096,
                        [&](std::uint64_t moved, std::uint64_t total) {
                          sender_progress.push_back(moved);
                          reported_total = total;
                        },
                        nullptr);
  auto received = receiving.get();
  LANTERN_EXPECT(sent.ok() && received.ok());
  LANTERN_EXPECT(reported_total == data.size());
  LANTERN_EXPECT(sender_progress.size() == 11);
  LANTERN_EXPECT(receiver_progress.size() == 11);
  LANTERN_EXPECT(std::is_sorted(sender_progress.begin(), sender_progress.end()));
  LANTERN_EXPECT(sender_progress.back() == data.size());
  LANTERN_EXPECT(receiver_progress == sender_progress);
  return true;
}

bool test_sender_cancel_leaves_nothing() {
  TempDir src("lantern-xfer-src");
  auto data = lantern::test::random_bytes(8 * 1024);
  lantern::test::write_file(src / "c.bin", data);

  // before the first chunk, mid-stream, and after the last chunk
  const std::vector<std::uint64_t> boundaries = {0, 3 * 1024, data.size()};
  for(auto boundary : boundaries) {
    TempDir dst("lantern-xfer-dst");
    auto cancel = std::make_shared<CancelToken>();
    if(boundary == 0) cancel->request_cancel();

    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    auto receiving = std::async(std::launch::async, [&]{
      return recv_file(*receiver, dst / "c.bin", data.size(), nullptr, nullptr);
    });
    auto sent = send_file(*sender, src / "c.bin", 1024,
                          [&](std::uint64_t moved, std::uint64_t) {
                            if(moved >= boundary) cancel->request_cancel();
                          },
                          cancel);
    auto received = receiving.get();
    LANTERN_EXPECT(sent.cancelled());
    LANTERN_EXPECT(sent.bytes_moved == boundary);
    LANTERN_EXPECT(received.cancelled());
    LANTERN_EXPECT(received.bytes_moved == boundary);
    LANTERN_EXPECT(!fs::exists(dst / "c.bin"));
    LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 0);
  }
  return true;
}

bool test_receiver_cancel_leaves_nothing() {
  TempDir src("lantern-xfer-src");
  auto data = lantern::test::random_bytes(8 * 1024);
  lantern::test::write_file(src / "r.bin", data);

  const std::vector<std::uint64_t> boundaries = {0, 2 * 1024, data.size()};
  for(auto boundary : boundaries) {
    TempDir dst("lantern-xfer-dst");
    auto cancel = std::make_shared<CancelToken>();
    if(boundary == 0) cancel->request_cancel();

    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    auto receiving = std::async(std::launch::async, [&]{
      return recv_file(*receiver, dst / "r.bin", data.size(),
                       [&](std::uint64_t moved, std::uint64_t) {
                         if(moved >= boundary) cancel->request_cancel();
                       },
                       cancel);
    });
    auto sent = send_file(*sender, src / "r.bin", 1024, nullptr, nullptr);
    auto received = receiving.get();
    LANTERN_EXPECT(received.cancelled());
    LANTERN_EXPECT(received.bytes_moved == boundary);
    // the sender learns about it from the reply to FILE_END at the latest
    LANTERN_EXPECT(sent.cancelled());
    LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 0);
  }
  return true;
}

bool test_sender_reads_receiver_stop_before_writing() {
  TempDir src("lantern-xfer-src");
  auto data = lantern::test::random_bytes(8 * 1024);
  lantern::test::write_file(src / "s.bin", data);
  {
    // receiver cancelled and hung up; further writes would fail
    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    write_message(*receiver, make_transfer_cancel());
    receiver->close();
    auto sent = send_file(*sender, src / "s.bin", 1024, nullptr, nullptr);
    LANTERN_EXPECT(sent.cancelled());
    LANTERN_EXPECT(sent.bytes_moved == 0);
  }
  {
    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    write_message(*receiver, make_error(ErrorCode::ProtocolError));
    receiver->close();
    auto sent = send_file(*sender, src / "s.bin", 1024, nullptr, nullptr);
    LANTERN_EXPECT(sent.code == ErrorCode::ProtocolError);
    LANTERN_EXPECT(sent.bytes_moved == 0);
  }
  return true;
}

bool test_concurrent_receives_of_one_name() {
  TempDir dst("lantern-xfer-dst");
  auto first_data = lantern::test::random_bytes(4096, 1);
  auto second_data = lantern::test::random_bytes(2048, 2);

  auto first_pipe = make_memory_pair();
  auto second_pipe = make_memory_pair();
  auto& first_sender = first_pipe.first;
  auto& first_receiver = first_pipe.second;
  auto& second_sender = second_pipe.first;
  auto& second_receiver = second_pipe.second;
  write_message(*first_sender, make_file_chunk(first_data.data(), first_data.size()));
  write_message(*second_sender, make_file_chunk(second_data.data(), second_data.size()));

  std::atomic<bool> first_written{false};
  std::atomic<bool> second_written{false};
  auto first_receiving = std::async(std::launch::async, [&]{
    return recv_file(*first_receiver, dst / "report.pdf", first_data.size(),
                     [&](std::uint64_t moved, std::uint64_t total){ if(moved == total) first_written = true; },
                     nullptr);
  });
  auto second_receiving = std::async(std::launch::async, [&]{
    return recv_file(*second_receiver, dst / "report.pdf", second_data.size(),
                     [&](std::uint64_t moved, std::uint64_t total){ if(moved == total) second_written = true; },
                     nullptr);
  });

  LANTERN_EXPECT(lantern::test::wait_for_condition([&]{ return first_written && second_written; },
                                                   std::chrono::seconds(3)));
  // each receive stages into its own file
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 2);
  LANTERN_EXPECT(!no_staging_left(dst.path()));

  Sha256 first_digest;
  first_digest.update(first_data.data(), first_data.size());
  write_message(*first_sender, make_file_end(first_digest.final_hex()));
  auto first = first_receiving.get();
  LANTERN_EXPECT(first.ok());
  LANTERN_EXPECT(lantern::test::read_file(dst / "report.pdf") == first_data);

  Sha256 second_digest;
  second_digest.update(second_data.data(), second_data.size());
  write_message(*second_sender, make_file_end(second_digest.final_hex()));
  auto second = second_receiving.get();
  LANTERN_EXPECT(second.ok());
  // the later commit replaces the file whole
  LANTERN_EXPECT(lantern::test::read_file(dst / "report.pdf") == second_data);
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 1);
  LANTERN_EXPECT(no_staging_left(dst.path()));

  LANTERN_EXPECT(decode_message(*first_sender).type == MessageType::Ack);
  LANTERN_EXPECT(decode_message(*second_sender).type == MessageType::Ack);
  return true;
}

bool test_lost_ack_keeps_verified_file() {
  TempDir dst("lantern-xfer-dst");
  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto data = lantern::test::random_bytes(1000);
  Sha256 digest;
  digest.update(data.data(), data.size());
  write_message(*sender, make_file_chunk(data.data(), data.size()));
  write_message(*sender, make_file_end(digest.final_hex()));
  // the sender is gone by the time the ACK goes out
  sender->inbound().close();

  auto result = recv_file(*receiver, dst / "kept.bin", data.size(), nullptr, nullptr, g_logger.get());
  LANTERN_EXPECT(result.ok());
  LANTERN_EXPECT(result.bytes_moved == data.size());
  LANTERN_EXPECT(!result.message.empty());
  LANTERN_EXPECT(lantern::test::read_file(dst / "kept.bin") == data);
  LANTERN_EXPECT(no_staging_left(dst.path()));
  return true;
}

bool test_size_cap_writes_nothing() {
  TempDir dst("lantern-xfer-dst");
  auto pipe = make_memory_pair(std::chrono::milliseconds(200));
  auto& receiver = pipe.second;
  auto result = recv_file(*receiver, dst / "huge.iso", kMaxTransferBytes + 1, nullptr, nullptr);
  LANTERN_EXPECT(result.code == ErrorCode::SizeLimitExceeded);
  LANTERN_EXPECT(result.bytes_moved == 0);
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 0);
  // nothing was read from the stream either
  LANTERN_EXPECT(receiver->inbound().size() == 0);
  return true;
}

bool test_truncated_stream_cleans_up() {
  TempDir dst("lantern-xfer-dst");
  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto data = lantern::test::random_bytes(4096);
  write_message(*sender, make_file_chunk(data.data(), data.size()));
  sender->close();

  auto result = recv_file(*receiver, dst / "cut.bin", 8192, nullptr, nullptr);
  LANTERN_EXPECT(result.code == ErrorCode::TruncatedMessage);
  LANTERN_EXPECT(result.bytes_moved == 4096);
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 0);
  return true;
}

bool test_digest_mismatch_rejected() {
  TempDir dst("lantern-xfer-dst");
  lantern::test::write_file(dst / "keep.txt", {'o', 'l', 'd'});

  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto data = lantern::test::random_bytes(1000);
  write_message(*sender, make_file_chunk(data.data(), data.size()));
  write_message(*sender, make_file_end(sha256_hex("something else entirely")));

  auto result = recv_file(*receiver, dst / "keep.txt", data.size(), nullptr, nullptr);
  LANTERN_EXPECT(result.code == ErrorCode::IntegrityError);
  // the existing file is untouched and no staging file remains
  LANTERN_EXPECT(lantern::test::read_file(dst / "keep.txt") == std::vector<std::uint8_t>({'o', 'l', 'd'}));
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 1);

  auto reply = decode_message(*sender);
  LANTERN_EXPECT(reply.type == MessageType::Error);
  LANTERN_EXPECT(parse_error(reply).code == ErrorCode::IntegrityError);
  return true;
}

bool test_overrun_and_early_end_are_protocol_errors() {
  TempDir dst("lantern-xfer-dst");
  {
    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    auto data = lantern::test::random_bytes(20);
    write_message(*sender, make_file_chunk(data.data(), data.size()));
    auto result = recv_file(*receiver, dst / "over.bin", 10, nullptr, nullptr);
    LANTERN_EXPECT(result.code == ErrorCode::ProtocolError);
    auto reply = decode_message(*sender);
    LANTERN_EXPECT(reply.type == MessageType::Error);
    LANTERN_EXPECT(parse_error(reply).code == ErrorCode::ProtocolError);
  }
  {
    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    auto data = lantern::test::random_bytes(5);
    write_message(*sender, make_file_chunk(data.data(), data.size()));
    write_message(*sender, make_file_end(sha256_hex("abcde")));
    auto result = recv_file(*receiver, dst / "early.bin", 10, nullptr, nullptr);
    LANTERN_EXPECT(result.code == ErrorCode::ProtocolError);
  }
  {
    // a chunk bigger than the negotiated limit never reaches the disk
    auto pipe = make_memory_pair();
    auto& sender = pipe.first;
    auto& receiver = pipe.second;
    auto data = lantern::test::random_bytes(2048);
    write_message(*sender, make_file_chunk(data.data(), data.size()));
    auto result = recv_file(*receiver, dst / "big.bin", 4096, nullptr, nullptr, nullptr, 1024);
    LANTERN_EXPECT(result.code == ErrorCode::ProtocolError);
    LANTERN_EXPECT(result.bytes_moved == 0);
  }
  LANTERN_EXPECT(lantern::test::count_entries(dst.path()) == 0);
  return true;
}

bool test_missing_source_is_io_error() {
  TempDir src("lantern-xfer-src");
  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  auto result = send_file(*sender, src / "absent.bin", 0, nullptr, nullptr);
  LANTERN_EXPECT(result.code == ErrorCode::IoError);
  LANTERN_EXPECT(receiver->inbound().size() == 0);
  return true;
}

bool test_wrong_ack_count_is_protocol_error() {
  TempDir src("lantern-xfer-src");
  // empty, so the queued reply is first read after FILE_END
  lantern::test::write_file(src / "a.bin", {});
  auto pipe = make_memory_pair();
  auto& sender = pipe.first;
  auto& receiver = pipe.second;
  write_message(*receiver, make_ack(5));
  auto result = send_file(*sender, src / "a.bin", 0, nullptr, nullptr);
  LANTERN_EXPECT(result.code == ErrorCode::ProtocolError);
  return true;
}

bool test_chunk_size_clamp() {
  LANTERN_EXPECT(clamp_chunk_size(0) == kDefaultChunkSize);
  LANTERN_EXPECT(clamp_chunk_size(4096) == 4096);
  LANTERN_EXPECT(clamp_chunk_size(kMaxChunkSize * 4) == kMaxChunkSize);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  lantern::test::LogCapture logs;
  logs.attach(g_logger);
  std::vector<lantern::test::TestCase> tests = {
    {"transfer_preserves_bytes", test_transfer_preserves_bytes},
    {"empty_file_transfer", test_empty_file_transfer},
    {"progress_is_monotonic", test_progress_is_monotonic},
    {"sender_cancel_leaves_nothing", test_sender_cancel_leaves_nothing},
    {"receiver_cancel_leaves_nothing", test_receiver_cancel_leaves_nothing},
    {"sender_reads_receiver_stop_before_writing", test_sender_reads_receiver_stop_before_writing},
    {"concurrent_receives_of_one_name", test_concurrent_receives_of_one_name},
    {"lost_ack_keeps_verified_file", test_lost_ack_keeps_verified_file},
    {"size_cap_writes_nothing", test_size_cap_writes_nothing},
    {"truncated_stream_cleans_up", test_truncated_stream_cleans_up},
    {"digest_mismatch_rejected", test_digest_mismatch_rejected},
    {"overrun_and_early_end_are_protocol_errors", test_overrun_and_early_end_are_protocol_errors},
    {"missing_source_is_io_error", test_missing_source_is_io_error},
    {"wrong_ack_count_is_protocol_error", test_wrong_ack_count_is_protocol_error},
    {"chunk_size_clamp", test_chunk_size_clamp},
  };
  return lantern::test::run_suite("transfer", tests, logs, argc, argv);
}
