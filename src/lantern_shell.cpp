#include "lantern_shell.hpp"

#include <readline/history.h>
#include <readline/readline.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

#include "address.hpp"
#include "lantern_node.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {

void trim(std::string& s) {
  auto start = s.find_first_not_of(" \t");
  if(start == std::string::npos) {
    s.clear();
    return;
  }
  auto end = s.find_last_not_of(" \t");
  s = s.substr(start, end - start + 1);
}

// First word of `text`; the remainder (trimmed) goes to `rest`.
std::string split_first(const std::string& text, std::string& rest) {
  std::string copy = text;
  trim(copy);
  auto space = copy.find_first_of(" \t");
  if(space == std::string::npos) {
    rest.clear();
    return copy;
  }
  rest = copy.substr(space + 1);
  trim(rest);
  return copy.substr(0, space);
}

std::string meter(std::uint64_t moved, std::uint64_t total, std::size_t width) {
  std::size_t filled = total == 0 ? width : static_cast<std::size_t>((moved * width) / total);
  return std::string(filled, '#') + std::string(width - filled, '.');
}

} // namespace

LanternShell::LanternShell(LanternNode& node, std::shared_ptr<Logger> output)
  : node_(node),
    out_(output ? std::move(output) : std::make_shared<Logger>("shell")) {
  node_.set_upload_consent_handler([this](const UploadConsentRequestPtr& request){
    out_->print("");
    out_->print("Incoming upload #{}: '{}' ({}) from {}", request->id(), request->filename(),
                format_size(request->size()), request->sender_address());
    out_->print("Type 'accept {0}' or 'reject {0}'.", request->id());
  });
  node_.set_transfer_observer([this](const FileServer::TransferEvent& event){
    if(!event.incoming) return;
    if(event.finished) {
      if(event.code == ErrorCode::Ok) {
        out_->print("Received '{}' ({}) from {}", event.filename,
                    format_size(event.bytes_moved), event.peer);
      } else {
        out_->print_err("Receiving '{}' from {} failed: {}", event.filename, event.peer,
                        describe(event.code));
      }
      return;
    }
    std::cout << "\rReceiving " << event.filename << " [" << meter(event.bytes_moved, event.total_bytes, 30)
              << "] " << format_size(event.bytes_moved) << " / " << format_size(event.total_bytes)
              << "\x1b[K";
    if(event.bytes_moved == event.total_bytes) std::cout << "\n";
    std::cout.flush();
  });
}

LanternShell::~LanternShell() {
  node_.set_upload_consent_handler(nullptr);
  node_.set_transfer_observer(nullptr);
}

std::optional<std::string> LanternShell::read_command_line(const char* prompt) {
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  std::free(line);
  return result;
}

void LanternShell::run() {
  out_->print("Lantern started as '{}' [tcp {}, udp {}]", node_.display_name(),
              node_.tcp_port(), node_.udp_port());
  out_->print("Shared directory: {}", node_.shared_dir().string());
  out_->print("Type 'help' for available commands.");
  while(running_) {
    auto line = read_command_line("lantern> ");
    if(!line) break;
    if(!execute(*line)) break;
  }
}

bool LanternShell::execute(const std::string& line) {
  std::string args;
  std::string cmd = to_lower_copy(split_first(line, args));
  if(cmd.empty()) return true;

  if(cmd == "quit" || cmd == "exit") {
    out_->print("Shutting down...");
    running_ = false;
    return false;
  } else if(cmd == "help" || cmd == "?") {
    print_help();
  } else if(cmd == "peers") {
    cmd_peers();
  } else if(cmd == "list" || cmd == "ls") {
    cmd_list(args);
  } else if(cmd == "download" || cmd == "get") {
    cmd_download(args);
  } else if(cmd == "upload" || cmd == "put") {
    cmd_upload(args);
  } else if(cmd == "myfiles") {
    cmd_myfiles();
  } else if(cmd == "pending") {
    cmd_pending();
  } else if(cmd == "accept") {
    cmd_decide(args, true);
  } else if(cmd == "reject") {
    cmd_decide(args, false);
  } else {
    out_->print_err("Unknown command: {} (try 'help')", cmd);
  }
  return true;
}

void LanternShell::print_help() {
  out_->print("Lantern commands:");
  out_->print("  peers                            Show discovered peers on the LAN");
  out_->print("  list <host[:port]>               List files on a remote peer");
  out_->print("  download <host[:port]> <file>    Download a file from a peer");
  out_->print("  upload <host[:port]> <path>      Upload a local file to a peer");
  out_->print("  myfiles                          List your own shared files");
  out_->print("  pending                          Show uploads waiting for a decision");
  out_->print("  accept <id> / reject <id>        Decide on an incoming upload");
  out_->print("  help                             Show this help message");
  out_->print("  quit                             Shut down this peer");
}

bool LanternShell::resolve_target(const std::string& token, std::string& host, std::uint16_t& port) {
  if(token.empty()) {
    out_->print_err("Missing target: expected <host[:port]>");
    return false;
  }
  HostPort target;
  std::string error;
  if(!parse_host_port(token, target, error, node_.default_peer_port())) {
    out_->print_err("Invalid target '{}': {}", token, error);
    return false;
  }
  host = target.host;
  port = target.port;
  return true;
}

ProgressCallback LanternShell::progress_meter(const std::string& label) {
  return [label](std::uint64_t moved, std::uint64_t total){
    std::cout << "\r" << label << " [" << meter(moved, total, 30) << "] "
              << format_size(moved) << " / " << format_size(total) << "\x1b[K";
    if(moved == total) std::cout << "\n";
    std::cout.flush();
  };
}

void LanternShell::cmd_peers() {
  auto peers = node_.list_peers();
  if(peers.empty()) {
    out_->print("No peers discovered yet (waiting for beacons...).");
    return;
  }
  out_->print("{:<24} {:<40} {:>6}", "Name", "Host", "Port");
  out_->print("{:<24} {:<40} {:>6}", std::string(24, '-'), std::string(40, '-'), "------");
  for(const auto& peer : peers) {
    out_->print("{:<24} {:<40} {:>6}", peer.display_name, peer.host, peer.port);
  }
}

void LanternShell::cmd_list(const std::string& args) {
  std::string host;
  std::uint16_t port = 0;
  if(!resolve_target(args, host, port)) return;
  auto result = node_.list_remote_files(host, port);
  if(!result.ok()) {
    out_->print_err("Could not list {}: {} ({})", HostPort{host, port}.to_string(),
                    describe(result.code), result.message);
    return;
  }
  if(result.files.empty()) {
    out_->print("(no shared files)");
    return;
  }
  out_->print("{:<40} {:>12}", "Filename", "Size");
  out_->print("{:<40} {:>12}", std::string(40, '-'), std::string(12, '-'));
  for(const auto& file : result.files) {
    out_->print("{:<40} {:>12}", file.name, format_size(file.size));
  }
  if(result.truncated) {
    out_->print("(listing truncated)");
  }
}

void LanternShell::cmd_download(const std::string& args) {
  std::string filename;
  std::string target = split_first(args, filename);
  if(filename.empty()) {
    out_->print_err("Usage: download <host[:port]> <file>");
    return;
  }
  std::string host;
  std::uint16_t port = 0;
  if(!resolve_target(target, host, port)) return;

  auto result = node_.download_file(host, port, filename, progress_meter("Downloading " + filename));
  if(result.ok()) {
    out_->print("Saved {} ({})", result.path.string(), format_size(result.bytes_moved));
  } else {
    out_->print_err("Download of '{}' failed: {} ({})", filename, describe(result.code), result.message);
  }
}

void LanternShell::cmd_upload(const std::string& args) {
  std::string path;
  std::string target = split_first(args, path);
  if(path.empty()) {
    out_->print_err("Usage: upload <host[:port]> <path>");
    return;
  }
  std::string host;
  std::uint16_t port = 0;
  if(!resolve_target(target, host, port)) return;

  out_->print("Waiting for {} to accept '{}'...", HostPort{host, port}.to_string(), path);
  auto result = node_.upload_file(host, port, path, progress_meter("Uploading " + path));
  if(result.ok()) {
    out_->print("Uploaded '{}' ({})", path, format_size(result.bytes_moved));
  } else {
    out_->print_err("Upload of '{}' failed: {} ({})", path, describe(result.code), result.message);
  }
}

void LanternShell::cmd_myfiles() {
  auto files = node_.list_local_files();
  if(files.empty()) {
    out_->print("(no files in {})", node_.shared_dir().string());
    return;
  }
  out_->print("{:<40} {:>12}", "Filename", "Size");
  out_->print("{:<40} {:>12}", std::string(40, '-'), std::string(12, '-'));
  for(const auto& file : files) {
    out_->print("{:<40} {:>12}", file.name, format_size(file.size));
  }
}

void LanternShell::cmd_pending() {
  auto pending = node_.pending_uploads();
  if(pending.empty()) {
    out_->print("No uploads waiting for a decision.");
    return;
  }
  auto now = UploadConsentRequest::Clock::now();
  for(const auto& request : pending) {
    auto left = std::chrono::duration_cast<std::chrono::seconds>(request->deadline() - now).count();
    out_->print("#{:<4} {:<32} {:>12}  from {:<20} {}s left", request->id(), request->filename(),
                format_size(request->size()), request->sender_address(), left > 0 ? left : 0);
  }
}

void LanternShell::cmd_decide(const std::string& args, bool accept) {
  std::uint64_t id = 0;
  std::istringstream iss(args);
  if(!(iss >> id)) {
    out_->print_err("Usage: {} <id>", accept ? "accept" : "reject");
    return;
  }
  if(!node_.resolve_upload(id, accept)) {
    out_->print_err("No pending upload #{}", id);
    return;
  }
  out_->print("Upload #{} {}", id, accept ? "accepted" : "rejected");
}
