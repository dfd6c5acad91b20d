#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "transfer_engine.hpp"

class LanternNode;
class Logger;

// Line-oriented front end over a LanternNode. run() reads commands with GNU
// readline; execute() handles one line and is what tests drive.
class LanternShell {
public:
  explicit LanternShell(LanternNode& node, std::shared_ptr<Logger> output = nullptr);
  ~LanternShell();

  void run();
  // Returns false once the user asked to quit.
  bool execute(const std::string& line);
  void stop() { running_ = false; }

  void print_help();

  std::shared_ptr<Logger> output() const { return out_; }

private:
  std::optional<std::string> read_command_line(const char* prompt);

  void cmd_peers();
  void cmd_list(const std::string& args);
  void cmd_download(const std::string& args);
  void cmd_upload(const std::string& args);
  void cmd_myfiles();
  void cmd_pending();
  void cmd_decide(const std::string& args, bool accept);

  bool resolve_target(const std::string& token, std::string& host, std::uint16_t& port);
  ProgressCallback progress_meter(const std::string& label);

  LanternNode& node_;
  std::shared_ptr<Logger> out_;
  std::atomic<bool> running_{true};
};
