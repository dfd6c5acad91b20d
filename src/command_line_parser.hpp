#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Applies argv on top of a SettingsManager: "--key value", "--key=value",
// "-alias value", bare bool flags, and positional arguments mapped to keys.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "lantern",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","tcp_port"}},
                      {{"index",1},{"key","display_name"}}
                    }));

  // Returns false with `error` describing the first bad argument.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;

  std::vector<std::string> usage_lines(const SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};
