#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  return parse(args, settings, error);
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    if(is_option_token(token)) {
      std::string key = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
      std::optional<std::string> inline_value;
      if(auto eq = key.find('='); eq != std::string::npos) {
        inline_value = key.substr(eq + 1);
        key = key.substr(0, eq);
      }
      auto resolved = settings.resolve_key(key);
      if(!resolved) {
        error = "unknown option '" + token + "'";
        return false;
      }

      std::string value;
      if(inline_value) {
        value = *inline_value;
      } else if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          error = "missing value for option '" + token + "'";
          return false;
        }
        value = args[++i];
      }

      std::string set_error;
      if(!settings.set_from_string(*resolved, value, set_error)) {
        error = "invalid value for '" + token + "': " + set_error;
        return false;
      }
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      error = "unexpected argument '" + token + "'";
      return false;
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string set_error;
    if(!settings.set_from_string(spec.key, token, set_error)) {
      error = "invalid " + spec.key + " '" + token + "': " + set_error;
      return false;
    }
  }
  return true;
}

std::vector<std::string> CommandLineParser::usage_lines(const SettingsManager& settings) const {
  std::vector<std::string> lines;
  std::string cmd = process_name_;
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  lines.push_back(process_name_ + " - LAN peer discovery and file sharing");
  lines.push_back("Usage:");
  lines.push_back("  " + cmd + " [options]");
  lines.push_back("");
  lines.push_back("Options:");
  for(const auto& row : settings.rows()) {
    std::string hint = (row.type == "bool") ? "[true|false]" : "<" + row.type + ">";
    std::string aliases;
    for(std::size_t i = 0; i < row.aliases.size(); ++i) {
      aliases += (i == 0 ? " (alias: -" : ", -") + row.aliases[i];
    }
    if(!aliases.empty()) aliases += ")";
    lines.push_back(fmt::format("  --{:<22} {:<13} {}{} (default: {})",
                                row.key, hint, row.description, aliases,
                                row.default_text.empty() ? "\"\"" : row.default_text));
  }
  lines.push_back("");
  lines.push_back("Settings file: " + SettingsManager::default_settings_path().string());
  return lines;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  for(const auto& line : usage_lines(settings)) {
    print_out(nullptr, "{}", line);
  }
}
