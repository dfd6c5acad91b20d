#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// key, aliases, type, default, optional min/max for ints, description.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","tcp_port"},             {"aliases", {"port","p"}},        {"type","int"},    {"default",5000},    {"min",0}, {"max",65535},    {"description","TCP port of the file server (0 = ephemeral)"}},
  {{"key","udp_port"},             {"aliases", {"up"}},              {"type","int"},    {"default",5001},    {"min",0}, {"max",65535},    {"description","UDP port for discovery beacons"}},
  {{"key","bind_ip"},              {"aliases", {"ip"}},              {"type","string"}, {"default","0.0.0.0"},                            {"description","IPv4 address to bind both sockets to"}},
  {{"key","display_name"},         {"aliases", {"name","n"}},        {"type","string"}, {"default",""},                                   {"description","Name announced to peers (hostname when empty)"}},
  {{"key","shared_dir"},           {"aliases", {"dir","d"}},         {"type","string"}, {"default",""},                                   {"description","Shared directory (XDG data dir when empty)"}},
  {{"key","chunk_size"},           {"aliases", {"chunk"}},           {"type","int"},    {"default",65536},   {"min",1024}, {"max",1048576}, {"description","Bytes per FILE_CHUNK message"}},
  {{"key","beacon_interval_s"},    {"aliases", {"interval"}},        {"type","int"},    {"default",5},       {"min",1}, {"max",3600},     {"description","Seconds between discovery beacons"}},
  {{"key","peer_timeout_s"},       {"aliases", {"staleness"}},       {"type","int"},    {"default",15},      {"min",1}, {"max",86400},    {"description","Seconds without a beacon before a peer is dropped"}},
  {{"key","connect_timeout_ms"},   {"aliases", {"ct"}},              {"type","int"},    {"default",10000},   {"min",1}, {"max",600000},   {"description","TCP connect timeout"}},
  {{"key","io_timeout_ms"},        {"aliases", {"iot"}},             {"type","int"},    {"default",30000},   {"min",1}, {"max",3600000},  {"description","Per-read/write socket timeout"}},
  {{"key","consent_timeout_s"},    {"aliases", {"consent"}},         {"type","int"},    {"default",60},      {"min",1}, {"max",3600},     {"description","Seconds to decide on an incoming upload"}},
  {{"key","max_connections"},      {"aliases", {"maxconn"}},         {"type","int"},    {"default",50},      {"min",1}, {"max",1024},     {"description","Concurrent connections served before refusing"}},
  {{"key","large_transfer_bytes"}, {"aliases", {"large"}},           {"type","int"},    {"default",1048576}, {"min",0}, {"max",2147483647}, {"description","Incoming size that gets live progress output"}},
  {{"key","verbose"},              {"aliases", {"v"}},               {"type","bool"},   {"default",false},                                {"description","Enable debug logging"}},
  {{"key","log_file"},             {"aliases", {"log"}},             {"type","string"}, {"default",""},                                   {"description","Also write the log to this file"}},
  {{"key","help"},                 {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},                                {"description","Show command line help and exit"}}
});

// Typed settings backed by a JSON document. Values come from the built-in
// defaults, then an optional read-only settings file, then the command line.
class SettingsManager {
public:
  struct Row {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    std::string default_text;
    std::string description;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // A missing file is not an error. Invalid entries are skipped and reported
  // through `errors`; an unparsable file returns false.
  bool load_from_file(const std::filesystem::path& path, std::vector<std::string>& errors);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::vector<Row> rows() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  nlohmann::json get_json() const { return settings_; }

  static std::filesystem::path default_settings_path();
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min;
    std::optional<long long> max;
    std::string description;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;
  std::string default_to_string(const SettingSpec& spec) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    spec.description = entry.value("description", "");
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::vector<SettingsManager::Row> SettingsManager::rows() const {
  std::vector<Row> out;
  for(const auto& spec : setting_specs_) {
    out.push_back(Row{spec.key, spec.aliases, spec.type, default_to_string(spec), spec.description});
  }
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::filesystem::path SettingsManager::default_settings_path() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "lantern" / "settings.json";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "lantern" / "settings.json";
  }
  return {};
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path,
                                            std::vector<std::string>& errors) {
  if(path.empty()) return true;
  std::error_code ec;
  if(!std::filesystem::exists(path, ec)) return true;
  std::ifstream in(path);
  if(!in) {
    errors.push_back("cannot open " + path.string());
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    errors.push_back("cannot parse " + path.string() + ": " + e.what());
    return false;
  }
  if(!doc.is_object()) {
    errors.push_back(path.string() + " must contain a JSON object");
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      errors.push_back("unknown setting '" + item.key() + "' in " + path.string());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      errors.push_back("ignoring '" + item.key() + "': " + error);
    }
  }
  return true;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto number = value.get<long long>();
    if((spec.min && number < *spec.min) || (spec.max && number > *spec.max)) {
      error = "must be between " + std::to_string(spec.min.value_or(0)) + " and " +
              std::to_string(spec.max.value_or(number));
      return false;
    }
    settings_[spec.key] = number;
    return true;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t used = 0;
      long long number = std::stoll(clean, &used);
      if(used != clean.size()) {
        error = "'" + clean + "' is not an integer";
        return {};
      }
      return number;
    } catch(const std::exception&) {
      error = "'" + clean + "' is not an integer";
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting '" + key + "'";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting '" + key + "'";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::string SettingsManager::default_to_string(const SettingSpec& spec) const {
  if(spec.type == "bool") {
    return spec.default_value.get<bool>() ? "true" : "false";
  }
  if(spec.default_value.is_string()) {
    return spec.default_value.get<std::string>();
  }
  return spec.default_value.dump();
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
