#include "path_safety.hpp"

#include <array>
#include <cctype>

#include "errors.hpp"
#include "utils.hpp"

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool is_reserved_device_name(const std::string& name) {
  // the device name is everything before the first dot
  std::string stem = to_lower_copy(name.substr(0, name.find('.')));
  static const std::array<const char*, 4> fixed = {"con", "prn", "aux", "nul"};
  for(const auto* reserved : fixed) {
    if(stem == reserved) return true;
  }
  if(stem.size() == 4 && (stem.compare(0, 3, "com") == 0 || stem.compare(0, 3, "lpt") == 0)) {
    return stem[3] >= '1' && stem[3] <= '9';
  }
  return false;
}

bool is_internal_name(const std::string& name) {
  return ends_with(name, kStagingSuffix);
}

std::string sanitize_filename(const std::string& untrusted) {
  if(untrusted.find('\0') != std::string::npos) {
    throw PathSafetyViolation("filename contains a NUL byte");
  }

  std::string base;
  std::string component;
  auto finish_component = [&](){
    if(component == "..") {
      throw PathSafetyViolation("filename contains a parent-directory component");
    }
    if(!component.empty()) base = component;
    component.clear();
  };
  for(char ch : untrusted) {
    if(ch == '/' || ch == '\\') {
      finish_component();
    } else {
      component.push_back(ch);
    }
  }
  finish_component();

  if(base.empty() || base == ".") {
    throw PathSafetyViolation("filename is empty after sanitization");
  }
  if(is_reserved_device_name(base)) {
    throw PathSafetyViolation("filename is a reserved device name");
  }
  if(is_internal_name(base)) {
    throw PathSafetyViolation("filename collides with a staging file");
  }
  for(unsigned char ch : base) {
    if(std::iscntrl(ch)) {
      throw PathSafetyViolation("filename contains control characters");
    }
  }
  return base;
}

std::filesystem::path resolve_in_directory(const std::filesystem::path& shared_dir,
                                           const std::string& untrusted) {
  return shared_dir / sanitize_filename(untrusted);
}

std::filesystem::path staging_path_for(const std::filesystem::path& destination,
                                       const std::string& tag) {
  auto name = "." + destination.filename().string() + "." + tag + kStagingSuffix;
  return destination.parent_path() / name;
}
