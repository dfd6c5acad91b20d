#include "address.hpp"

#include <cctype>

std::string HostPort::to_string() const {
  if(host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::optional<std::uint16_t> parse_port(const std::string& text, std::string& error) {
  if(text.empty()) {
    error = "port is empty";
    return std::nullopt;
  }
  if(text.size() > 5) {
    error = "port '" + text + "' is out of range (1-65535)";
    for(char ch : text) {
      if(!std::isdigit(static_cast<unsigned char>(ch))) {
        error = "port '" + text + "' is not a number";
        break;
      }
    }
    return std::nullopt;
  }
  unsigned long value = 0;
  for(char ch : text) {
    if(!std::isdigit(static_cast<unsigned char>(ch))) {
      error = "port '" + text + "' is not a number";
      return std::nullopt;
    }
    value = value * 10 + static_cast<unsigned long>(ch - '0');
  }
  if(value < 1 || value > 65535) {
    error = "port '" + text + "' is out of range (1-65535)";
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(value);
}

bool parse_host_port(const std::string& text,
                     HostPort& out,
                     std::string& error,
                     std::optional<std::uint16_t> default_port) {
  if(text.empty()) {
    error = "address is empty";
    return false;
  }

  std::string host;
  std::string port_text;
  if(text.front() == '[') {
    auto close = text.find(']');
    if(close == std::string::npos) {
      error = "missing ']' in '" + text + "'";
      return false;
    }
    host = text.substr(1, close - 1);
    auto rest = text.substr(close + 1);
    if(!rest.empty()) {
      if(rest.front() != ':') {
        error = "unexpected text after ']' in '" + text + "'";
        return false;
      }
      port_text = rest.substr(1);
      if(port_text.empty()) {
        error = "missing port after ':' in '" + text + "'";
        return false;
      }
    }
  } else {
    auto colon = text.rfind(':');
    if(colon == std::string::npos) {
      host = text;
    } else {
      host = text.substr(0, colon);
      port_text = text.substr(colon + 1);
      if(port_text.empty()) {
        error = "missing port after ':' in '" + text + "'";
        return false;
      }
    }
  }

  if(host.empty()) {
    error = "host is empty in '" + text + "'";
    return false;
  }

  std::uint16_t port = 0;
  if(port_text.empty()) {
    if(!default_port) {
      error = "no port given in '" + text + "'";
      return false;
    }
    port = *default_port;
  } else {
    std::string port_error;
    auto parsed = parse_port(port_text, port_error);
    if(!parsed) {
      error = port_error;
      return false;
    }
    port = *parsed;
  }

  out.host = host;
  out.port = port;
  return true;
}
