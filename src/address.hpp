#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct HostPort {
  std::string host;
  std::uint16_t port = 0;

  std::string to_string() const;
};

// Parses a decimal port in 1-65535. Returns nullopt and fills `error` with a
// readable reason otherwise.
std::optional<std::uint16_t> parse_port(const std::string& text, std::string& error);

// Splits "host:port" on the last colon so IPv6 literals such as
// "2001:db8::1:6000" keep their colons in the host part; "[v6]:port" is also
// accepted. Without a colon the whole text is the host and `default_port`
// is used when given. Invalid input returns false with `error` describing it.
bool parse_host_port(const std::string& text,
                     HostPort& out,
                     std::string& error,
                     std::optional<std::uint16_t> default_port = std::nullopt);
