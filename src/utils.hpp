#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>& bytes);
std::string sha256_hex(const std::string& data);

// Streaming SHA-256 over libcrypto's EVP interface.
class Sha256 {
public:
  Sha256();
  ~Sha256();
  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const void* data, std::size_t size);
  std::string final_hex();

private:
  struct Context;
  std::unique_ptr<Context> ctx_;
};

// "512.0 B", "1.5 MB", ... one decimal, binary multiples.
std::string format_size(std::uint64_t bytes);

std::string to_lower_copy(std::string value);
std::string local_hostname();
std::string random_instance_id();
