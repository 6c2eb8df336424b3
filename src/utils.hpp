#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);

// Incremental SHA-256 over a resource that arrives in chunks.
class Sha256Stream {
public:
  Sha256Stream();
  ~Sha256Stream();
  Sha256Stream(const Sha256Stream&) = delete;
  Sha256Stream& operator=(const Sha256Stream&) = delete;

  void update(const char* data, std::size_t size);
  std::string finish_hex();

private:
  void* ctx_ = nullptr;
};

std::string base64_encode(const std::string& bytes);
// nullopt on malformed input
std::optional<std::string> base64_decode(const std::string& text);

std::string random_hex_id(std::size_t bytes = 16);
