#include "ids.hpp"

#include <cstring>
#include <random>
#include <stdexcept>

namespace roster::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

Key32 GenerateKey32() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  Key32 key{};
  for (auto& b : key)
    b = static_cast<uint8_t>(rng());
  return key;
}

std::string ToHex(const Key32& key) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(key.size() * 2);
  for (auto b : key) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

Key32 FromHex(const std::string& hex) {
  if (hex.size() != kKeySize * 2)
    throw std::invalid_argument("invalid key: expected 64 hex chars, got " + std::to_string(hex.size()));

  Key32 key{};
  for (size_t i = 0; i < kKeySize; ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw std::invalid_argument("invalid key: non-hex character");
    key[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return key;
}

std::string ToBytes(const Key32& key) {
  return std::string(reinterpret_cast<const char*>(key.data()), key.size());
}

Key32 FromBytes(const std::string& bytes) {
  if (bytes.size() != kKeySize)
    throw std::invalid_argument("invalid key: expected 32 bytes, got " + std::to_string(bytes.size()));

  Key32 key{};
  std::memcpy(key.data(), bytes.data(), kKeySize);
  return key;
}

std::string EncodeHex(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    const auto b = static_cast<unsigned char>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string DecodeHex(const std::string& hex) {
  if (hex.size() % 2 != 0)
    throw std::invalid_argument("invalid hex: odd number of characters");

  std::string out(hex.size() / 2, '\0');
  for (size_t i = 0; i < out.size(); ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw std::invalid_argument("invalid hex: non-hex character");
    out[i] = static_cast<char>((hi << 4) | lo);
  }
  return out;
}

std::string ShortHex(const Key32& key) {
  return ToHex(key).substr(0, 12);
}

} // namespace roster::util
