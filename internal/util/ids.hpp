#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace roster::util {

/*
  32-byte identifiers.

  Identity   - verified caller / member public key
  GroupId    - chosen by the group creator
  Address    - derived storage location (see addressing/)

  Records store them as protobuf `bytes`; ToBytes/FromBytes convert.
*/

inline constexpr std::size_t kKeySize = 32;

using Key32    = std::array<uint8_t, kKeySize>;
using Identity = Key32;
using GroupId  = Key32;
using Address  = Key32;

Key32 GenerateKey32();

std::string ToHex(const Key32& key);
Key32       FromHex(const std::string& hex);

std::string ToBytes(const Key32& key);
Key32       FromBytes(const std::string& bytes);

// Arbitrary-length byte strings, e.g. opaque key blobs.
std::string EncodeHex(const std::string& bytes);
std::string DecodeHex(const std::string& hex);

// Short prefix for log lines.
std::string ShortHex(const Key32& key);

} // namespace roster::util
