#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace roster::validation {

/*
  Field-level input rules.

  Pure and stateless; every check runs before any storage access. A failing
  check throws util::ValidationError naming the field. Lengths are in bytes.
*/

inline constexpr std::size_t kMaxGroupNameLength        = 100;
inline constexpr std::size_t kMaxGroupDescriptionLength = 500;
inline constexpr std::size_t kMinPublicCodeLength       = 3;
inline constexpr std::size_t kMaxPublicCodeLength       = 20;
inline constexpr std::size_t kMinInviteCodeLength       = 8;
inline constexpr std::size_t kMaxInviteCodeLength       = 16;
inline constexpr std::size_t kMinUsernameLength         = 3;
inline constexpr std::size_t kMaxUsernameLength         = 20;
inline constexpr std::size_t kMaxAvatarRefLength        = 43;
inline constexpr std::size_t kEncryptedGroupKeySize     = 64;
inline constexpr std::size_t kGroupEncryptionKeySize    = 32;
inline constexpr uint32_t    kMaxCounterValue           = 0xFFFF;

void ValidateGroupName(std::string_view name);
void ValidateGroupDescription(std::string_view description);
void ValidatePublicCode(std::string_view code);
void ValidateInviteCode(std::string_view code);
void ValidateUsername(std::string_view username);
void ValidateAvatarRef(std::string_view avatar_ref);

void ValidateEncryptedGroupKey(std::string_view blob);
void ValidateGroupEncryptionKey(std::string_view key);

// max_members and max_uses share the 16-bit range of the stored counters.
void ValidateCounterLimit(const char* field, uint32_t value);

void ValidateTimestamp(const char* field, int64_t unix_seconds);

// Decimal text to a checked value. Rejects non-digits and anything out of
// range before narrowing.
uint32_t ParseCounterLimit(const char* field, const std::string& text);
int64_t  ParseTimestamp(const char* field, const std::string& text);

// ASCII lowercase; the canonical form used to address code lookups.
std::string NormalizePublicCode(std::string_view code);

} // namespace roster::validation
