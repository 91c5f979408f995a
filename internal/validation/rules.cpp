#include "rules.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace roster::validation {

namespace {

bool IsLowerAlnum(char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool IsAlnum(char c) {
  return IsLowerAlnum(c) || (c >= 'A' && c <= 'Z');
}

template <typename Pred>
bool AllOf(std::string_view s, Pred pred) {
  return std::all_of(s.begin(), s.end(), pred);
}

void RequireLength(const char* field, std::string_view value, std::size_t min, std::size_t max, const char* label) {
  if (value.size() < min || value.size() > max) {
    throw util::ValidationError(field, std::string(label) + " must be " + std::to_string(min) + "-" + std::to_string(max) +
                                           " characters");
  }
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

} // namespace

void ValidateGroupName(std::string_view name) {
  RequireLength("name", name, 1, kMaxGroupNameLength, "Group name");
}

void ValidateGroupDescription(std::string_view description) {
  RequireLength("description", description, 0, kMaxGroupDescriptionLength, "Group description");
}

void ValidatePublicCode(std::string_view code) {
  RequireLength("public_code", code, kMinPublicCodeLength, kMaxPublicCodeLength, "Public code");
  if (!AllOf(code, [](char c) { return IsLowerAlnum(c) || c == '-'; })) {
    throw util::ValidationError("public_code", "Public code can only contain lowercase letters, numbers, and hyphens");
  }
}

void ValidateInviteCode(std::string_view code) {
  RequireLength("invite_code", code, kMinInviteCodeLength, kMaxInviteCodeLength, "Invite code");
  if (!AllOf(code, IsAlnum)) {
    throw util::ValidationError("invite_code", "Invite code can only contain alphanumeric characters");
  }
}

void ValidateUsername(std::string_view username) {
  RequireLength("username", username, kMinUsernameLength, kMaxUsernameLength, "Username");
  if (!AllOf(username, [](char c) { return IsAlnum(c) || c == '_'; })) {
    throw util::ValidationError("username", "Username can only contain letters, numbers, and underscores");
  }
}

void ValidateAvatarRef(std::string_view avatar_ref) {
  RequireLength("avatar_ref", avatar_ref, 0, kMaxAvatarRefLength, "Avatar reference");
}

void ValidateEncryptedGroupKey(std::string_view blob) {
  if (blob.size() != kEncryptedGroupKeySize) {
    throw util::ValidationError("encrypted_group_key", "Encrypted group key must be exactly 64 bytes");
  }
}

void ValidateGroupEncryptionKey(std::string_view key) {
  if (key.size() != kGroupEncryptionKeySize) {
    throw util::ValidationError("group_encryption_key", "Group encryption key must be exactly 32 bytes");
  }
}

void ValidateCounterLimit(const char* field, uint32_t value) {
  if (value > kMaxCounterValue) {
    throw util::ValidationError(field, std::string(field) + " must not exceed 65535");
  }
}

void ValidateTimestamp(const char* field, int64_t unix_seconds) {
  if (unix_seconds < 0) {
    throw util::ValidationError(field, std::string(field) + " must not be negative");
  }
}

uint32_t ParseCounterLimit(const char* field, const std::string& text) {
  if (text.empty() || !AllOf(text, IsDigit)) {
    throw util::ValidationError(field, std::string(field) + " must be a non-negative integer");
  }

  unsigned long long value = 0;
  try {
    value = std::stoull(text);
  } catch (const std::out_of_range&) {
    throw util::ValidationError(field, std::string(field) + " is out of range");
  }
  if (value > kMaxCounterValue) {
    throw util::ValidationError(field, std::string(field) + " must not exceed " + std::to_string(kMaxCounterValue));
  }
  return static_cast<uint32_t>(value);
}

int64_t ParseTimestamp(const char* field, const std::string& text) {
  std::string_view digits = text;
  if (!digits.empty() && digits.front() == '-') digits.remove_prefix(1);
  if (digits.empty() || !AllOf(digits, IsDigit)) {
    throw util::ValidationError(field, std::string(field) + " must be an integer");
  }

  long long value = 0;
  try {
    value = std::stoll(text);
  } catch (const std::out_of_range&) {
    throw util::ValidationError(field, std::string(field) + " is out of range");
  }
  ValidateTimestamp(field, value);
  return value;
}

std::string NormalizePublicCode(std::string_view code) {
  std::string out(code);
  std::transform(out.begin(), out.end(), out.begin(), [](char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c; });
  return out;
}

} // namespace roster::validation
