#pragma once

#include <cstdint>

#include "roster/v1.hpp"

namespace roster::authz {

/*
  Permission bits carried on a membership.

  The mask is always the fixed mask of the member's role; changing the role
  resets it.
*/

inline constexpr uint32_t kSend           = 1u << 0;
inline constexpr uint32_t kInvite         = 1u << 1;
inline constexpr uint32_t kKick           = 1u << 2;
inline constexpr uint32_t kManageSettings = 1u << 3;
inline constexpr uint32_t kDeleteMessages = 1u << 4;
inline constexpr uint32_t kPinMessages    = 1u << 5;
inline constexpr uint32_t kManageRoles    = 1u << 6;

inline constexpr uint32_t kMemberMask    = kSend;
inline constexpr uint32_t kModeratorMask = kSend | kInvite | kKick;
inline constexpr uint32_t kAdminMask     = kSend | kInvite | kKick | kManageRoles;
inline constexpr uint32_t kOwnerMask     = 0xFFFF;

constexpr uint32_t MaskForRole(v1::Role role) {
  switch (role) {
    case v1::ROLE_OWNER:
      return kOwnerMask;
    case v1::ROLE_ADMIN:
      return kAdminMask;
    case v1::ROLE_MODERATOR:
      return kModeratorMask;
    default:
      return kMemberMask;
  }
}

// Member < Moderator < Admin < Owner
constexpr int Rank(v1::Role role) {
  return static_cast<int>(role);
}

constexpr bool HasBit(uint32_t mask, uint32_t bit) {
  return (mask & bit) == bit;
}

const char* RoleName(v1::Role role);

} // namespace roster::authz
