#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/ids.hpp"
#include "permissions.hpp"

namespace roster::authz {

enum class Action {
  kInvite,
  kCreateInviteLink,
  kKick,
  kChangeRole,
  kLeave,
  kRevokeInviteLink,
};

const char* ActionName(Action action);

// The member attempting the action, as loaded from its membership.
struct Subject {
  util::Identity identity{};
  v1::Role       role        = v1::ROLE_MEMBER;
  uint32_t       permissions = 0;
};

Subject SubjectOf(const v1::MembershipRecord& membership);

/*
  Everything an action may be judged against besides the actor.

  - member:        kick and change-role target
  - new_role:      change-role destination
  - link_creator:  revoke
  - allow_member_invites: the group's delegation flag for invite actions
*/
struct Target {
  std::optional<Subject>        member;
  v1::Role                      new_role = v1::ROLE_MEMBER;
  std::optional<util::Identity> link_creator;
  bool                          allow_member_invites = false;
};

enum class Denial {
  kNone,
  kPermissionDenied,
  kInvalidState,
};

struct Decision {
  Denial      denial = Denial::kNone;
  std::string reason;

  bool allowed() const {
    return denial == Denial::kNone;
  }
};

/*
  Single authorization point for every privileged action.

  Pure: no storage access, no logging. Rules that are about the group's
  structure (the Owner is never kicked, never re-roled, never leaves; nobody
  becomes Owner) deny as kInvalidState; rank and role shortfalls deny as
  kPermissionDenied.
*/
Decision Evaluate(const Subject& actor, Action action, const Target& target = {});

bool CanPerform(const Subject& actor, Action action, const Target& target = {});

// Throws util::PermissionDenied or util::InvalidState for a denied decision.
void Enforce(const Decision& decision);

} // namespace roster::authz
