#include "policy.hpp"

#include "internal/util/errors.hpp"

namespace roster::authz {

namespace {

Decision Allow() {
  return {};
}

Decision Deny(Denial denial, std::string reason) {
  return {denial, std::move(reason)};
}

bool IsStaff(v1::Role role) {
  return Rank(role) >= Rank(v1::ROLE_MODERATOR);
}

Decision EvaluateInvite(const Subject& actor, const Target& target) {
  if (IsStaff(actor.role)) {
    return Allow();
  }
  if (HasBit(actor.permissions, kInvite) && target.allow_member_invites) {
    return Allow();
  }
  return Deny(Denial::kPermissionDenied, "insufficient permissions to invite");
}

Decision EvaluateKick(const Subject& actor, const Target& target) {
  if (!target.member) {
    return Deny(Denial::kPermissionDenied, "kick requires a target member");
  }
  const auto& victim = *target.member;

  if (!IsStaff(actor.role)) {
    return Deny(Denial::kPermissionDenied, "insufficient permissions to kick");
  }
  if (actor.identity == victim.identity) {
    return Deny(Denial::kPermissionDenied, "cannot kick yourself");
  }
  if (victim.role == v1::ROLE_OWNER) {
    return Deny(Denial::kInvalidState, "cannot kick the group owner");
  }
  if (actor.role != v1::ROLE_OWNER && Rank(actor.role) <= Rank(victim.role)) {
    return Deny(Denial::kPermissionDenied, "cannot kick a member of equal or higher rank");
  }
  return Allow();
}

Decision EvaluateChangeRole(const Subject& actor, const Target& target) {
  if (!target.member) {
    return Deny(Denial::kPermissionDenied, "role change requires a target member");
  }
  if (actor.role != v1::ROLE_OWNER && actor.role != v1::ROLE_ADMIN) {
    return Deny(Denial::kPermissionDenied, "insufficient permissions to change roles");
  }
  if (target.member->role == v1::ROLE_OWNER) {
    return Deny(Denial::kInvalidState, "cannot change the owner's role");
  }
  if (target.new_role == v1::ROLE_OWNER) {
    return Deny(Denial::kInvalidState, "cannot promote a member to owner");
  }
  if (target.new_role == v1::ROLE_ADMIN && actor.role != v1::ROLE_OWNER) {
    return Deny(Denial::kPermissionDenied, "only the owner can promote to admin");
  }
  return Allow();
}

Decision EvaluateLeave(const Subject& actor) {
  if (actor.role == v1::ROLE_OWNER) {
    return Deny(Denial::kInvalidState, "owner cannot leave the group");
  }
  return Allow();
}

Decision EvaluateRevoke(const Subject& actor, const Target& target) {
  if (target.link_creator && *target.link_creator == actor.identity) {
    return Allow();
  }
  if (IsStaff(actor.role)) {
    return Allow();
  }
  return Deny(Denial::kPermissionDenied, "insufficient permissions to revoke invite link");
}

} // namespace

Subject SubjectOf(const v1::MembershipRecord& membership) {
  Subject subject;
  subject.identity    = util::FromBytes(membership.member());
  subject.role        = membership.role();
  subject.permissions = membership.permissions();
  return subject;
}

const char* RoleName(v1::Role role) {
  switch (role) {
    case v1::ROLE_OWNER:
      return "owner";
    case v1::ROLE_ADMIN:
      return "admin";
    case v1::ROLE_MODERATOR:
      return "moderator";
    default:
      return "member";
  }
}

const char* ActionName(Action action) {
  switch (action) {
    case Action::kInvite:
      return "invite";
    case Action::kCreateInviteLink:
      return "create_invite_link";
    case Action::kKick:
      return "kick";
    case Action::kChangeRole:
      return "change_role";
    case Action::kLeave:
      return "leave";
    case Action::kRevokeInviteLink:
      return "revoke_invite_link";
  }
  return "unknown";
}

Decision Evaluate(const Subject& actor, Action action, const Target& target) {
  switch (action) {
    case Action::kInvite:
    case Action::kCreateInviteLink:
      return EvaluateInvite(actor, target);
    case Action::kKick:
      return EvaluateKick(actor, target);
    case Action::kChangeRole:
      return EvaluateChangeRole(actor, target);
    case Action::kLeave:
      return EvaluateLeave(actor);
    case Action::kRevokeInviteLink:
      return EvaluateRevoke(actor, target);
  }
  return Deny(Denial::kPermissionDenied, "unknown action");
}

bool CanPerform(const Subject& actor, Action action, const Target& target) {
  return Evaluate(actor, action, target).allowed();
}

void Enforce(const Decision& decision) {
  switch (decision.denial) {
    case Denial::kNone:
      return;
    case Denial::kInvalidState:
      throw util::InvalidState(decision.reason);
    case Denial::kPermissionDenied:
      throw util::PermissionDenied(decision.reason);
  }
}

} // namespace roster::authz
