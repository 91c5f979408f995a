#include "admission.hpp"

#include "internal/authz/permissions.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace roster::core {

void RequireCapacity(const v1::GroupRecord& group) {
  if (group.max_members() != 0 && group.member_count() >= group.max_members()) {
    throw util::CapacityExceeded("group is full (" + std::to_string(group.member_count()) + "/" +
                                 std::to_string(group.max_members()) + " members)");
  }
}

void DecrementMemberCount(v1::GroupRecord& group) {
  if (group.member_count() > 0) {
    group.set_member_count(group.member_count() - 1);
  }
}

v1::MembershipRecord NewMembership(const util::GroupId& group_id, const util::Identity& member, v1::Role role,
                                   const util::Identity& invited_by, const std::string& encrypted_group_key) {
  const auto now = util::UnixNow();

  v1::MembershipRecord membership;
  membership.set_group_id(util::ToBytes(group_id));
  membership.set_member(util::ToBytes(member));
  membership.set_role(role);
  membership.set_permissions(authz::MaskForRole(role));
  membership.set_encrypted_group_key(encrypted_group_key);
  membership.set_joined_at(now);
  membership.set_last_read_at(0);
  membership.set_is_active(true);
  membership.set_is_muted(false);
  membership.set_is_banned(false);
  membership.set_invited_by(util::ToBytes(invited_by));
  return membership;
}

v1::MembershipRecord AdmitMember(UnitOfWork& uow, v1::GroupRecord& group, const util::Identity& member,
                                 const util::Identity& invited_by, const util::Identity& payer,
                                 const std::string& encrypted_group_key) {
  RequireCapacity(group);

  const auto group_id   = util::FromBytes(group.group_id());
  auto       membership = NewMembership(group_id, member, v1::ROLE_MEMBER, invited_by, encrypted_group_key);

  group.set_member_count(group.member_count() + 1);
  group.set_updated_at(util::UnixNow());

  uow.CreateMembership(membership, payer);
  uow.UpdateGroup(group);
  return membership;
}

} // namespace roster::core
