#pragma once

#include <string>

#include "internal/core/unit_of_work.hpp"

namespace roster::core {

/*
  Stages a new Member into `group` on `uow`:

    capacity check -> Member membership -> member_count + 1

  `group` is updated in place and staged; both records land together at
  Commit(). `payer` funds the membership deposit. Throws util::CapacityExceeded when the group is full. A duplicate
  membership surfaces as util::AlreadyExists at Commit().
*/
v1::MembershipRecord AdmitMember(UnitOfWork& uow, v1::GroupRecord& group, const util::Identity& member,
                                 const util::Identity& invited_by, const util::Identity& payer,
                                 const std::string& encrypted_group_key);

// Throws util::CapacityExceeded when max_members is set and reached.
void RequireCapacity(const v1::GroupRecord& group);

// Removes one member from the count; never wraps below zero.
void DecrementMemberCount(v1::GroupRecord& group);

// last_read_at starts at 0: nothing has been read yet.
v1::MembershipRecord NewMembership(const util::GroupId& group_id, const util::Identity& member, v1::Role role,
                                   const util::Identity& invited_by, const std::string& encrypted_group_key);

} // namespace roster::core
