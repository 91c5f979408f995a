#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/model/stored_record.hpp"
#include "internal/util/ids.hpp"
#include "roster/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

/*
  Membership lifecycle.

  Every operation that adds or removes a membership changes the group's
  member_count in the same commit.
*/
class MembershipService {
public:
  explicit MembershipService(ServiceContext ctx);

  v1::MembershipRecord Join(const util::Identity& caller, const util::GroupId& group_id,
                            const std::string& encrypted_group_key);

  // Resolves a public code and joins the group it names in one transaction.
  v1::MembershipRecord JoinByCode(const util::Identity& caller, const std::string& code,
                                  const std::string& encrypted_group_key);

  v1::MembershipRecord Invite(const util::Identity& caller, const util::GroupId& group_id,
                              const util::Identity& invitee, const std::string& encrypted_group_key);

  // The membership deposit goes back to the leaving member.
  db::model::Refund Leave(const util::Identity& caller, const util::GroupId& group_id);

  // The membership deposit goes to the kicker.
  db::model::Refund Kick(const util::Identity& caller, const util::GroupId& group_id, const util::Identity& target);

  v1::MembershipRecord UpdateRole(const util::Identity& caller, const util::GroupId& group_id,
                                  const util::Identity& target, v1::Role new_role);

  // Moves the caller's read marker forward; an older timestamp is a no-op.
  v1::MembershipRecord MarkRead(const util::Identity& caller, const util::GroupId& group_id, int64_t timestamp);

  v1::MembershipRecord GetMember(const util::GroupId& group_id, const util::Identity& member);

  std::vector<v1::MembershipRecord> ListMembers(const util::GroupId& group_id);

private:
  ServiceContext ctx_;
};

}
