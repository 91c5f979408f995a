#pragma once

#include <cstdint>
#include <string>

#include "internal/util/ids.hpp"
#include "roster/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

class InviteService {
public:
  explicit InviteService(ServiceContext ctx);

  // expires_at = 0 never expires; max_uses = 0 is unlimited.
  v1::InviteLinkRecord CreateInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                        const std::string& invite_code, int64_t expires_at, uint32_t max_uses);

  // Deactivation is permanent. Revoking an inactive link succeeds.
  v1::InviteLinkRecord RevokeInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                        const std::string& invite_code);

  /*
    Joins the caller through a link. The membership, the link's use_count
    and the group's member_count change in one commit. Revoked, expired and
    exhausted links fail with util::InvalidState.
  */
  v1::MembershipRecord RedeemInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                        const std::string& invite_code, const std::string& encrypted_group_key);

  v1::InviteLinkRecord GetInviteLink(const util::GroupId& group_id, const std::string& invite_code);

private:
  ServiceContext ctx_;
};

}
