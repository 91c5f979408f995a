#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/ids.hpp"
#include "roster/v1.hpp"
#include "service_context.hpp"

namespace roster::service {

struct CreateGroupParams {
  util::GroupId group_id{};
  std::string   name;
  std::string   description;
  std::string   avatar_ref;

  bool     is_public            = false;
  bool     is_searchable        = false;
  bool     invite_only          = false;
  bool     allow_member_invites = false;
  uint32_t max_members          = 0;

  std::string group_encryption_key;  // 32 bytes
};

class GroupService {
public:
  explicit GroupService(ServiceContext ctx);

  // Creates the group and the caller's Owner membership together.
  v1::GroupRecord CreateGroup(const util::Identity& caller, const CreateGroupParams& params);

  // Owner only. Claims `code` for the group in the global code map.
  v1::GroupRecord SetGroupCode(const util::Identity& caller, const util::GroupId& group_id, const std::string& code);

  v1::GroupRecord GetGroup(const util::GroupId& group_id);

  // Public and searchable groups whose name contains `query`, ignoring ASCII case.
  std::vector<v1::GroupRecord> SearchPublicGroups(const std::string& query);

  std::vector<v1::GroupRecord> ListGroupsForMember(const util::Identity& member);

private:
  ServiceContext ctx_;
};

}
