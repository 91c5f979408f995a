#include "group_service.hpp"

#include <algorithm>

#include "internal/addressing/address_deriver.hpp"
#include "internal/core/admission.hpp"
#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/validation/rules.hpp"
#include "observe.hpp"

namespace roster::service {

namespace {

using roster::observability::IntField;
using roster::observability::StringField;

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return validation::NormalizePublicCode(haystack).find(validation::NormalizePublicCode(needle)) != std::string::npos;
}

void SortByName(std::vector<v1::GroupRecord>& groups) {
  std::sort(groups.begin(), groups.end(), [](const auto& a, const auto& b) {
    return a.name() != b.name() ? a.name() < b.name() : a.group_id() < b.group_id();
  });
}

} // namespace

GroupService::GroupService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::GroupRecord GroupService::CreateGroup(const util::Identity& caller, const CreateGroupParams& params) {
  return Observe("GroupService.CreateGroup", [&] {
    validation::ValidateGroupName(params.name);
    validation::ValidateGroupDescription(params.description);
    validation::ValidateAvatarRef(params.avatar_ref);
    validation::ValidateCounterLimit("max_members", params.max_members);
    validation::ValidateGroupEncryptionKey(params.group_encryption_key);

    const auto now = util::UnixNow();

    v1::GroupRecord group;
    group.set_group_id(util::ToBytes(params.group_id));
    group.set_owner(util::ToBytes(caller));
    group.set_name(params.name);
    group.set_description(params.description);
    group.set_avatar_ref(params.avatar_ref);

    auto* flags = group.mutable_flags();
    flags->set_is_public(params.is_public);
    flags->set_is_searchable(params.is_searchable);
    flags->set_invite_only(params.invite_only);
    flags->set_require_approval(false);
    flags->set_enable_replies(true);
    flags->set_enable_reactions(true);
    flags->set_enable_read_receipts(true);
    flags->set_enable_typing_indicators(true);

    group.set_max_members(params.max_members);
    group.set_allow_member_invites(params.allow_member_invites);
    group.set_group_encryption_key(params.group_encryption_key);
    group.set_member_count(1);
    group.set_created_at(now);
    group.set_updated_at(now);

    // the owner's key blob is distributed later by the client
    const auto owner = core::NewMembership(params.group_id, caller, v1::ROLE_OWNER, caller,
                                           std::string(validation::kEncryptedGroupKeySize, '\0'));

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    uow.CreateGroup(group, caller);
    uow.CreateMembership(owner, caller);
    uow.Commit();

    ROSTER_LOG_INFO("group created", {StringField("actor", util::ShortHex(caller)),
                                      StringField("group", util::ShortHex(params.group_id)),
                                      StringField("name", params.name), IntField("member_count", group.member_count())});
    return group;
  });
}

v1::GroupRecord GroupService::SetGroupCode(const util::Identity& caller, const util::GroupId& group_id,
                                           const std::string& code) {
  return Observe("GroupService.SetGroupCode", [&] {
    validation::ValidatePublicCode(code);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group = uow.RequireGroup(group_id, "set group code");
    if (group.owner() != util::ToBytes(caller)) {
      throw util::PermissionDenied("only the group owner can set the public code");
    }

    v1::CodeLookupRecord lookup;
    lookup.set_public_code(validation::NormalizePublicCode(code));
    lookup.set_group_id(group.group_id());

    group.set_public_code(code);
    group.set_updated_at(util::UnixNow());

    uow.CreateCodeLookup(lookup, caller);
    uow.UpdateGroup(group);
    uow.Commit();

    ROSTER_LOG_INFO("group code set", {StringField("actor", util::ShortHex(caller)),
                                       StringField("group", util::ShortHex(group_id)), StringField("code", code)});
    return group;
  });
}

v1::GroupRecord GroupService::GetGroup(const util::GroupId& group_id) {
  return Observe("GroupService.GetGroup", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group = uow.RequireGroup(group_id, "get group");
    uow.Finish();
    return group;
  });
}

std::vector<v1::GroupRecord> GroupService::SearchPublicGroups(const std::string& query) {
  return Observe("GroupService.SearchPublicGroups", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             groups = uow.ListGroups();
    uow.Finish();

    std::vector<v1::GroupRecord> out;
    for (auto& group : groups) {
      if (!group.flags().is_public() || !group.flags().is_searchable()) continue;
      if (!query.empty() && !ContainsIgnoreCase(group.name(), query)) continue;
      out.push_back(std::move(group));
    }
    SortByName(out);
    return out;
  });
}

std::vector<v1::GroupRecord> GroupService::ListGroupsForMember(const util::Identity& member) {
  return Observe("GroupService.ListGroupsForMember", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);

    std::vector<v1::GroupRecord> out;
    for (const auto& membership : uow.ListMembershipsOf(member)) {
      if (auto group = uow.LoadGroup(util::FromBytes(membership.group_id()))) {
        out.push_back(*std::move(group));
      }
    }
    uow.Finish();
    SortByName(out);
    return out;
  });
}

}
