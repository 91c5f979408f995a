#include "membership_service.hpp"

#include <algorithm>

#include "internal/addressing/address_deriver.hpp"
#include "internal/authz/policy.hpp"
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

void Audit(std::string_view action, const util::Identity& actor, const util::GroupId& group_id,
           const util::Identity& subject, const v1::GroupRecord& group) {
  ROSTER_LOG_INFO("membership changed", {StringField("action", action), StringField("actor", util::ShortHex(actor)),
                                         StringField("group", util::ShortHex(group_id)),
                                         StringField("member", util::ShortHex(subject)),
                                         IntField("member_count", group.member_count())});
}

} // namespace

MembershipService::MembershipService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::MembershipRecord MembershipService::Join(const util::Identity& caller, const util::GroupId& group_id,
                                             const std::string& encrypted_group_key) {
  return Observe("MembershipService.Join", [&] {
    validation::ValidateEncryptedGroupKey(encrypted_group_key);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group      = uow.RequireGroup(group_id, "join group");
    auto             membership = core::AdmitMember(uow, group, caller, caller, caller, encrypted_group_key);
    uow.Commit();

    Audit("join", caller, group_id, caller, group);
    return membership;
  });
}

v1::MembershipRecord MembershipService::JoinByCode(const util::Identity& caller, const std::string& code,
                                                   const std::string& encrypted_group_key) {
  return Observe("MembershipService.JoinByCode", [&] {
    const auto normalized = validation::NormalizePublicCode(code);
    validation::ValidatePublicCode(normalized);
    validation::ValidateEncryptedGroupKey(encrypted_group_key);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    const auto       lookup = uow.LoadCodeLookup(normalized);
    if (!lookup) {
      throw util::NotFound("join by code: no group uses code '" + normalized + "'");
    }

    const auto group_id   = util::FromBytes(lookup->group_id());
    auto       group      = uow.RequireGroup(group_id, "join by code");
    auto       membership = core::AdmitMember(uow, group, caller, caller, caller, encrypted_group_key);
    uow.Commit();

    Audit("join", caller, group_id, caller, group);
    return membership;
  });
}

v1::MembershipRecord MembershipService::Invite(const util::Identity& caller, const util::GroupId& group_id,
                                               const util::Identity& invitee, const std::string& encrypted_group_key) {
  return Observe("MembershipService.Invite", [&] {
    validation::ValidateEncryptedGroupKey(encrypted_group_key);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group   = uow.RequireGroup(group_id, "invite member");
    const auto       inviter = uow.RequireMembership(group_id, caller, "invite member");

    authz::Target target;
    target.allow_member_invites = group.allow_member_invites();
    authz::Enforce(authz::Evaluate(authz::SubjectOf(inviter), authz::Action::kInvite, target));

    auto membership = core::AdmitMember(uow, group, invitee, caller, caller, encrypted_group_key);
    uow.Commit();

    Audit("invite", caller, group_id, invitee, group);
    return membership;
  });
}

db::model::Refund MembershipService::Leave(const util::Identity& caller, const util::GroupId& group_id) {
  return Observe("MembershipService.Leave", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group      = uow.RequireGroup(group_id, "leave group");
    const auto       membership = uow.RequireMembership(group_id, caller, "leave group");

    authz::Enforce(authz::Evaluate(authz::SubjectOf(membership), authz::Action::kLeave));

    core::DecrementMemberCount(group);
    group.set_updated_at(util::UnixNow());

    uow.DestroyMembership(group_id, caller, caller);
    uow.UpdateGroup(group);
    const auto refunds = uow.Commit();

    Audit("leave", caller, group_id, caller, group);
    return refunds.front();
  });
}

db::model::Refund MembershipService::Kick(const util::Identity& caller, const util::GroupId& group_id,
                                          const util::Identity& target_id) {
  return Observe("MembershipService.Kick", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group  = uow.RequireGroup(group_id, "kick member");
    const auto       kicker = uow.RequireMembership(group_id, caller, "kick member");
    const auto       victim = uow.RequireMembership(group_id, target_id, "kick member");

    authz::Target target;
    target.member = authz::SubjectOf(victim);
    authz::Enforce(authz::Evaluate(authz::SubjectOf(kicker), authz::Action::kKick, target));

    core::DecrementMemberCount(group);
    group.set_updated_at(util::UnixNow());

    uow.DestroyMembership(group_id, target_id, caller);
    uow.UpdateGroup(group);
    const auto refunds = uow.Commit();

    Audit("kick", caller, group_id, target_id, group);
    return refunds.front();
  });
}

v1::MembershipRecord MembershipService::UpdateRole(const util::Identity& caller, const util::GroupId& group_id,
                                                   const util::Identity& target_id, v1::Role new_role) {
  return Observe("MembershipService.UpdateRole", [&] {
    if (!v1::Role_IsValid(new_role)) {
      throw util::ValidationError("role", "unknown role value " + std::to_string(static_cast<int>(new_role)));
    }

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    const auto       group  = uow.RequireGroup(group_id, "update role");
    const auto       actor  = uow.RequireMembership(group_id, caller, "update role");
    auto             member = uow.RequireMembership(group_id, target_id, "update role");

    authz::Target target;
    target.member   = authz::SubjectOf(member);
    target.new_role = new_role;
    authz::Enforce(authz::Evaluate(authz::SubjectOf(actor), authz::Action::kChangeRole, target));

    member.set_role(new_role);
    member.set_permissions(authz::MaskForRole(new_role));
    uow.UpdateMembership(member);
    uow.Commit();

    ROSTER_LOG_INFO("role changed", {StringField("actor", util::ShortHex(caller)),
                                     StringField("group", util::ShortHex(group_id)),
                                     StringField("member", util::ShortHex(target_id)),
                                     StringField("role", authz::RoleName(new_role)),
                                     IntField("member_count", group.member_count())});
    return member;
  });
}

v1::MembershipRecord MembershipService::MarkRead(const util::Identity& caller, const util::GroupId& group_id,
                                                 int64_t timestamp) {
  return Observe("MembershipService.MarkRead", [&] {
    validation::ValidateTimestamp("last_read_at", timestamp);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             membership = uow.RequireMembership(group_id, caller, "mark read");

    if (timestamp <= membership.last_read_at()) {
      uow.Finish();
      return membership;
    }

    membership.set_last_read_at(timestamp);
    uow.UpdateMembership(membership);
    uow.Commit();

    ROSTER_LOG_DEBUG("read marker moved", {StringField("member", util::ShortHex(caller)),
                                           StringField("group", util::ShortHex(group_id)),
                                           IntField("last_read_at", timestamp)});
    return membership;
  });
}

v1::MembershipRecord MembershipService::GetMember(const util::GroupId& group_id, const util::Identity& member) {
  return Observe("MembershipService.GetMember", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             membership = uow.RequireMembership(group_id, member, "get member");
    uow.Finish();
    return membership;
  });
}

std::vector<v1::MembershipRecord> MembershipService::ListMembers(const util::GroupId& group_id) {
  return Observe("MembershipService.ListMembers", [&] {
    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    uow.RequireGroup(group_id, "list members");
    auto members = uow.ListMemberships(group_id);
    uow.Finish();

    // highest rank first, then oldest
    std::sort(members.begin(), members.end(), [](const auto& a, const auto& b) {
      if (a.role() != b.role()) return a.role() > b.role();
      if (a.joined_at() != b.joined_at()) return a.joined_at() < b.joined_at();
      return a.member() < b.member();
    });
    return members;
  });
}

}
