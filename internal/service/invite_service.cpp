#include "invite_service.hpp"

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

using roster::observability::BoolField;
using roster::observability::IntField;
using roster::observability::StringField;

void RequireRedeemable(const v1::InviteLinkRecord& link, int64_t now) {
  if (!link.is_active()) {
    throw util::InvalidState("invite link has been revoked");
  }
  if (link.expires_at() != 0 && now >= link.expires_at()) {
    throw util::InvalidState("invite link has expired");
  }
  if (link.max_uses() != 0 && link.use_count() >= link.max_uses()) {
    throw util::InvalidState("invite link has reached its maximum number of uses");
  }
}

} // namespace

InviteService::InviteService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

v1::InviteLinkRecord InviteService::CreateInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                                     const std::string& invite_code, int64_t expires_at,
                                                     uint32_t max_uses) {
  return Observe("InviteService.CreateInviteLink", [&] {
    validation::ValidateInviteCode(invite_code);
    validation::ValidateTimestamp("expires_at", expires_at);
    validation::ValidateCounterLimit("max_uses", max_uses);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    const auto       group   = uow.RequireGroup(group_id, "create invite link");
    const auto       creator = uow.RequireMembership(group_id, caller, "create invite link");

    authz::Target target;
    target.allow_member_invites = group.allow_member_invites();
    authz::Enforce(authz::Evaluate(authz::SubjectOf(creator), authz::Action::kCreateInviteLink, target));

    v1::InviteLinkRecord link;
    link.set_group_id(util::ToBytes(group_id));
    link.set_invite_code(invite_code);
    link.set_created_by(util::ToBytes(caller));
    link.set_expires_at(expires_at);
    link.set_max_uses(max_uses);
    link.set_use_count(0);
    link.set_created_at(util::UnixNow());
    link.set_is_active(true);

    uow.CreateInviteLink(link, caller);
    uow.Commit();

    ROSTER_LOG_INFO("invite link created", {StringField("actor", util::ShortHex(caller)),
                                            StringField("group", util::ShortHex(group_id)),
                                            StringField("code", invite_code), IntField("max_uses", max_uses),
                                            IntField("expires_at", expires_at)});
    return link;
  });
}

v1::InviteLinkRecord InviteService::RevokeInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                                     const std::string& invite_code) {
  return Observe("InviteService.RevokeInviteLink", [&] {
    validation::ValidateInviteCode(invite_code);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             link = uow.LoadInviteLink(group_id, invite_code);
    if (!link) {
      throw util::NotFound("revoke invite link: invite link not found");
    }
    const auto revoker = uow.RequireMembership(group_id, caller, "revoke invite link");

    authz::Target target;
    target.link_creator = util::FromBytes(link->created_by());
    authz::Enforce(authz::Evaluate(authz::SubjectOf(revoker), authz::Action::kRevokeInviteLink, target));

    const bool was_active = link->is_active();
    link->set_is_active(false);
    uow.UpdateInviteLink(*link);
    uow.Commit();

    ROSTER_LOG_INFO("invite link revoked", {StringField("actor", util::ShortHex(caller)),
                                            StringField("group", util::ShortHex(group_id)),
                                            StringField("code", invite_code), BoolField("was_active", was_active)});
    return *link;
  });
}

v1::MembershipRecord InviteService::RedeemInviteLink(const util::Identity& caller, const util::GroupId& group_id,
                                                     const std::string& invite_code,
                                                     const std::string& encrypted_group_key) {
  return Observe("InviteService.RedeemInviteLink", [&] {
    validation::ValidateInviteCode(invite_code);
    validation::ValidateEncryptedGroupKey(encrypted_group_key);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             group = uow.RequireGroup(group_id, "redeem invite link");
    auto             link  = uow.LoadInviteLink(group_id, invite_code);
    if (!link) {
      throw util::NotFound("redeem invite link: invite link not found");
    }
    RequireRedeemable(*link, util::UnixNow());

    const auto creator    = util::FromBytes(link->created_by());
    auto       membership = core::AdmitMember(uow, group, caller, creator, caller, encrypted_group_key);

    link->set_use_count(link->use_count() + 1);
    uow.UpdateInviteLink(*link);
    uow.Commit();

    ROSTER_LOG_INFO("invite link redeemed", {StringField("actor", util::ShortHex(caller)),
                                             StringField("group", util::ShortHex(group_id)),
                                             StringField("code", invite_code), IntField("use_count", link->use_count()),
                                             IntField("member_count", group.member_count())});
    return membership;
  });
}

v1::InviteLinkRecord InviteService::GetInviteLink(const util::GroupId& group_id, const std::string& invite_code) {
  return Observe("InviteService.GetInviteLink", [&] {
    validation::ValidateInviteCode(invite_code);

    core::UnitOfWork uow(*ctx_.repository, *ctx_.deriver);
    auto             link = uow.LoadInviteLink(group_id, invite_code);
    uow.Finish();
    if (!link) {
      throw util::NotFound("get invite link: invite link not found");
    }
    return *std::move(link);
  });
}

}
