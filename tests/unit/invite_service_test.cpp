#include "internal/service/invite_service.hpp"

#include <cassert>
#include <iostream>

#include "internal/service/group_service.hpp"
#include "internal/service/membership_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "service_fixture.hpp"

namespace {

using namespace roster;
using roster::testing::BuildInMemory;
using roster::testing::GroupParams;
using roster::testing::Identity;
using roster::testing::KeyBlob;
using roster::testing::Throws;

const auto kOwner = Identity(0x01);
const auto kGroup = Identity(0x10);

factory::RuntimeDependencies BuildWithGroup(uint32_t max_members = 0) {
  auto app = BuildInMemory();
  app.groups->CreateGroup(kOwner, GroupParams(0x10, "links", max_members));
  return app;
}

void TestCreateRequiresInvitePermission() {
  auto       app    = BuildWithGroup();
  const auto member = Identity(0x02);
  app.memberships->Join(member, kGroup, KeyBlob());

  assert(Throws<util::PermissionDenied>([&] { app.invites->CreateInviteLink(member, kGroup, "Welcome123", 0, 0); }));
  assert(Throws<util::NotFound>([&] { app.invites->CreateInviteLink(Identity(0x50), kGroup, "Welcome123", 0, 0); }));
  assert(Throws<util::ValidationError>([&] { app.invites->CreateInviteLink(kOwner, kGroup, "short", 0, 0); }));
  assert(Throws<util::ValidationError>([&] { app.invites->CreateInviteLink(kOwner, kGroup, "Welcome123", 0, 70000); }));

  const auto link = app.invites->CreateInviteLink(kOwner, kGroup, "Welcome123", 0, 3);
  assert(link.is_active());
  assert(link.use_count() == 0);
  assert(link.max_uses() == 3);
  assert(link.created_by() == util::ToBytes(kOwner));

  assert(Throws<util::AlreadyExists>([&] { app.invites->CreateInviteLink(kOwner, kGroup, "Welcome123", 0, 0); }));
  assert(app.invites->GetInviteLink(kGroup, "Welcome123").max_uses() == 3);
}

void TestRedeemAdmitsAndCounts() {
  auto app = BuildWithGroup();
  app.invites->CreateInviteLink(kOwner, kGroup, "Welcome123", 0, 0);

  const auto joiner = Identity(0x02);
  const auto m      = app.invites->RedeemInviteLink(joiner, kGroup, "Welcome123", KeyBlob());
  assert(m.invited_by() == util::ToBytes(kOwner));
  assert(m.role() == v1::ROLE_MEMBER);

  assert(app.invites->GetInviteLink(kGroup, "Welcome123").use_count() == 1);
  assert(app.groups->GetGroup(kGroup).member_count() == 2);
}

void TestExhaustedLink() {
  auto app = BuildWithGroup();
  app.invites->CreateInviteLink(kOwner, kGroup, "OneShot1", 0, 1);
  app.invites->RedeemInviteLink(Identity(0x02), kGroup, "OneShot1", KeyBlob());

  assert(Throws<util::InvalidState>([&] { app.invites->RedeemInviteLink(Identity(0x03), kGroup, "OneShot1", KeyBlob()); }));
  assert(app.invites->GetInviteLink(kGroup, "OneShot1").use_count() == 1);
  assert(app.groups->GetGroup(kGroup).member_count() == 2);
}

void TestExpiredLink() {
  auto app = BuildWithGroup();
  app.invites->CreateInviteLink(kOwner, kGroup, "Expired1", 1, 0);
  app.invites->CreateInviteLink(kOwner, kGroup, "Future01", util::UnixNow() + 3600, 0);

  assert(Throws<util::InvalidState>([&] { app.invites->RedeemInviteLink(Identity(0x02), kGroup, "Expired1", KeyBlob()); }));
  app.invites->RedeemInviteLink(Identity(0x02), kGroup, "Future01", KeyBlob());
  assert(app.groups->GetGroup(kGroup).member_count() == 2);
}

void TestRevokedLink() {
  auto app = BuildWithGroup();
  app.invites->CreateInviteLink(kOwner, kGroup, "Revoke01", 0, 0);

  auto revoked = app.invites->RevokeInviteLink(kOwner, kGroup, "Revoke01");
  assert(!revoked.is_active());

  // revoking twice succeeds and stays revoked
  revoked = app.invites->RevokeInviteLink(kOwner, kGroup, "Revoke01");
  assert(!revoked.is_active());

  assert(Throws<util::InvalidState>([&] { app.invites->RedeemInviteLink(Identity(0x02), kGroup, "Revoke01", KeyBlob()); }));
  assert(app.invites->GetInviteLink(kGroup, "Revoke01").use_count() == 0);
}

void TestRevokePermissions() {
  auto       app = BuildWithGroup();
  const auto mod = Identity(0x02);
  const auto pleb = Identity(0x03);
  app.memberships->Join(mod, kGroup, KeyBlob());
  app.memberships->Join(pleb, kGroup, KeyBlob());
  app.memberships->UpdateRole(kOwner, kGroup, mod, v1::ROLE_MODERATOR);

  app.invites->CreateInviteLink(mod, kGroup, "ModLink1", 0, 0);
  app.invites->CreateInviteLink(kOwner, kGroup, "OwnLink1", 0, 0);

  assert(Throws<util::PermissionDenied>([&] { app.invites->RevokeInviteLink(pleb, kGroup, "ModLink1"); }));
  assert(Throws<util::NotFound>([&] { app.invites->RevokeInviteLink(Identity(0x60), kGroup, "ModLink1"); }));
  assert(Throws<util::NotFound>([&] { app.invites->RevokeInviteLink(kOwner, kGroup, "Missing1"); }));

  // creator, and any moderator or above
  app.invites->RevokeInviteLink(mod, kGroup, "ModLink1");
  app.invites->RevokeInviteLink(mod, kGroup, "OwnLink1");
  assert(!app.invites->GetInviteLink(kGroup, "OwnLink1").is_active());
}

void TestRedeemIsAtomic() {
  auto app = BuildWithGroup();
  app.invites->CreateInviteLink(kOwner, kGroup, "Atomic01", 0, 5);

  // already a member: the membership create fails, so neither counter moves
  assert(Throws<util::AlreadyExists>([&] { app.invites->RedeemInviteLink(kOwner, kGroup, "Atomic01", KeyBlob()); }));
  assert(app.invites->GetInviteLink(kGroup, "Atomic01").use_count() == 0);
  assert(app.groups->GetGroup(kGroup).member_count() == 1);
}

void TestRedeemRespectsCapacity() {
  auto app = BuildWithGroup(1);
  app.invites->CreateInviteLink(kOwner, kGroup, "FullGrp1", 0, 0);

  assert(Throws<util::CapacityExceeded>([&] { app.invites->RedeemInviteLink(Identity(0x02), kGroup, "FullGrp1", KeyBlob()); }));
  assert(app.invites->GetInviteLink(kGroup, "FullGrp1").use_count() == 0);
}

void TestMissingLinkOrGroup() {
  auto app = BuildWithGroup();
  assert(Throws<util::NotFound>([&] { app.invites->RedeemInviteLink(Identity(0x02), kGroup, "Nothing1", KeyBlob()); }));
  assert(Throws<util::NotFound>([&] { app.invites->RedeemInviteLink(Identity(0x02), Identity(0x99), "Nothing1", KeyBlob()); }));
  assert(Throws<util::NotFound>([&] { app.invites->GetInviteLink(kGroup, "Nothing1"); }));
}

} // namespace

int main() {
  TestCreateRequiresInvitePermission();
  TestRedeemAdmitsAndCounts();
  TestExhaustedLink();
  TestExpiredLink();
  TestRevokedLink();
  TestRevokePermissions();
  TestRedeemIsAtomic();
  TestRedeemRespectsCapacity();
  TestMissingLinkOrGroup();

  std::cout << "roster_unit_invite_service: pass\n";
  return 0;
}
