#include "internal/service/group_service.hpp"

#include <cassert>
#include <iostream>

#include "internal/authz/permissions.hpp"
#include "internal/service/membership_service.hpp"
#include "internal/util/errors.hpp"
#include "service_fixture.hpp"

namespace {

using namespace roster;
using roster::testing::BuildInMemory;
using roster::testing::GroupParams;
using roster::testing::Identity;
using roster::testing::KeyBlob;
using roster::testing::Throws;

void TestCreateGroupSeedsOwnerMembership() {
  auto       app   = BuildInMemory();
  const auto alice = Identity(0xA1);

  auto params          = GroupParams(1, "Rustaceans");
  params.is_public     = true;
  params.is_searchable = true;
  auto group           = app.groups->CreateGroup(alice, params);

  assert(group.member_count() == 1);
  assert(group.owner() == util::ToBytes(alice));
  assert(group.public_code().empty());
  assert(group.flags().is_public());
  assert(!group.flags().require_approval());
  assert(group.flags().enable_replies());
  assert(group.flags().enable_reactions());
  assert(group.flags().enable_read_receipts());
  assert(group.flags().enable_typing_indicators());

  const auto owner = app.memberships->GetMember(Identity(1), alice);
  assert(owner.role() == v1::ROLE_OWNER);
  assert(owner.permissions() == authz::kOwnerMask);
  assert(owner.invited_by() == util::ToBytes(alice));
  assert(owner.encrypted_group_key() == std::string(64, '\0'));

  const auto stored = app.groups->GetGroup(Identity(1));
  assert(stored.name() == "Rustaceans");
  assert(stored.member_count() == 1);
}

void TestDuplicateGroupIdLeavesOriginalUntouched() {
  auto app = BuildInMemory();
  app.groups->CreateGroup(Identity(0xA1), GroupParams(1, "first"));

  assert(Throws<util::AlreadyExists>([&] { app.groups->CreateGroup(Identity(0xB2), GroupParams(1, "second")); }));

  const auto group = app.groups->GetGroup(Identity(1));
  assert(group.name() == "first");
  assert(group.owner() == util::ToBytes(Identity(0xA1)));
  assert(group.member_count() == 1);
  assert(Throws<util::NotFound>([&] { app.memberships->GetMember(Identity(1), Identity(0xB2)); }));
}

void TestInvalidInputCreatesNothing() {
  auto app = BuildInMemory();

  auto params = GroupParams(2, "");
  assert(Throws<util::ValidationError>([&] { app.groups->CreateGroup(Identity(0xA1), params); }));

  params                      = GroupParams(2, "ok");
  params.group_encryption_key = "short";
  assert(Throws<util::ValidationError>([&] { app.groups->CreateGroup(Identity(0xA1), params); }));

  params             = GroupParams(2, "ok");
  params.max_members = 70000;
  assert(Throws<util::ValidationError>([&] { app.groups->CreateGroup(Identity(0xA1), params); }));

  assert(Throws<util::NotFound>([&] { app.groups->GetGroup(Identity(2)); }));
}

void TestSetGroupCodeOwnerOnlyAndUnique() {
  auto       app   = BuildInMemory();
  const auto alice = Identity(0xA1);
  const auto bob   = Identity(0xB2);
  app.groups->CreateGroup(alice, GroupParams(1, "one"));
  app.groups->CreateGroup(bob, GroupParams(2, "two"));

  assert(Throws<util::PermissionDenied>([&] { app.groups->SetGroupCode(bob, Identity(1), "abc"); }));
  assert(Throws<util::ValidationError>([&] { app.groups->SetGroupCode(alice, Identity(1), "ABC"); }));
  assert(Throws<util::NotFound>([&] { app.groups->SetGroupCode(alice, Identity(9), "abc"); }));

  const auto updated = app.groups->SetGroupCode(alice, Identity(1), "abc");
  assert(updated.public_code() == "abc");

  assert(Throws<util::AlreadyExists>([&] { app.groups->SetGroupCode(bob, Identity(2), "abc"); }));
  assert(app.groups->GetGroup(Identity(2)).public_code().empty());

  // same code again on the same group: the lookup is already claimed
  assert(Throws<util::AlreadyExists>([&] { app.groups->SetGroupCode(alice, Identity(1), "abc"); }));
}

void TestSearchPublicGroups() {
  auto       app   = BuildInMemory();
  const auto alice = Identity(0xA1);

  auto visible          = GroupParams(1, "Rust Devs");
  visible.is_public     = true;
  visible.is_searchable = true;
  app.groups->CreateGroup(alice, visible);

  auto unlisted      = GroupParams(2, "Rust Secret");
  unlisted.is_public = true;
  app.groups->CreateGroup(alice, unlisted);

  auto other          = GroupParams(3, "Go Gophers");
  other.is_public     = true;
  other.is_searchable = true;
  app.groups->CreateGroup(alice, other);

  const auto rust = app.groups->SearchPublicGroups("rUsT");
  assert(rust.size() == 1);
  assert(rust[0].name() == "Rust Devs");

  const auto all = app.groups->SearchPublicGroups("");
  assert(all.size() == 2);
  assert(all[0].name() == "Go Gophers");
  assert(all[1].name() == "Rust Devs");
}

void TestListGroupsForMember() {
  auto       app   = BuildInMemory();
  const auto alice = Identity(0xA1);
  const auto bob   = Identity(0xB2);
  app.groups->CreateGroup(alice, GroupParams(1, "alpha"));
  app.groups->CreateGroup(alice, GroupParams(2, "beta"));
  app.groups->CreateGroup(bob, GroupParams(3, "gamma"));
  app.memberships->Join(bob, Identity(1), KeyBlob());

  assert(app.groups->ListGroupsForMember(alice).size() == 2);

  const auto bobs = app.groups->ListGroupsForMember(bob);
  assert(bobs.size() == 2);
  assert(bobs[0].name() == "alpha");
  assert(bobs[1].name() == "gamma");

  assert(app.groups->ListGroupsForMember(Identity(0xCC)).empty());
}

} // namespace

int main() {
  TestCreateGroupSeedsOwnerMembership();
  TestDuplicateGroupIdLeavesOriginalUntouched();
  TestInvalidInputCreatesNothing();
  TestSetGroupCodeOwnerOnlyAndUnique();
  TestSearchPublicGroups();
  TestListGroupsForMember();

  std::cout << "roster_unit_group_service: pass\n";
  return 0;
}
