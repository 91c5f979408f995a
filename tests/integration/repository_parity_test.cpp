#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/stored_record.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "tests/unit/service_fixture.hpp"

#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using roster::db::ErrorCode;
using roster::db::Repository;
using roster::db::memory::MemoryRepository;
using roster::db::model::RecordKind;
using roster::db::model::Refund;
using roster::db::model::StoredRecord;
using roster::util::Address;
using roster::util::Identity;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

Address AddressFor(uint8_t tag, uint8_t seq) {
  Address address{};
  address[0]  = tag;
  address[31] = seq;
  return address;
}

Identity Party(uint8_t tag) {
  Identity id{};
  id.fill(tag);
  return id;
}

StoredRecord MakeRecord(const Address& address, RecordKind kind, const std::string& data) {
  StoredRecord record;
  record.address = address;
  record.kind    = kind;
  record.data    = data;
  record.payer   = Party(0xAA);
  record.deposit = 191;
  return record;
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

void VerifyCreateReadUpdateDelete(Repository& repo, uint8_t tag) {
  const auto address = AddressFor(tag, 1);
  auto       tx      = repo.Begin();

  assert(repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kMembership, "v1")));

  auto read = repo.GetRecord(*tx, address);
  assert(read.has_value());
  assert(read->kind == RecordKind::kMembership);
  assert(read->data == "v1");
  assert(read->payer == Party(0xAA));
  assert(read->deposit == 191);
  assert(read->created_at_ms != 0);

  assert(repo.UpdateRecord(*tx, address, "v2"));
  auto updated = repo.GetRecord(*tx, address);
  assert(updated.has_value());
  assert(updated->data == "v2");
  assert(updated->deposit == 191);

  Refund refund;
  assert(repo.DeleteRecord(*tx, address, Party(0xBB), &refund));
  assert(refund.recipient == Party(0xBB));
  assert(refund.amount == 191);
  assert(!repo.GetRecord(*tx, address).has_value());

  tx->Commit();
}

void VerifyCreateNeverOverwrites(Repository& repo, uint8_t tag) {
  const auto address = AddressFor(tag, 2);
  {
    auto tx = repo.Begin();
    assert(repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, "first")));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto second = repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, "second"));
  assert(!second);
  assert(second.code == ErrorCode::AlreadyExists);

  auto read = repo.GetRecord(*tx, address);
  assert(read.has_value());
  assert(read->data == "first");
  tx->Commit();
}

void VerifyMissingRecordErrors(Repository& repo, uint8_t tag) {
  const auto address = AddressFor(tag, 3);
  auto       tx      = repo.Begin();

  assert(!repo.GetRecord(*tx, address).has_value());

  auto update = repo.UpdateRecord(*tx, address, "x");
  assert(update.code == ErrorCode::NotFound);

  Refund refund;
  auto   del = repo.DeleteRecord(*tx, address, Party(0x01), &refund);
  assert(del.code == ErrorCode::NotFound);
  assert(refund.amount == 0);

  tx->Commit();
}

void VerifyListByKind(Repository& repo, uint8_t tag) {
  {
    auto tx = repo.Begin();
    assert(repo.CreateRecord(*tx, MakeRecord(AddressFor(tag, 10), RecordKind::kInviteLink, "a")));
    assert(repo.CreateRecord(*tx, MakeRecord(AddressFor(tag, 11), RecordKind::kInviteLink, "b")));
    assert(repo.CreateRecord(*tx, MakeRecord(AddressFor(tag, 12), RecordKind::kCodeLookup, "c")));
    tx->Commit();
  }

  auto tx    = repo.Begin();
  auto links = repo.ListRecords(*tx, RecordKind::kInviteLink);
  assert(links.size() == 2);
  assert(links[0].data == "a");
  assert(links[1].data == "b");

  auto lookups = repo.ListRecords(*tx, RecordKind::kCodeLookup);
  assert(lookups.size() == 1);
  assert(lookups[0].kind == RecordKind::kCodeLookup);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, uint8_t tag) {
  const auto address = AddressFor(tag, 4);
  {
    auto tx = repo.Begin();
    assert(repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, "rolled back")));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, "dropped")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetRecord(*tx, address).has_value());
  tx->Commit();
}

void VerifySerializedTransactions(Repository& repo, uint8_t tag) {
  const auto address = AddressFor(tag, 5);

  // every thread races to claim the same address; exactly one may win
  constexpr int     kThreads = 8;
  std::vector<int>  wins(kThreads, 0);
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto tx     = repo.Begin();
      auto result = repo.CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, std::to_string(i)));
      if (result) {
        tx->Commit();
        wins[i] = 1;
      } else {
        assert(result.code == ErrorCode::AlreadyExists);
        tx->Rollback();
      }
    });
  }
  for (auto& t : threads) t.join();

  int total = 0;
  for (int w : wins) total += w;
  assert(total == 1);
}

void VerifyRestartDurability(BackendFactory& backend, uint8_t tag) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo    = backend.make_repository();
  const auto address = AddressFor(tag, 6);
  {
    auto tx = repo->Begin();
    assert(repo->CreateRecord(*tx, MakeRecord(address, RecordKind::kGroup, std::string("\0binary\xff", 8))));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx   = repo->Begin();
  auto read = repo->GetRecord(*tx, address);
  assert(read.has_value());
  assert(read->data == std::string("\0binary\xff", 8));
  assert(read->payer == Party(0xAA));
  tx->Commit();

  backend.cleanup();
}

Identity StoredPayer(Repository& repo, const roster::addressing::AddressDeriver& deriver, const Identity& group,
                    const Identity& member) {
  auto tx     = repo.Begin();
  auto stored = repo.GetRecord(*tx, deriver.Membership(group, member).address);
  tx->Commit();
  assert(stored.has_value());
  return stored->payer;
}

// Services on top of the backend: counter and membership writes land together
// or not at all.
void VerifyServiceScenario(const std::shared_ptr<Repository>& repo, uint8_t tag) {
  namespace fixture = roster::testing;
  using roster::v1::ROLE_OWNER;

  auto deriver = std::make_shared<const roster::addressing::AddressDeriver>("roster.integration");
  auto app     = roster::factory::BuildServices(repo, deriver);

  const auto owner   = Party(0x01);
  const auto member  = Party(0x02);
  const auto invitee = Party(0x03);
  const auto group   = Party(tag);

  app.groups->CreateGroup(owner, fixture::GroupParams(tag, "parity", 3));
  app.memberships->Join(member, group, fixture::KeyBlob());
  app.memberships->Invite(owner, group, invitee, fixture::KeyBlob());
  assert(app.groups->GetGroup(group).member_count() == 3);
  assert(StoredPayer(*repo, *deriver, group, member) == member);
  assert(StoredPayer(*repo, *deriver, group, invitee) == owner);

  // full: nothing is written
  assert(fixture::Throws<roster::util::CapacityExceeded>([&] { app.memberships->Join(Party(0x04), group, fixture::KeyBlob()); }));
  assert(fixture::Throws<roster::util::NotFound>([&] { app.memberships->GetMember(group, Party(0x04)); }));
  assert(app.groups->GetGroup(group).member_count() == 3);

  app.memberships->Leave(invitee, group);
  assert(app.groups->GetGroup(group).member_count() == 2);

  // single-use link: redemption moves the link, the membership and the counter together
  app.invites->CreateInviteLink(owner, group, "Single01", 0, 1);
  const auto redeemed = app.invites->RedeemInviteLink(Party(0x05), group, "Single01", fixture::KeyBlob());
  assert(redeemed.invited_by() == roster::util::ToBytes(owner));
  assert(app.invites->GetInviteLink(group, "Single01").use_count() == 1);
  assert(app.groups->GetGroup(group).member_count() == 3);

  app.memberships->Leave(Party(0x05), group);
  assert(fixture::Throws<roster::util::InvalidState>(
      [&] { app.invites->RedeemInviteLink(Party(0x06), group, "Single01", fixture::KeyBlob()); }));
  assert(fixture::Throws<roster::util::NotFound>([&] { app.memberships->GetMember(group, Party(0x06)); }));

  // an existing member redeeming fails at commit; use_count and member_count stay put
  app.invites->CreateInviteLink(owner, group, "Reusable", 0, 0);
  assert(fixture::Throws<roster::util::AlreadyExists>(
      [&] { app.invites->RedeemInviteLink(member, group, "Reusable", fixture::KeyBlob()); }));
  assert(app.invites->GetInviteLink(group, "Reusable").use_count() == 0);
  assert(app.groups->GetGroup(group).member_count() == 2);

  const auto members = app.memberships->ListMembers(group);
  assert(members.size() == 2);
  assert(members.front().role() == ROLE_OWNER);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if ROSTER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path   = (std::filesystem::temp_directory_path() / ("roster_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto db = std::make_shared<roster::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<roster::db::sqlite::SqliteRepository>(std::move(db));
  };
  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  VerifyCreateReadUpdateDelete(*repo, 1);
  VerifyCreateNeverOverwrites(*repo, 2);
  VerifyMissingRecordErrors(*repo, 3);
  VerifyListByKind(*repo, 4);
  VerifyRollbackBehavior(*repo, 5);
  VerifySerializedTransactions(*repo, 6);
  VerifyServiceScenario(repo, 0x70);
  repo.reset();
  VerifyRestartDurability(backend, 7);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ROSTER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "roster_integration_repository_parity: pass\n";
  return 0;
}
