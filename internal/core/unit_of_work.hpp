#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/addressing/address_deriver.hpp"
#include "internal/db/api/repository.hpp"
#include "roster/v1.hpp"

namespace roster::core {

/*
  Deposit reserved per record kind, returned to the refund recipient when the
  record is destroyed. Sizes follow the on-chain account layout of the
  reference program.
*/
inline constexpr uint64_t kGroupDeposit      = 813;
inline constexpr uint64_t kMembershipDeposit = 191;
inline constexpr uint64_t kInviteLinkDeposit = 114;
inline constexpr uint64_t kCodeLookupDeposit = 65;

uint64_t DepositFor(db::model::RecordKind kind);

/*
  UnitOfWork

  One storage transaction plus a list of staged mutations.

  - Loads go straight to the transaction and verify that the loaded record's
    key fields match the seeds its address was derived from.
  - Create/Update/Destroy only stage. Nothing reaches storage until Commit(),
    which applies every staged mutation in order and then commits.
  - Any failure before or during Commit() leaves storage untouched: the
    transaction rolls back when the unit of work is destroyed.

  Staged mutations are not visible to later loads on the same unit of work;
  callers load everything first, decide, then stage.
*/
class UnitOfWork {
 public:
  UnitOfWork(db::Repository& repository, const addressing::AddressDeriver& deriver);

  UnitOfWork(const UnitOfWork&)            = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  std::optional<v1::GroupRecord> LoadGroup(const util::GroupId& group_id);
  v1::GroupRecord                RequireGroup(const util::GroupId& group_id, std::string_view context);

  std::optional<v1::MembershipRecord> LoadMembership(const util::GroupId& group_id, const util::Identity& member);
  v1::MembershipRecord RequireMembership(const util::GroupId& group_id, const util::Identity& member,
                                         std::string_view context);

  std::optional<v1::InviteLinkRecord> LoadInviteLink(const util::GroupId& group_id, std::string_view invite_code);
  std::optional<v1::CodeLookupRecord> LoadCodeLookup(std::string_view public_code);

  std::vector<v1::GroupRecord>      ListGroups();
  std::vector<v1::MembershipRecord> ListMemberships(const util::GroupId& group_id);
  std::vector<v1::MembershipRecord> ListMembershipsOf(const util::Identity& member);

  // payer funds the deposit of the created record
  void CreateGroup(const v1::GroupRecord& record, const util::Identity& payer);
  void CreateMembership(const v1::MembershipRecord& record, const util::Identity& payer);
  void CreateInviteLink(const v1::InviteLinkRecord& record, const util::Identity& payer);
  void CreateCodeLookup(const v1::CodeLookupRecord& record, const util::Identity& payer);

  void UpdateGroup(const v1::GroupRecord& record);
  void UpdateMembership(const v1::MembershipRecord& record);
  void UpdateInviteLink(const v1::InviteLinkRecord& record);

  void DestroyMembership(const util::GroupId& group_id, const util::Identity& member, const util::Identity& refund_to);

  // Applies all staged mutations atomically. Returns the refunds of destroyed records.
  std::vector<db::model::Refund> Commit();

  // Ends a read-only unit of work.
  void Finish();

  std::size_t StagedCount() const {
    return staged_.size();
  }

 private:
  enum class Op { kCreate, kUpdate, kDestroy };

  struct Mutation {
    Op                               op = Op::kCreate;
    addressing::DerivedAddress       target;
    std::string                      data;
    util::Identity                   party{};  // payer on create, refund recipient on destroy
  };

  std::optional<db::model::StoredRecord> Fetch(const addressing::DerivedAddress& derived);

  template <typename Record>
  void Stage(Op op, addressing::DerivedAddress target, const Record& record, const util::Identity& party);

  db::Repository&                   repository_;
  const addressing::AddressDeriver& deriver_;
  std::unique_ptr<db::Transaction>  tx_;
  std::vector<Mutation>             staged_;
  bool                              finished_ = false;
};

} // namespace roster::core
