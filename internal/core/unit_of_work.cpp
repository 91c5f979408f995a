#include "unit_of_work.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace roster::core {

namespace {

using db::model::RecordKind;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

template <typename Record>
Record Parse(const db::model::StoredRecord& stored) {
  Record record;
  if (!record.ParseFromString(stored.data)) {
    throw std::runtime_error(std::string("corrupt ") + db::model::RecordKindName(stored.kind) + " record at " +
                             util::ShortHex(stored.address));
  }
  return record;
}

void RequireBinding(bool matches, RecordKind kind) {
  if (!matches) {
    throw util::InvalidState(std::string(db::model::RecordKindName(kind)) +
                             " record does not match the address it was derived from");
  }
}

} // namespace

uint64_t DepositFor(RecordKind kind) {
  switch (kind) {
    case RecordKind::kGroup:
      return kGroupDeposit;
    case RecordKind::kMembership:
      return kMembershipDeposit;
    case RecordKind::kInviteLink:
      return kInviteLinkDeposit;
    case RecordKind::kCodeLookup:
      return kCodeLookupDeposit;
  }
  return 0;
}

UnitOfWork::UnitOfWork(db::Repository& repository, const addressing::AddressDeriver& deriver)
    : repository_(repository), deriver_(deriver), tx_(repository.Begin()) {
}

std::optional<db::model::StoredRecord> UnitOfWork::Fetch(const addressing::DerivedAddress& derived) {
  auto stored = repository_.GetRecord(*tx_, derived.address);
  if (stored && stored->kind != derived.kind) {
    throw util::InvalidState(std::string("expected ") + db::model::RecordKindName(derived.kind) + " record at " +
                             util::ShortHex(derived.address) + ", found " + db::model::RecordKindName(stored->kind));
  }
  return stored;
}

std::optional<v1::GroupRecord> UnitOfWork::LoadGroup(const util::GroupId& group_id) {
  const auto derived = deriver_.Group(group_id);
  auto       stored  = Fetch(derived);
  if (!stored) return std::nullopt;

  auto record = Parse<v1::GroupRecord>(*stored);
  RequireBinding(record.group_id() == derived.seeds[1], derived.kind);
  return record;
}

v1::GroupRecord UnitOfWork::RequireGroup(const util::GroupId& group_id, std::string_view context) {
  auto group = LoadGroup(group_id);
  if (!group) {
    throw util::NotFound(std::string(context) + ": group not found");
  }
  return *std::move(group);
}

std::optional<v1::MembershipRecord> UnitOfWork::LoadMembership(const util::GroupId& group_id,
                                                               const util::Identity& member) {
  const auto derived = deriver_.Membership(group_id, member);
  auto       stored  = Fetch(derived);
  if (!stored) return std::nullopt;

  auto record = Parse<v1::MembershipRecord>(*stored);
  RequireBinding(record.group_id() == derived.seeds[1] && record.member() == derived.seeds[2], derived.kind);
  return record;
}

v1::MembershipRecord UnitOfWork::RequireMembership(const util::GroupId& group_id, const util::Identity& member,
                                                   std::string_view context) {
  auto membership = LoadMembership(group_id, member);
  if (!membership) {
    throw util::NotFound(std::string(context) + ": not a member of this group");
  }
  return *std::move(membership);
}

std::optional<v1::InviteLinkRecord> UnitOfWork::LoadInviteLink(const util::GroupId& group_id,
                                                               std::string_view invite_code) {
  const auto derived = deriver_.InviteLink(group_id, invite_code);
  auto       stored  = Fetch(derived);
  if (!stored) return std::nullopt;

  auto record = Parse<v1::InviteLinkRecord>(*stored);
  RequireBinding(record.group_id() == derived.seeds[1] && record.invite_code() == derived.seeds[2], derived.kind);
  return record;
}

std::optional<v1::CodeLookupRecord> UnitOfWork::LoadCodeLookup(std::string_view public_code) {
  const auto derived = deriver_.CodeLookup(public_code);
  auto       stored  = Fetch(derived);
  if (!stored) return std::nullopt;

  auto record = Parse<v1::CodeLookupRecord>(*stored);
  RequireBinding(record.public_code() == derived.seeds[1], derived.kind);
  return record;
}

std::vector<v1::GroupRecord> UnitOfWork::ListGroups() {
  std::vector<v1::GroupRecord> out;
  for (const auto& stored : repository_.ListRecords(*tx_, RecordKind::kGroup)) {
    out.push_back(Parse<v1::GroupRecord>(stored));
  }
  return out;
}

std::vector<v1::MembershipRecord> UnitOfWork::ListMemberships(const util::GroupId& group_id) {
  const auto                        group_bytes = util::ToBytes(group_id);
  std::vector<v1::MembershipRecord> out;
  for (const auto& stored : repository_.ListRecords(*tx_, RecordKind::kMembership)) {
    auto record = Parse<v1::MembershipRecord>(stored);
    if (record.group_id() == group_bytes) {
      out.push_back(std::move(record));
    }
  }
  return out;
}

std::vector<v1::MembershipRecord> UnitOfWork::ListMembershipsOf(const util::Identity& member) {
  const auto                        member_bytes = util::ToBytes(member);
  std::vector<v1::MembershipRecord> out;
  for (const auto& stored : repository_.ListRecords(*tx_, RecordKind::kMembership)) {
    auto record = Parse<v1::MembershipRecord>(stored);
    if (record.member() == member_bytes) {
      out.push_back(std::move(record));
    }
  }
  return out;
}

template <typename Record>
void UnitOfWork::Stage(Op op, addressing::DerivedAddress target, const Record& record, const util::Identity& party) {
  if (finished_) {
    throw std::logic_error("unit of work already finished");
  }
  Mutation mutation;
  mutation.op     = op;
  mutation.target = std::move(target);
  mutation.party  = party;
  if (op != Op::kDestroy && !record.SerializeToString(&mutation.data)) {
    throw std::runtime_error(std::string("failed to serialize ") + db::model::RecordKindName(mutation.target.kind) +
                             " record");
  }
  staged_.push_back(std::move(mutation));
}

void UnitOfWork::CreateGroup(const v1::GroupRecord& record, const util::Identity& payer) {
  Stage(Op::kCreate, deriver_.Group(util::FromBytes(record.group_id())), record, payer);
}

void UnitOfWork::CreateMembership(const v1::MembershipRecord& record, const util::Identity& payer) {
  Stage(Op::kCreate, deriver_.Membership(util::FromBytes(record.group_id()), util::FromBytes(record.member())), record,
        payer);
}

void UnitOfWork::CreateInviteLink(const v1::InviteLinkRecord& record, const util::Identity& payer) {
  Stage(Op::kCreate, deriver_.InviteLink(util::FromBytes(record.group_id()), record.invite_code()), record, payer);
}

void UnitOfWork::CreateCodeLookup(const v1::CodeLookupRecord& record, const util::Identity& payer) {
  Stage(Op::kCreate, deriver_.CodeLookup(record.public_code()), record, payer);
}

void UnitOfWork::UpdateGroup(const v1::GroupRecord& record) {
  Stage(Op::kUpdate, deriver_.Group(util::FromBytes(record.group_id())), record, util::Identity{});
}

void UnitOfWork::UpdateMembership(const v1::MembershipRecord& record) {
  Stage(Op::kUpdate, deriver_.Membership(util::FromBytes(record.group_id()), util::FromBytes(record.member())), record,
        util::Identity{});
}

void UnitOfWork::UpdateInviteLink(const v1::InviteLinkRecord& record) {
  Stage(Op::kUpdate, deriver_.InviteLink(util::FromBytes(record.group_id()), record.invite_code()), record,
        util::Identity{});
}

void UnitOfWork::DestroyMembership(const util::GroupId& group_id, const util::Identity& member,
                                   const util::Identity& refund_to) {
  Stage(Op::kDestroy, deriver_.Membership(group_id, member), v1::MembershipRecord{}, refund_to);
}

std::vector<db::model::Refund> UnitOfWork::Commit() {
  if (finished_) {
    throw std::logic_error("unit of work already finished");
  }

  std::vector<db::model::Refund> refunds;
  const auto                     now_ms = util::ToUnixMillis(util::Now());

  for (const auto& mutation : staged_) {
    const auto  kind    = mutation.target.kind;
    const auto& address = mutation.target.address;
    switch (mutation.op) {
      case Op::kCreate: {
        db::model::StoredRecord stored;
        stored.address       = address;
        stored.kind          = kind;
        stored.data          = mutation.data;
        stored.payer         = mutation.party;
        stored.deposit       = DepositFor(kind);
        stored.created_at_ms = now_ms;
        ThrowIfDbError(repository_.CreateRecord(*tx_, stored),
                       std::string("create ") + db::model::RecordKindName(kind));
        break;
      }
      case Op::kUpdate:
        ThrowIfDbError(repository_.UpdateRecord(*tx_, address, mutation.data),
                       std::string("update ") + db::model::RecordKindName(kind));
        break;
      case Op::kDestroy: {
        db::model::Refund refund;
        ThrowIfDbError(repository_.DeleteRecord(*tx_, address, mutation.party, &refund),
                       std::string("destroy ") + db::model::RecordKindName(kind));
        refunds.push_back(refund);
        break;
      }
    }
  }

  tx_->Commit();
  finished_ = true;
  staged_.clear();
  return refunds;
}

void UnitOfWork::Finish() {
  if (finished_) {
    return;
  }
  if (!staged_.empty()) {
    throw std::logic_error("unit of work has staged mutations; commit instead");
  }
  tx_->Commit();
  finished_ = true;
}

} // namespace roster::core
