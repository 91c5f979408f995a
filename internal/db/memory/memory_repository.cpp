#include "memory_repository.hpp"

#include "internal/util/time.hpp"
#include "memory_tx.hpp"

namespace roster::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::CreateRecord(Transaction& t, const model::StoredRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.records.contains(r.address)) return Result::Err(ErrorCode::AlreadyExists, "address already holds a record");
  auto& stored = s.records[r.address];
  stored       = r;
  if (stored.created_at_ms == 0) {
    stored.created_at_ms = util::ToUnixMillis(util::Now());
  }
  return Result::Ok();
}

std::optional<model::StoredRecord> MemoryRepository::GetRecord(Transaction& t, const util::Address& address) {
  const auto& s  = TX(t).View();
  auto        it = s.records.find(address);
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRecord(Transaction& t, const util::Address& address, const std::string& data) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(address);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound, "no record at address");
  it->second.data = data;
  return Result::Ok();
}

Result MemoryRepository::DeleteRecord(Transaction& t, const util::Address& address, const util::Identity& refund_to,
                                      model::Refund* refund) {
  auto& s  = TX(t).Mutable();
  auto  it = s.records.find(address);
  if (it == s.records.end()) return Result::Err(ErrorCode::NotFound, "no record at address");
  if (refund) {
    refund->recipient = refund_to;
    refund->amount    = it->second.deposit;
  }
  s.records.erase(it);
  return Result::Ok();
}

std::vector<model::StoredRecord> MemoryRepository::ListRecords(Transaction& t, model::RecordKind kind) {
  std::vector<model::StoredRecord> out;
  for (const auto& [_, record] : TX(t).View().records)
    if (record.kind == kind) out.push_back(record);
  return out;
}

} // namespace roster::db::memory
