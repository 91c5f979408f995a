#pragma once

#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace roster::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result CreateRecord(Transaction&, const model::StoredRecord&) override;
  std::optional<model::StoredRecord> GetRecord(Transaction&, const util::Address&) override;
  Result UpdateRecord(Transaction&, const util::Address&, const std::string& data) override;
  Result DeleteRecord(Transaction&, const util::Address&, const util::Identity& refund_to,
                      model::Refund* refund) override;
  std::vector<model::StoredRecord> ListRecords(Transaction&, model::RecordKind kind) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<util::Address, model::StoredRecord> records;
  };

  // held by a MemoryTransaction for its whole lifetime
  std::mutex tx_mutex_;

  std::mutex state_mutex_;
  State      committed_;
};

}
