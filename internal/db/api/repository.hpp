#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/stored_record.hpp"

namespace roster::db {

/*
  Keyed record storage.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - CreateRecord on an occupied address fails with AlreadyExists; it never
    overwrites. This is the only uniqueness mechanism the core relies on.
  - DeleteRecord hands the record's deposit back to the named party

  Addresses are opaque here; the core derives them (see addressing/).
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result CreateRecord(Transaction&, const model::StoredRecord&) = 0;

  virtual std::optional<model::StoredRecord> GetRecord(Transaction&, const util::Address&) = 0;

  // Replaces the payload bytes; kind, payer and deposit are fixed at creation.
  virtual Result UpdateRecord(Transaction&, const util::Address&, const std::string& data) = 0;

  virtual Result DeleteRecord(Transaction&, const util::Address&, const util::Identity& refund_to,
                              model::Refund* refund) = 0;

  virtual std::vector<model::StoredRecord> ListRecords(Transaction&, model::RecordKind kind) = 0;
};

} // namespace roster::db
