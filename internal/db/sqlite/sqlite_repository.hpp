#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace roster::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result CreateRecord(Transaction&, const model::StoredRecord&) override;
  std::optional<model::StoredRecord> GetRecord(Transaction&, const util::Address&) override;
  Result UpdateRecord(Transaction&, const util::Address&, const std::string& data) override;
  Result DeleteRecord(Transaction&, const util::Address&, const util::Identity& refund_to,
                      model::Refund* refund) override;
  std::vector<model::StoredRecord> ListRecords(Transaction&, model::RecordKind kind) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
