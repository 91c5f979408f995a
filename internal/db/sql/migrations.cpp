#include "migrations.hpp"

namespace roster::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int applied = executor.AppliedVersion();
  for (size_t i = 0; i < ordered_sql.size(); ++i) {
    const int version = static_cast<int>(i) + 1;
    if (version <= applied) continue;
    executor.ExecuteSQL(ordered_sql[i]);
    executor.RecordVersion(version);
  }
}

const std::vector<std::string>& RecordStoreMigrations() {
  static const std::vector<std::string> kMigrations = {
      "CREATE TABLE IF NOT EXISTS records (address BLOB PRIMARY KEY, kind INTEGER NOT NULL, data BLOB NOT NULL, payer BLOB NOT NULL, "
      "deposit INTEGER NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS records_kind_idx ON records(kind);",
  };
  return kMigrations;
}

} // namespace roster::db::sql
