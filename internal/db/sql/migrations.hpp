#pragma once

#include <string>
#include <vector>

namespace roster::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() and the version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 when none.
  virtual int AppliedVersion() = 0;
  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order. Entry i is schema version i + 1; versions
  already applied are skipped.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema of the keyed record store.
const std::vector<std::string>& RecordStoreMigrations();

} // namespace roster::db::sql
