#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "roster/v1.hpp"
#if ROSTER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace roster::factory {

namespace {

using roster::observability::BoolField;
using roster::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const roster::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ROSTER_DB_SQLITE
    const auto& sqlite = database.sqlite();
    auto        sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    sqlite_db->Bootstrap();
    ROSTER_LOG_INFO("record store opened", {StringField("backend", "sqlite"), StringField("path", sqlite.path()),
                                            BoolField("wal_mode", sqlite.wal_mode())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  ROSTER_LOG_INFO("record store opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

RuntimeDependencies BuildServices(std::shared_ptr<db::Repository>                   repository,
                                  std::shared_ptr<const addressing::AddressDeriver> deriver) {
  RuntimeDependencies deps;
  deps.repository = std::move(repository);
  deps.deriver    = std::move(deriver);

  service::ServiceContext ctx;
  ctx.repository = deps.repository;
  ctx.deriver    = deps.deriver;

  deps.groups      = std::make_shared<service::GroupService>(ctx);
  deps.memberships = std::make_shared<service::MembershipService>(ctx);
  deps.invites     = std::make_shared<service::InviteService>(ctx);
  deps.lookup      = std::make_shared<service::LookupService>(ctx);
  return deps;
}

RuntimeDependencies BuildRuntime(const roster::runtime::config::RuntimeConfig& config) {
  auto program_namespace = config.addressing().program_namespace();
  if (program_namespace.empty()) {
    program_namespace = roster::v1::kDefaultProgramNamespace;
  }
  auto deriver = std::make_shared<const addressing::AddressDeriver>(std::move(program_namespace));
  return BuildServices(BuildRepository(config), std::move(deriver));
}

}
