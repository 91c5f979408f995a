#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstring>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace roster::db::sqlite {

using roster::db::ErrorCode;
using roster::db::Result;

static void BindKey(sqlite3_stmt* st, int idx, const util::Key32& key) {
    sqlite3_bind_blob(st, idx, key.data(), static_cast<int>(key.size()), SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* b = sqlite3_column_blob(st, col);
    const int   n = sqlite3_column_bytes(st, col);
    return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

static util::Key32 ColKey(sqlite3_stmt* st, int col) {
    util::Key32 key{};
    const void* b = sqlite3_column_blob(st, col);
    if (b && sqlite3_column_bytes(st, col) == static_cast<int>(key.size()))
        std::memcpy(key.data(), b, key.size());
    return key;
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::StoredRecord ReadRow(sqlite3_stmt* st) {
    model::StoredRecord r;
    r.address       = ColKey(st, 0);
    r.kind          = static_cast<model::RecordKind>(sqlite3_column_int(st, 1));
    r.data          = ColBlob(st, 2);
    r.payer         = ColKey(st, 3);
    r.deposit       = ColU64(st, 4);
    r.created_at_ms = ColU64(st, 5);
    return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY ||
                sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, "address already holds a record");
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

Result SqliteRepository::CreateRecord(Transaction& t, const model::StoredRecord& r) {
    auto* db = TX(t).Handle();

    // plain INSERT: the primary key rejects an occupied address
    const char* sql =
        "INSERT INTO records(address,kind,data,payer,deposit,created_at_ms) VALUES(?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindKey(st, 1, r.address);
    BindI32(st, 2, static_cast<int>(r.kind));
    BindBlob(st, 3, r.data);
    BindKey(st, 4, r.payer);
    BindU64(st, 5, r.deposit);
    BindU64(st, 6, r.created_at_ms != 0 ? r.created_at_ms : util::ToUnixMillis(util::Now()));

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);
    return result;
}

std::optional<model::StoredRecord>
SqliteRepository::GetRecord(Transaction& t, const util::Address& address) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT address,kind,data,payer,deposit,created_at_ms FROM records WHERE address=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindKey(st, 1, address);

    int rc = sqlite3_step(st);
    if (rc != SQLITE_ROW) {
        Result result = Translate(db, rc);
        sqlite3_finalize(st);
        if (!result)
            throw std::runtime_error("sqlite get record: " + result.message);
        return std::nullopt;
    }

    auto r = ReadRow(st);
    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateRecord(Transaction& t, const util::Address& address, const std::string& data) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE records SET data=? WHERE address=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindBlob(st, 1, data);
    BindKey(st, 2, address);

    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "no record at address");
    return result;
}

Result SqliteRepository::DeleteRecord(Transaction& t, const util::Address& address, const util::Identity& refund_to,
                                      model::Refund* refund) {
    auto existing = GetRecord(t, address);
    if (!existing)
        return Result::Err(ErrorCode::NotFound, "no record at address");

    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM records WHERE address=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindKey(st, 1, address);
    int rc = sqlite3_step(st);
    Result result = Translate(db, rc);
    sqlite3_finalize(st);

    if (result && refund) {
        refund->recipient = refund_to;
        refund->amount    = existing->deposit;
    }
    return result;
}

std::vector<model::StoredRecord> SqliteRepository::ListRecords(Transaction& t, model::RecordKind kind) {
    auto* db = TX(t).Handle();

    const char* sql =
        "SELECT address,kind,data,payer,deposit,created_at_ms FROM records WHERE kind=? ORDER BY address;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindI32(st, 1, static_cast<int>(kind));

    std::vector<model::StoredRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW)
        out.push_back(ReadRow(st));

    Result result = Translate(db, rc);
    sqlite3_finalize(st);
    if (!result)
        throw std::runtime_error("sqlite list records: " + result.message);
    return out;
}

} // namespace roster::db::sqlite
