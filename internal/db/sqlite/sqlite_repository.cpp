#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace medsync::db::sqlite {

using medsync::db::ErrorCode;
using medsync::db::Result;

namespace {

constexpr const char* kBootstrapSql[] = {
    "CREATE TABLE IF NOT EXISTS transfer_queue ("
    " id TEXT PRIMARY KEY,"
    " sequence INTEGER NOT NULL,"
    " priority INTEGER NOT NULL DEFAULT 0,"
    " status INTEGER NOT NULL,"
    " offset_bytes INTEGER NOT NULL DEFAULT 0,"
    " record BLOB NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS transfer_queue_order ON transfer_queue(priority DESC, sequence ASC);",
};

class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      stmt_ = nullptr;
    }
  }
  ~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  explicit operator bool() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::TransferRow ReadRow(sqlite3_stmt* st) {
  model::TransferRow r;
  r.id            = ColText(st, 0);
  r.sequence      = ColU64(st, 1);
  r.priority      = ColI32(st, 2);
  r.status        = ColI32(st, 3);
  r.offset        = ColU64(st, 4);
  r.record        = ColBlob(st, 5);
  r.updated_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteTransferRepository::SqliteTransferRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteTransferRepository::BootstrapSchema(SqliteDB& db) {
  for (const auto* sql : kBootstrapSql) {
    db.Exec(sql);
  }
  db.Exec("SELECT id,sequence,priority,status,offset_bytes,record,updated_at_ms FROM transfer_queue LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteTransferRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteTransferRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteTransferRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteTransferRepository::InsertTransfer(Transaction& t, const model::TransferRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO transfer_queue(id,sequence,priority,status,offset_bytes,record,updated_at_ms) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.sequence);
  BindI32(st.get(), 3, r.priority);
  BindI32(st.get(), 4, r.status);
  BindU64(st.get(), 5, r.offset);
  BindBlob(st.get(), 6, r.record);
  BindU64(st.get(), 7, r.updated_at_ms);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, "transfer already queued: " + r.id);
  }
  return Translate(db, rc);
}

Result SqliteTransferRepository::UpdateTransfer(Transaction& t, const model::TransferRow& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE transfer_queue SET sequence=?,priority=?,status=?,offset_bytes=?,record=?,updated_at_ms=? "
               "WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.sequence);
  BindI32(st.get(), 2, r.priority);
  BindI32(st.get(), 3, r.status);
  BindU64(st.get(), 4, r.offset);
  BindBlob(st.get(), 5, r.record);
  BindU64(st.get(), 6, r.updated_at_ms);
  BindText(st.get(), 7, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "transfer not queued: " + r.id);
  }
  return Translate(db, rc);
}

Result SqliteTransferRepository::DeleteTransfer(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM transfer_queue WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TransferRow>
SqliteTransferRepository::GetTransfer(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,sequence,priority,status,offset_bytes,record,updated_at_ms "
               "FROM transfer_queue WHERE id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRow(st.get());
}

std::vector<model::TransferRow> SqliteTransferRepository::ListTransfers(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::TransferRow> rows;
  Statement st(db,
               "SELECT id,sequence,priority,status,offset_bytes,record,updated_at_ms "
               "FROM transfer_queue ORDER BY priority DESC, sequence ASC;");
  if (!st) return rows;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    rows.push_back(ReadRow(st.get()));
  }
  return rows;
}

uint64_t SqliteTransferRepository::MaxSequence(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT COALESCE(MAX(sequence),0) FROM transfer_queue;");
  if (!st || sqlite3_step(st.get()) != SQLITE_ROW) return 0;
  return ColU64(st.get(), 0);
}

} // namespace medsync::db::sqlite
