#include "sqlite_db.hpp"

#include "internal/store/api/result.hpp"

namespace circulate::store::sqlite {

namespace {

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, msg);
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, msg);
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, msg);
    default:
      return Result::Err(ErrorCode::InternalError, msg);
  }
}

void ThrowIf(int rc, sqlite3* db, const char* what) {
  auto result = Translate(db, rc);
  if (!result) {
    result.message = std::string(what) + ": " + result.message;
    Raise(result);
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    Raise(result);
  }

  Configure(busy_timeout);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    auto result = Translate(db_, rc);
    if (err) result.message = err;
    sqlite3_free(err);
    Raise(result);
  }
}

void SqliteDB::Configure(std::chrono::milliseconds busy_timeout) {
  // WAL lets readers in other processes proceed while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout.count())), db_, "busy_timeout");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(SqliteDB& db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_.Handle(), sql, -1, &stmt_, nullptr), db_.Handle(), "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT), db_.Handle(), "sqlite bind");
}

void Statement::BindBlob(int idx, const std::string& bytes) {
  ThrowIf(sqlite3_bind_blob(stmt_, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT), db_.Handle(), "sqlite bind");
}

void Statement::BindInt64(int idx, int64_t v) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v)), db_.Handle(), "sqlite bind");
}

void Statement::BindNull(int idx) {
  ThrowIf(sqlite3_bind_null(stmt_, idx), db_.Handle(), "sqlite bind");
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  ThrowIf(rc, db_.Handle(), "sqlite step");
  return false;
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col))) : std::string{};
}

std::string Statement::ColBlob(int col) const {
  const void* data = sqlite3_column_blob(stmt_, col);
  const int   size = sqlite3_column_bytes(stmt_, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

int64_t Statement::ColInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

bool Statement::ColIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

} // namespace circulate::store::sqlite
