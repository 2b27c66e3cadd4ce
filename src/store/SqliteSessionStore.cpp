#include "SqliteSessionStore.hpp"

#include "SessionError.hpp"

namespace at {
namespace {
const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS sessions (
    session_id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    workspace_path TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'initializing',
    encrypted_credentials BLOB,
    last_activity INTEGER NOT NULL,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_sessions_user_id ON sessions(user_id);
CREATE INDEX IF NOT EXISTS idx_sessions_status ON sessions(status);

CREATE TABLE IF NOT EXISTS session_output (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    session_id TEXT NOT NULL REFERENCES sessions(session_id) ON DELETE CASCADE,
    timestamp INTEGER NOT NULL,
    data BLOB NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_session_output_session_id ON session_output(session_id);
)SQL";

const char* SESSION_COLUMNS =
    "session_id, user_id, workspace_path, status, encrypted_credentials, "
    "last_activity, created_at, updated_at";

int64_t nowMillis() { return toEpochMillis(chrono::system_clock::now()); }

/**
 * @brief Owns a prepared statement and reports failures as SessionError.
 */
class Statement {
 public:
  Statement(sqlite3* _db, const string& sql) : db(_db), stmt(NULL) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, NULL) != SQLITE_OK) {
      throw SessionError(ErrorCode::INTERNAL_ERROR,
                         string("Cannot prepare statement: ") +
                             sqlite3_errmsg(db));
    }
  }

  ~Statement() { sqlite3_finalize(stmt); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void bind(int index, const string& value) {
    check(sqlite3_bind_text(stmt, index, value.c_str(), int(value.length()),
                            SQLITE_TRANSIENT));
  }

  void bindBlob(int index, const string& value) {
    check(sqlite3_bind_blob(stmt, index, value.data(), int(value.length()),
                            SQLITE_TRANSIENT));
  }

  void bindNull(int index) { check(sqlite3_bind_null(stmt, index)); }

  void bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt, index, sqlite3_int64(value)));
  }

  /** @brief Returns true while rows are available. */
  bool step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw SessionError(ErrorCode::INTERNAL_ERROR,
                       string("Statement failed: ") + sqlite3_errmsg(db));
  }

  string columnText(int index) {
    const void* data = sqlite3_column_blob(stmt, index);
    int length = sqlite3_column_bytes(stmt, index);
    if (data == NULL || length == 0) {
      return "";
    }
    return string((const char*)data, length);
  }

  int64_t columnInt(int index) {
    return int64_t(sqlite3_column_int64(stmt, index));
  }

  bool columnIsNull(int index) {
    return sqlite3_column_type(stmt, index) == SQLITE_NULL;
  }

 private:
  void check(int rc) {
    if (rc != SQLITE_OK) {
      throw SessionError(ErrorCode::INTERNAL_ERROR,
                         string("Cannot bind parameter: ") + sqlite3_errmsg(db));
    }
  }

  sqlite3* db;
  sqlite3_stmt* stmt;
};

SessionRecord readSessionRow(Statement* stmt) {
  SessionRecord record;
  record.set_sessionid(stmt->columnText(0));
  record.set_userid(stmt->columnText(1));
  record.set_workspacepath(stmt->columnText(2));
  record.set_status(stmt->columnText(3));
  if (!stmt->columnIsNull(4)) {
    record.set_encryptedcredentials(stmt->columnText(4));
  }
  record.set_lastactivityms(stmt->columnInt(5));
  record.set_createdms(stmt->columnInt(6));
  record.set_updatedms(stmt->columnInt(7));
  return record;
}
}  // namespace

SqliteSessionStore::SqliteSessionStore(const string& path) : db(NULL) {
  int rc = sqlite3_open_v2(
      path.c_str(), &db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, NULL);
  if (rc != SQLITE_OK) {
    string message = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    db = NULL;
    throw SessionError(ErrorCode::INTERNAL_ERROR,
                       "Cannot open database " + path + ": " + message);
  }
  sqlite3_busy_timeout(db, 3000);
  try {
    exec("PRAGMA foreign_keys = ON;");
    exec(SCHEMA_SQL);
  } catch (const SessionError&) {
    sqlite3_close(db);
    db = NULL;
    throw;
  }
  LOG(INFO) << "Session store opened at " << path;
}

SqliteSessionStore::~SqliteSessionStore() {
  if (db) {
    sqlite3_close(db);
    db = NULL;
  }
}

void SqliteSessionStore::exec(const char* sql) {
  char* errMsg = NULL;
  if (sqlite3_exec(db, sql, NULL, NULL, &errMsg) != SQLITE_OK) {
    string message = errMsg ? errMsg : sqlite3_errmsg(db);
    sqlite3_free(errMsg);
    throw SessionError(ErrorCode::INTERNAL_ERROR, "SQL error: " + message);
  }
}

void SqliteSessionStore::saveSession(const SessionRecord& record) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "INSERT INTO sessions (session_id, user_id, workspace_path, "
                 "status, encrypted_credentials, last_activity, created_at, "
                 "updated_at) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8) "
                 "ON CONFLICT(session_id) DO UPDATE SET "
                 "user_id = excluded.user_id, "
                 "workspace_path = excluded.workspace_path, "
                 "status = excluded.status, "
                 "encrypted_credentials = excluded.encrypted_credentials, "
                 "last_activity = excluded.last_activity, "
                 "updated_at = excluded.updated_at");
  stmt.bind(1, record.sessionid());
  stmt.bind(2, record.userid());
  stmt.bind(3, record.workspacepath());
  stmt.bind(4, record.has_status() ? record.status() : STATUS_INITIALIZING);
  if (record.has_encryptedcredentials()) {
    stmt.bindBlob(5, record.encryptedcredentials());
  } else {
    stmt.bindNull(5);
  }
  int64_t now = nowMillis();
  stmt.bind(6, record.has_lastactivityms() ? record.lastactivityms() : now);
  stmt.bind(7, record.has_createdms() ? record.createdms() : now);
  stmt.bind(8, now);
  stmt.step();
}

optional<SessionRecord> SqliteSessionStore::getSession(
    const string& sessionId) {
  auto records = querySessions(string("SELECT ") + SESSION_COLUMNS +
                                   " FROM sessions WHERE session_id = ?1",
                               {sessionId});
  if (records.empty()) {
    return std::nullopt;
  }
  return records.front();
}

vector<SessionRecord> SqliteSessionStore::getSessionsForUser(
    const string& userId) {
  return querySessions(string("SELECT ") + SESSION_COLUMNS +
                           " FROM sessions WHERE user_id = ?1 "
                           "ORDER BY created_at DESC, rowid DESC",
                       {userId});
}

vector<SessionRecord> SqliteSessionStore::getActiveSessions() {
  return querySessions(string("SELECT ") + SESSION_COLUMNS +
                           " FROM sessions WHERE status IN ('active', "
                           "'initializing') ORDER BY created_at DESC, "
                           "rowid DESC",
                       {});
}

vector<SessionRecord> SqliteSessionStore::querySessions(
    const string& sql, const vector<string>& params) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db, sql);
  for (int a = 0; a < int(params.size()); a++) {
    stmt.bind(a + 1, params[a]);
  }
  vector<SessionRecord> records;
  while (stmt.step()) {
    records.push_back(readSessionRow(&stmt));
  }
  return records;
}

void SqliteSessionStore::updateSessionStatus(const string& sessionId,
                                             const string& status) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "UPDATE sessions SET status = ?1, updated_at = ?2 "
                 "WHERE session_id = ?3");
  stmt.bind(1, status);
  stmt.bind(2, nowMillis());
  stmt.bind(3, sessionId);
  stmt.step();
}

void SqliteSessionStore::updateLastActivity(const string& sessionId,
                                            int64_t lastActivityMs) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "UPDATE sessions SET last_activity = ?1, updated_at = ?2 "
                 "WHERE session_id = ?3");
  stmt.bind(1, lastActivityMs);
  stmt.bind(2, nowMillis());
  stmt.bind(3, sessionId);
  stmt.step();
}

int64_t SqliteSessionStore::appendOutputChunk(const string& sessionId,
                                              int64_t timestampMs,
                                              const string& data) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "INSERT INTO session_output (session_id, timestamp, data) "
                 "VALUES (?1, ?2, ?3)");
  stmt.bind(1, sessionId);
  stmt.bind(2, timestampMs);
  stmt.bindBlob(3, data);
  stmt.step();
  return int64_t(sqlite3_last_insert_rowid(db));
}

vector<StoredOutputChunk> SqliteSessionStore::getOutputChunks(
    const string& sessionId, int limit) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "SELECT id, session_id, timestamp, data FROM session_output "
                 "WHERE session_id = ?1 ORDER BY id DESC LIMIT ?2");
  stmt.bind(1, sessionId);
  stmt.bind(2, int64_t(limit));
  vector<StoredOutputChunk> chunks;
  while (stmt.step()) {
    StoredOutputChunk chunk;
    chunk.set_id(stmt.columnInt(0));
    chunk.set_sessionid(stmt.columnText(1));
    chunk.set_timestampms(stmt.columnInt(2));
    chunk.set_data(stmt.columnText(3));
    chunks.push_back(chunk);
  }
  // Newest rows were selected so the limit keeps the tail; return them in
  // the order they were written
  std::reverse(chunks.begin(), chunks.end());
  return chunks;
}

void SqliteSessionStore::deleteSession(const string& sessionId) {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db, "DELETE FROM sessions WHERE session_id = ?1");
  stmt.bind(1, sessionId);
  stmt.step();
}

int SqliteSessionStore::markStaleSessionsTerminated() {
  lock_guard<recursive_mutex> guard(storeMutex);
  Statement stmt(db,
                 "UPDATE sessions SET status = 'terminated', updated_at = ?1 "
                 "WHERE status IN ('active', 'initializing')");
  stmt.bind(1, nowMillis());
  stmt.step();
  return sqlite3_changes(db);
}
}  // namespace at
