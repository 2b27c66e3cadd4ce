#ifndef __AT_SQLITE_SESSION_STORE__
#define __AT_SQLITE_SESSION_STORE__

#include <sqlite3.h>

#include "SessionStore.hpp"

namespace at {
/**
 * @brief SessionStore backed by a single SQLite database file.
 *
 * One connection is shared by all callers and serialized by storeMutex.
 */
class SqliteSessionStore : public SessionStore {
 public:
  /**
   * @brief Opens (creating if needed) the database and applies the schema.
   * @param path Database file, or ":memory:" for a private in-memory db.
   * @throws SessionError(INTERNAL_ERROR) if the database cannot be opened.
   */
  explicit SqliteSessionStore(const string& path);
  virtual ~SqliteSessionStore();

  virtual void saveSession(const SessionRecord& record);
  virtual optional<SessionRecord> getSession(const string& sessionId);
  virtual vector<SessionRecord> getSessionsForUser(const string& userId);
  virtual vector<SessionRecord> getActiveSessions();
  virtual void updateSessionStatus(const string& sessionId,
                                   const string& status);
  virtual void updateLastActivity(const string& sessionId,
                                  int64_t lastActivityMs);
  virtual int64_t appendOutputChunk(const string& sessionId,
                                    int64_t timestampMs, const string& data);
  virtual vector<StoredOutputChunk> getOutputChunks(const string& sessionId,
                                                    int limit);
  virtual void deleteSession(const string& sessionId);
  virtual int markStaleSessionsTerminated();

 protected:
  void exec(const char* sql);
  vector<SessionRecord> querySessions(const string& sql,
                                      const vector<string>& params);

  sqlite3* db;
  recursive_mutex storeMutex;
};
}  // namespace at

#endif  // __AT_SQLITE_SESSION_STORE__
