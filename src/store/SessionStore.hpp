#ifndef __AT_SESSION_STORE__
#define __AT_SESSION_STORE__

#include "Headers.hpp"

namespace at {
const string STATUS_INITIALIZING = "initializing";
const string STATUS_ACTIVE = "active";
const string STATUS_TERMINATED = "terminated";
const string STATUS_ERROR = "error";

/**
 * @brief Durable record of sessions and their output.
 *
 * Implementations throw SessionError(INTERNAL_ERROR) when the backing
 * storage fails.
 */
class SessionStore {
 public:
  virtual ~SessionStore() {}

  /** @brief Inserts or replaces a session record, keyed by session id. */
  virtual void saveSession(const SessionRecord& record) = 0;
  virtual optional<SessionRecord> getSession(const string& sessionId) = 0;
  /** @brief Records owned by `userId`, newest first. */
  virtual vector<SessionRecord> getSessionsForUser(const string& userId) = 0;
  /** @brief Records still marked active or initializing, newest first. */
  virtual vector<SessionRecord> getActiveSessions() = 0;
  virtual void updateSessionStatus(const string& sessionId,
                                   const string& status) = 0;
  virtual void updateLastActivity(const string& sessionId,
                                  int64_t lastActivityMs) = 0;
  /**
   * @brief Appends one output chunk.
   * @return The chunk id, strictly increasing across calls.
   */
  virtual int64_t appendOutputChunk(const string& sessionId,
                                    int64_t timestampMs,
                                    const string& data) = 0;
  /** @brief The most recent `limit` chunks of a session, oldest first. */
  virtual vector<StoredOutputChunk> getOutputChunks(const string& sessionId,
                                                    int limit) = 0;
  /** @brief Deletes a session record together with its output. */
  virtual void deleteSession(const string& sessionId) = 0;
  /**
   * @brief Marks every active or initializing record terminated.  Run at
   * startup, when no process from a previous run can still be alive.
   * @return The number of records changed.
   */
  virtual int markStaleSessionsTerminated() = 0;
};
}  // namespace at

#endif  // __AT_SESSION_STORE__
