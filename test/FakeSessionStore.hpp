#ifndef __AT_FAKE_SESSION_STORE__
#define __AT_FAKE_SESSION_STORE__

#include "SessionError.hpp"
#include "SessionStore.hpp"

namespace at {
/**
 * @brief In-memory SessionStore that can be told to fail its next writes.
 */
class FakeSessionStore : public SessionStore {
 public:
  FakeSessionStore()
      : nextChunkId(1),
        failuresLeft(0),
        writeCalls(0),
        writeDelay(chrono::milliseconds(0)) {}

  virtual void saveSession(const SessionRecord& record) {
    lock_guard<mutex> guard(storeMutex);
    maybeFail();
    records[record.sessionid()] = record;
  }

  virtual optional<SessionRecord> getSession(const string& sessionId) {
    lock_guard<mutex> guard(storeMutex);
    auto it = records.find(sessionId);
    if (it == records.end()) {
      return nullopt;
    }
    return it->second;
  }

  virtual vector<SessionRecord> getSessionsForUser(const string& userId) {
    lock_guard<mutex> guard(storeMutex);
    vector<SessionRecord> retval;
    for (const auto& it : records) {
      if (it.second.userid() == userId) {
        retval.push_back(it.second);
      }
    }
    return retval;
  }

  virtual vector<SessionRecord> getActiveSessions() {
    lock_guard<mutex> guard(storeMutex);
    vector<SessionRecord> retval;
    for (const auto& it : records) {
      if (it.second.status() == STATUS_ACTIVE ||
          it.second.status() == STATUS_INITIALIZING) {
        retval.push_back(it.second);
      }
    }
    return retval;
  }

  virtual void updateSessionStatus(const string& sessionId,
                                   const string& status) {
    lock_guard<mutex> guard(storeMutex);
    maybeFail();
    auto it = records.find(sessionId);
    if (it != records.end()) {
      it->second.set_status(status);
    }
  }

  virtual void updateLastActivity(const string& sessionId,
                                  int64_t lastActivityMs) {
    lock_guard<mutex> guard(storeMutex);
    maybeFail();
    auto it = records.find(sessionId);
    if (it != records.end()) {
      it->second.set_lastactivityms(lastActivityMs);
    }
  }

  virtual int64_t appendOutputChunk(const string& sessionId,
                                    int64_t timestampMs, const string& data) {
    lock_guard<mutex> guard(storeMutex);
    maybeFail();
    StoredOutputChunk chunk;
    chunk.set_id(nextChunkId++);
    chunk.set_sessionid(sessionId);
    chunk.set_timestampms(timestampMs);
    chunk.set_data(data);
    chunks.push_back(chunk);
    return chunk.id();
  }

  virtual vector<StoredOutputChunk> getOutputChunks(const string& sessionId,
                                                    int limit) {
    lock_guard<mutex> guard(storeMutex);
    vector<StoredOutputChunk> retval;
    for (const auto& chunk : chunks) {
      if (chunk.sessionid() == sessionId) {
        retval.push_back(chunk);
      }
    }
    if (limit > 0 && retval.size() > size_t(limit)) {
      retval.erase(retval.begin(), retval.end() - limit);
    }
    return retval;
  }

  virtual void deleteSession(const string& sessionId) {
    lock_guard<mutex> guard(storeMutex);
    maybeFail();
    records.erase(sessionId);
    chunks.erase(std::remove_if(chunks.begin(), chunks.end(),
                                [&sessionId](const StoredOutputChunk& c) {
                                  return c.sessionid() == sessionId;
                                }),
                 chunks.end());
  }

  virtual int markStaleSessionsTerminated() {
    lock_guard<mutex> guard(storeMutex);
    int count = 0;
    for (auto& it : records) {
      if (it.second.status() == STATUS_ACTIVE ||
          it.second.status() == STATUS_INITIALIZING) {
        it.second.set_status(STATUS_TERMINATED);
        count++;
      }
    }
    return count;
  }

  /** @brief Makes the next `count` writes throw INTERNAL_ERROR. */
  void failNextWrites(int count) {
    lock_guard<mutex> guard(storeMutex);
    failuresLeft = count;
  }

  /** @brief Makes every write take at least `delay`. */
  void setWriteDelay(chrono::milliseconds delay) {
    lock_guard<mutex> guard(storeMutex);
    writeDelay = delay;
  }

  int getWriteCalls() {
    lock_guard<mutex> guard(storeMutex);
    return writeCalls;
  }

 protected:
  void maybeFail() {
    writeCalls++;
    if (writeDelay.count() > 0) {
      std::this_thread::sleep_for(writeDelay);
    }
    if (failuresLeft > 0) {
      failuresLeft--;
      throw SessionError(ErrorCode::INTERNAL_ERROR, "fake store failure");
    }
  }

  mutex storeMutex;
  map<string, SessionRecord> records;
  vector<StoredOutputChunk> chunks;
  int64_t nextChunkId;
  int failuresLeft;
  int writeCalls;
  chrono::milliseconds writeDelay;
};
}  // namespace at

#endif  // __AT_FAKE_SESSION_STORE__
