#ifndef __AT_STORE_WRITER__
#define __AT_STORE_WRITER__

#include "Headers.hpp"
#include "SessionStore.hpp"

namespace at {
/**
 * @brief Hands store writes to a background worker so callers and draining
 * threads never wait on storage.
 *
 * A single worker keeps writes in submission order.  Idempotent writes are
 * retried with a linear backoff; output appends are attempted once.  At most
 * `maxPendingAppends` appends wait at a time; past that the oldest pending
 * append is dropped and counted as a failed write.
 */
class StoreWriter {
 public:
  explicit StoreWriter(shared_ptr<SessionStore> _store, int _maxAttempts = 3,
                       chrono::milliseconds _retryBackoff =
                           chrono::milliseconds(100),
                       int _maxPendingAppends = 1024);

  /** @brief Finishes every queued write before returning. */
  ~StoreWriter();

  void saveSession(const SessionRecord& record);
  void updateSessionStatus(const string& sessionId, const string& status);
  void updateLastActivity(const string& sessionId, int64_t lastActivityMs);
  void appendOutputChunk(const string& sessionId, int64_t timestampMs,
                         const string& data);
  void deleteSession(const string& sessionId);

  /** @brief Blocks until every write queued so far has been attempted. */
  void flush();

  /** @brief Number of writes that were dropped after their last attempt. */
  int64_t getFailedWrites() const { return failedWrites; }

  /** @brief Number of output appends queued but not yet attempted. */
  int getPendingAppends();

  shared_ptr<SessionStore> getStore() { return store; }

 protected:
  struct PendingAppend {
    string sessionId;
    int64_t timestampMs;
    string data;
  };

  void submit(const string& description, function<void()> write,
              bool idempotent);
  void writeNextAppend();

  shared_ptr<SessionStore> store;
  int maxAttempts;
  chrono::milliseconds retryBackoff;
  int maxPendingAppends;
  atomic<int64_t> failedWrites;
  mutex appendMutex;
  deque<PendingAppend> pendingAppends;
  unique_ptr<ThreadPool> pool;
};
}  // namespace at

#endif  // __AT_STORE_WRITER__
