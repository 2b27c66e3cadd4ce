#include "StoreWriter.hpp"

namespace at {
StoreWriter::StoreWriter(shared_ptr<SessionStore> _store, int _maxAttempts,
                         chrono::milliseconds _retryBackoff,
                         int _maxPendingAppends)
    : store(_store),
      maxAttempts(std::max(1, _maxAttempts)),
      retryBackoff(_retryBackoff),
      maxPendingAppends(std::max(1, _maxPendingAppends)),
      failedWrites(0),
      pool(new ThreadPool(1)) {}

StoreWriter::~StoreWriter() {
  // ThreadPool drains its queue before joining
  pool.reset();
}

void StoreWriter::saveSession(const SessionRecord& record) {
  auto s = store;
  submit("saveSession " + record.sessionid(),
         [s, record]() { s->saveSession(record); }, true);
}

void StoreWriter::updateSessionStatus(const string& sessionId,
                                      const string& status) {
  auto s = store;
  submit("updateSessionStatus " + sessionId,
         [s, sessionId, status]() { s->updateSessionStatus(sessionId, status); },
         true);
}

void StoreWriter::updateLastActivity(const string& sessionId,
                                     int64_t lastActivityMs) {
  auto s = store;
  submit("updateLastActivity " + sessionId,
         [s, sessionId, lastActivityMs]() {
           s->updateLastActivity(sessionId, lastActivityMs);
         },
         true);
}

void StoreWriter::appendOutputChunk(const string& sessionId,
                                    int64_t timestampMs, const string& data) {
  // Every queued entry has exactly one worker task that writes whatever is
  // at the front when it runs, so dropping an entry must not add a task.
  {
    lock_guard<mutex> guard(appendMutex);
    pendingAppends.push_back({sessionId, timestampMs, data});
    if (int(pendingAppends.size()) > maxPendingAppends) {
      LOG_EVERY_N(100, WARNING)
          << "Store is falling behind, dropping output for session "
          << pendingAppends.front().sessionId;
      pendingAppends.pop_front();
      failedWrites++;
      return;
    }
  }
  pool->enqueue([this]() { writeNextAppend(); });
}

void StoreWriter::writeNextAppend() {
  PendingAppend next;
  {
    lock_guard<mutex> guard(appendMutex);
    if (pendingAppends.empty()) {
      return;
    }
    next = std::move(pendingAppends.front());
    pendingAppends.pop_front();
  }
  try {
    store->appendOutputChunk(next.sessionId, next.timestampMs, next.data);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Store write appendOutputChunk " << next.sessionId
               << " failed: " << ex.what();
    failedWrites++;
  }
}

int StoreWriter::getPendingAppends() {
  lock_guard<mutex> guard(appendMutex);
  return int(pendingAppends.size());
}

void StoreWriter::deleteSession(const string& sessionId) {
  auto s = store;
  submit("deleteSession " + sessionId,
         [s, sessionId]() { s->deleteSession(sessionId); }, true);
}

void StoreWriter::flush() { pool->enqueue([]() {}).wait(); }

void StoreWriter::submit(const string& description, function<void()> write,
                         bool idempotent) {
  int attempts = idempotent ? maxAttempts : 1;
  auto backoff = retryBackoff;
  pool->enqueue([this, description, write, attempts, backoff]() {
    for (int attempt = 1; attempt <= attempts; attempt++) {
      try {
        write();
        return;
      } catch (const std::exception& ex) {
        if (attempt == attempts) {
          LOG(ERROR) << "Store write " << description << " failed after "
                     << attempts << " attempt(s): " << ex.what();
          failedWrites++;
          return;
        }
        LOG(WARNING) << "Store write " << description << " failed (attempt "
                     << attempt << "): " << ex.what();
        std::this_thread::sleep_for(backoff * attempt);
      }
    }
  });
}
}  // namespace at
