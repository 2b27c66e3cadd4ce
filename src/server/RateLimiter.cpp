#include "RateLimiter.hpp"

namespace at {
RateLimiter::RateLimiter(double _ratePerSecond, int _burst,
                         chrono::seconds _retention,
                         chrono::seconds _purgeInterval)
    : ratePerSecond(_ratePerSecond),
      burst(double(_burst)),
      retention(_retention),
      purgeInterval(_purgeInterval),
      stopPurge(false) {}

RateLimiter::~RateLimiter() { stopPurger(); }

bool RateLimiter::allow(const string& key) {
  return allow(key, chrono::steady_clock::now());
}

bool RateLimiter::allow(const string& key,
                        chrono::steady_clock::time_point now) {
  lock_guard<mutex> guard(bucketMutex);
  auto it = buckets.find(key);
  if (it == buckets.end()) {
    buckets[key] = Bucket{burst - 1.0, now};
    return true;
  }
  Bucket& bucket = it->second;
  double elapsed = chrono::duration<double>(now - bucket.lastSeen).count();
  if (elapsed > 0) {
    bucket.tokens = std::min(burst, bucket.tokens + elapsed * ratePerSecond);
    bucket.lastSeen = now;
  }
  if (bucket.tokens < 1.0) {
    return false;
  }
  bucket.tokens -= 1.0;
  return true;
}

int RateLimiter::purge(chrono::steady_clock::time_point now) {
  lock_guard<mutex> guard(bucketMutex);
  int purged = 0;
  for (auto it = buckets.begin(); it != buckets.end();) {
    if (now - it->second.lastSeen > retention) {
      it = buckets.erase(it);
      purged++;
    } else {
      ++it;
    }
  }
  return purged;
}

void RateLimiter::startPurger() {
  lock_guard<mutex> guard(purgeMutex);
  if (purgeThread.joinable()) {
    return;
  }
  stopPurge = false;
  purgeThread = std::thread([this]() { purgeLoop(); });
}

void RateLimiter::stopPurger() {
  {
    lock_guard<mutex> guard(purgeMutex);
    stopPurge = true;
  }
  purgeCondition.notify_all();
  if (purgeThread.joinable()) {
    purgeThread.join();
  }
}

size_t RateLimiter::size() {
  lock_guard<mutex> guard(bucketMutex);
  return buckets.size();
}

void RateLimiter::purgeLoop() {
  el::Helpers::setThreadName("ratelimit-purge");
  unique_lock<mutex> lock(purgeMutex);
  while (!stopPurge) {
    purgeCondition.wait_for(lock, purgeInterval,
                            [this]() { return stopPurge; });
    if (stopPurge) {
      break;
    }
    lock.unlock();
    int purged = purge(chrono::steady_clock::now());
    VLOG(1) << "Purged " << purged << " rate limit bucket(s)";
    lock.lock();
  }
}
}  // namespace at
