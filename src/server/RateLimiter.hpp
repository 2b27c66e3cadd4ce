#ifndef __AT_RATE_LIMITER__
#define __AT_RATE_LIMITER__

#include "Headers.hpp"

namespace at {
/**
 * @brief Token bucket per client key (the remote address).
 *
 * Buckets idle for longer than the retention period are purged by a
 * background thread so the map does not grow with every address ever seen.
 */
class RateLimiter {
 public:
  RateLimiter(double _ratePerSecond, int _burst,
              chrono::seconds _retention = chrono::minutes(10),
              chrono::seconds _purgeInterval = chrono::minutes(1));
  ~RateLimiter();

  /** @brief Takes a token for `key`.  Returns false when none is left. */
  bool allow(const string& key);
  bool allow(const string& key, chrono::steady_clock::time_point now);

  /**
   * @brief Drops buckets not used since `now - retention`.
   * @return The number of buckets dropped.
   */
  int purge(chrono::steady_clock::time_point now);

  void startPurger();
  void stopPurger();

  size_t size();

 protected:
  struct Bucket {
    double tokens;
    chrono::steady_clock::time_point lastSeen;
  };

  void purgeLoop();

  double ratePerSecond;
  double burst;
  chrono::seconds retention;
  chrono::seconds purgeInterval;

  mutex bucketMutex;
  unordered_map<string, Bucket> buckets;

  mutex purgeMutex;
  std::condition_variable purgeCondition;
  bool stopPurge;
  std::thread purgeThread;
};
}  // namespace at

#endif  // __AT_RATE_LIMITER__
