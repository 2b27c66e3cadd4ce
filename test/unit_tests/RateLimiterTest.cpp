#include "RateLimiter.hpp"
#include "TestHeaders.hpp"

using namespace at;

TEST_CASE("RateLimiter allows a burst then throttles", "[RateLimiter]") {
  RateLimiter limiter(10.0, 5);
  auto now = chrono::steady_clock::now();

  for (int a = 0; a < 5; a++) {
    REQUIRE(limiter.allow("10.0.0.1", now));
  }
  REQUIRE_FALSE(limiter.allow("10.0.0.1", now));
  // Keys are independent
  REQUIRE(limiter.allow("10.0.0.2", now));

  // One token every 100ms at 10 per second
  REQUIRE(limiter.allow("10.0.0.1", now + chrono::milliseconds(150)));
  REQUIRE_FALSE(limiter.allow("10.0.0.1", now + chrono::milliseconds(150)));

  // A long pause refills no more than the burst
  auto later = now + chrono::seconds(60);
  for (int a = 0; a < 5; a++) {
    REQUIRE(limiter.allow("10.0.0.1", later));
  }
  REQUIRE_FALSE(limiter.allow("10.0.0.1", later));
}

TEST_CASE("RateLimiter purges idle buckets", "[RateLimiter]") {
  RateLimiter limiter(1.0, 2, chrono::seconds(60), chrono::seconds(60));
  auto now = chrono::steady_clock::now();
  limiter.allow("a", now);
  limiter.allow("b", now + chrono::seconds(50));
  REQUIRE(limiter.size() == 2);

  REQUIRE(limiter.purge(now + chrono::seconds(30)) == 0);
  REQUIRE(limiter.purge(now + chrono::seconds(90)) == 1);
  REQUIRE(limiter.size() == 1);
  REQUIRE(limiter.purge(now + chrono::seconds(200)) == 1);
  REQUIRE(limiter.size() == 0);
}

TEST_CASE("RateLimiter purger runs in the background", "[RateLimiter]") {
  RateLimiter limiter(1.0, 2, chrono::seconds(0), chrono::seconds(1));
  limiter.allow("a", chrono::steady_clock::now() - chrono::seconds(5));
  REQUIRE(limiter.size() == 1);

  limiter.startPurger();
  REQUIRE(waitFor([&]() { return limiter.size() == 0; },
                  chrono::seconds(5)));
  limiter.stopPurger();
  limiter.stopPurger();
}
