#include "RawSocketUtils.hpp"
#include "TestHeaders.hpp"

using namespace at;

TEST_CASE("RawSocketUtils writeAll writes all data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  const string payload = "agent output for writeAll";
  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string buffer(payload.size(), '\0');
  RawSocketUtils::readAll(fds[0], &buffer[0], buffer.size());
  REQUIRE(buffer == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll fills a non-blocking pipe",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(::fcntl(fds[1], F_SETFL, O_NONBLOCK) == 0);

  // Bigger than the default pipe buffer so writeAll has to wait on EAGAIN
  const size_t size = 1024 * 1024;
  string payload(size, 'X');

  std::thread writer([&]() {
    RawSocketUtils::writeAll(fds[1], payload.data(), payload.size());
    ::close(fds[1]);
  });

  string buffer(size, '\0');
  RawSocketUtils::readAll(fds[0], &buffer[0], buffer.size());
  REQUIRE(buffer == payload);

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils writeAll times out when nobody reads",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);
  REQUIRE(::fcntl(fds[1], F_SETFL, O_NONBLOCK) == 0);

  string payload(1024 * 1024, 'Z');
  REQUIRE_THROWS_AS(RawSocketUtils::writeAll(fds[1], payload.data(),
                                             payload.size(),
                                             chrono::milliseconds(100)),
                    std::runtime_error);

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils writeAll throws on closed pipe", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  // Close the read end so writes will fail with EPIPE
  ::close(fds[0]);
  signal(SIGPIPE, SIG_IGN);

  const string payload = "test data";
  REQUIRE_THROWS(
      RawSocketUtils::writeAll(fds[1], payload.data(), payload.size()));

  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils readAll throws on early close", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  std::thread writer([&]() {
    const string partial = "partial";
    RawSocketUtils::writeAll(fds[1], partial.data(), partial.size());
    ::close(fds[1]);  // Close before sending all expected data
  });

  char buffer[100];
  REQUIRE_THROWS(RawSocketUtils::readAll(fds[0], buffer, sizeof(buffer)));

  writer.join();
  ::close(fds[0]);
}

TEST_CASE("RawSocketUtils readAll times out without data", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  char buffer[8];
  auto before = chrono::steady_clock::now();
  REQUIRE_THROWS(RawSocketUtils::readAll(fds[0], buffer, sizeof(buffer),
                                         chrono::milliseconds(100)));
  REQUIRE(chrono::steady_clock::now() - before >= chrono::milliseconds(90));

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils handles empty buffers and invalid fds",
          "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  char buffer[1];
  RawSocketUtils::readAll(fds[0], buffer, 0);
  RawSocketUtils::writeAll(fds[1], buffer, 0);

  REQUIRE_THROWS(RawSocketUtils::writeAll(-1, "test", 4));
  REQUIRE_THROWS(RawSocketUtils::readAll(-1, buffer, sizeof(buffer)));

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("RawSocketUtils waits on readable descriptors", "[RawSocketUtils]") {
  int fds[2];
  REQUIRE(::pipe(fds) == 0);

  REQUIRE_FALSE(RawSocketUtils::waitOnReadable(fds[0], chrono::milliseconds(10)));
  REQUIRE(RawSocketUtils::waitOnWritable(fds[1], chrono::milliseconds(10)));
  RawSocketUtils::writeAll(fds[1], "x", 1);
  REQUIRE(RawSocketUtils::waitOnReadable(fds[0], chrono::milliseconds(10)));

  ::close(fds[0]);
  ::close(fds[1]);
}
