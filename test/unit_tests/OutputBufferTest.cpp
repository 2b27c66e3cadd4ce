#include "OutputBuffer.hpp"
#include "TestHeaders.hpp"

using namespace at;

namespace {
chrono::system_clock::time_point at_ms(int64_t ms) {
  return fromEpochMillis(ms);
}
}  // namespace

TEST_CASE("OutputBuffer keeps chunks in order", "[OutputBuffer]") {
  OutputBuffer buffer(10);
  REQUIRE(buffer.size() == 0);
  REQUIRE(buffer.snapshot().empty());

  REQUIRE(buffer.append(at_ms(1), "first") == 0);
  REQUIRE(buffer.append(at_ms(2), "second") == 0);

  auto chunks = buffer.snapshot();
  REQUIRE(chunks.size() == 2);
  REQUIRE(chunks[0].data == "first");
  REQUIRE(chunks[0].timestamp == at_ms(1));
  REQUIRE(chunks[1].data == "second");

  // snapshot does not consume
  REQUIRE(buffer.size() == 2);
}

TEST_CASE("OutputBuffer drops the oldest chunk when full", "[OutputBuffer]") {
  OutputBuffer buffer(3);
  for (int a = 0; a < 3; a++) {
    REQUIRE(buffer.append(at_ms(a), to_string(a)) == 0);
  }
  REQUIRE(buffer.append(at_ms(3), "3") == 1);
  REQUIRE(buffer.append(at_ms(4), "4") == 1);

  auto chunks = buffer.snapshot();
  REQUIRE(chunks.size() == 3);
  REQUIRE(chunks[0].data == "2");
  REQUIRE(chunks[1].data == "3");
  REQUIRE(chunks[2].data == "4");
}

TEST_CASE("OutputBuffer drain empties the buffer", "[OutputBuffer]") {
  OutputBuffer buffer(5);
  buffer.append(at_ms(1), "a");
  buffer.append(at_ms(2), "b");

  auto drained = buffer.drain();
  REQUIRE(drained.size() == 2);
  REQUIRE(drained[0].data == "a");
  REQUIRE(drained[1].data == "b");
  REQUIRE(buffer.size() == 0);
  REQUIRE(buffer.drain().empty());

  buffer.append(at_ms(3), "c");
  REQUIRE(buffer.size() == 1);
  buffer.clear();
  REQUIRE(buffer.size() == 0);
}

TEST_CASE("OutputBuffer falls back to the default capacity",
          "[OutputBuffer]") {
  REQUIRE(OutputBuffer(0).getCapacity() ==
          size_t(OutputBuffer::DEFAULT_CAPACITY));
  REQUIRE(OutputBuffer(-5).getCapacity() ==
          size_t(OutputBuffer::DEFAULT_CAPACITY));
  REQUIRE(OutputBuffer(7).getCapacity() == 7);

  OutputBuffer buffer(1);
  buffer.append(at_ms(1), "old");
  buffer.append(at_ms(2), "new");
  REQUIRE(buffer.size() == 1);
  REQUIRE(buffer.snapshot()[0].data == "new");
}
