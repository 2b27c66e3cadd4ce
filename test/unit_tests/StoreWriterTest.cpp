#include "FakeSessionStore.hpp"
#include "StoreWriter.hpp"
#include "TestHeaders.hpp"

using namespace at;

namespace {
SessionRecord makeRecord(const string& sessionId) {
  SessionRecord record;
  record.set_sessionid(sessionId);
  record.set_userid("alice");
  record.set_workspacepath("/tmp/ws");
  record.set_status(STATUS_INITIALIZING);
  return record;
}
}  // namespace

TEST_CASE("StoreWriter applies writes in order", "[StoreWriter]") {
  auto store = make_shared<FakeSessionStore>();
  StoreWriter writer(store, 3, chrono::milliseconds(1));

  writer.saveSession(makeRecord("s1"));
  writer.updateSessionStatus("s1", STATUS_ACTIVE);
  writer.updateLastActivity("s1", 4242);
  writer.appendOutputChunk("s1", 1, "a");
  writer.appendOutputChunk("s1", 2, "b");
  writer.flush();

  auto record = store->getSession("s1");
  REQUIRE(record.has_value());
  REQUIRE(record->status() == STATUS_ACTIVE);
  REQUIRE(record->lastactivityms() == 4242);
  auto chunks = store->getOutputChunks("s1", 10);
  REQUIRE(chunks.size() == 2);
  REQUIRE(chunks[0].data() == "a");
  REQUIRE(chunks[1].data() == "b");

  writer.deleteSession("s1");
  writer.flush();
  REQUIRE_FALSE(store->getSession("s1").has_value());
  REQUIRE(writer.getFailedWrites() == 0);
  REQUIRE(writer.getStore() == store);
}

TEST_CASE("StoreWriter retries idempotent writes", "[StoreWriter]") {
  auto store = make_shared<FakeSessionStore>();
  StoreWriter writer(store, 3, chrono::milliseconds(1));

  SECTION("Recovers within the attempt budget") {
    store->failNextWrites(2);
    writer.saveSession(makeRecord("s1"));
    writer.flush();
    REQUIRE(store->getSession("s1").has_value());
    REQUIRE(store->getWriteCalls() == 3);
    REQUIRE(writer.getFailedWrites() == 0);
  }

  SECTION("Gives up after the last attempt") {
    store->failNextWrites(3);
    writer.saveSession(makeRecord("s1"));
    writer.flush();
    REQUIRE_FALSE(store->getSession("s1").has_value());
    REQUIRE(writer.getFailedWrites() == 1);

    // Later writes are unaffected
    writer.saveSession(makeRecord("s2"));
    writer.flush();
    REQUIRE(store->getSession("s2").has_value());
  }
}

TEST_CASE("StoreWriter tries output appends once", "[StoreWriter]") {
  auto store = make_shared<FakeSessionStore>();
  StoreWriter writer(store, 3, chrono::milliseconds(1));

  store->failNextWrites(1);
  writer.appendOutputChunk("s1", 1, "lost");
  writer.appendOutputChunk("s1", 2, "kept");
  writer.flush();

  auto chunks = store->getOutputChunks("s1", 10);
  REQUIRE(chunks.size() == 1);
  REQUIRE(chunks[0].data() == "kept");
  REQUIRE(writer.getFailedWrites() == 1);
}

TEST_CASE("StoreWriter finishes queued writes on destruction",
          "[StoreWriter]") {
  auto store = make_shared<FakeSessionStore>();
  {
    StoreWriter writer(store);
    for (int a = 0; a < 50; a++) {
      writer.appendOutputChunk("s1", a, to_string(a));
    }
  }
  REQUIRE(store->getOutputChunks("s1", 100).size() == 50);
}

TEST_CASE("StoreWriter bounds the output backlog of a slow store",
          "[StoreWriter]") {
  auto store = make_shared<FakeSessionStore>();
  store->setWriteDelay(chrono::milliseconds(20));
  StoreWriter writer(store, 3, chrono::milliseconds(1), 4);

  const int NUM_CHUNKS = 100;
  for (int a = 0; a < NUM_CHUNKS; a++) {
    writer.appendOutputChunk("s1", a, to_string(a));
    REQUIRE(writer.getPendingAppends() <= 4);
  }
  writer.flush();

  auto chunks = store->getOutputChunks("s1", NUM_CHUNKS);
  REQUIRE(writer.getPendingAppends() == 0);
  REQUIRE(writer.getFailedWrites() > 0);
  REQUIRE(int64_t(chunks.size()) + writer.getFailedWrites() == NUM_CHUNKS);
  // The oldest output is dropped first, so the newest always lands
  REQUIRE(chunks.back().data() == to_string(NUM_CHUNKS - 1));
  for (size_t a = 1; a < chunks.size(); a++) {
    REQUIRE(chunks[a - 1].timestampms() < chunks[a].timestampms());
  }
}
