#include "SessionError.hpp"
#include "SqliteSessionStore.hpp"
#include "TestHeaders.hpp"

using namespace at;

namespace {
SessionRecord makeRecord(const string& sessionId, const string& userId,
                         const string& status, int64_t createdMs) {
  SessionRecord record;
  record.set_sessionid(sessionId);
  record.set_userid(userId);
  record.set_workspacepath("/tmp/agentterminal-sessions/" + userId + "/" +
                           sessionId);
  record.set_status(status);
  record.set_lastactivityms(createdMs);
  record.set_createdms(createdMs);
  return record;
}
}  // namespace

TEST_CASE("SqliteSessionStore saves and loads records",
          "[SqliteSessionStore]") {
  SqliteSessionStore store(":memory:");

  SessionRecord record = makeRecord("s1", "alice", STATUS_ACTIVE, 1000);
  // Ciphertext is arbitrary binary, embedded NULs included
  record.set_encryptedcredentials(string("\x00\x01\xff secret", 10));
  store.saveSession(record);

  auto loaded = store.getSession("s1");
  REQUIRE(loaded.has_value());
  REQUIRE(loaded->sessionid() == "s1");
  REQUIRE(loaded->userid() == "alice");
  REQUIRE(loaded->workspacepath() == record.workspacepath());
  REQUIRE(loaded->status() == STATUS_ACTIVE);
  REQUIRE(loaded->encryptedcredentials() == record.encryptedcredentials());
  REQUIRE(loaded->lastactivityms() == 1000);
  REQUIRE(loaded->createdms() == 1000);
  REQUIRE(loaded->updatedms() > 0);

  REQUIRE_FALSE(store.getSession("missing").has_value());

  SECTION("Saving again updates in place") {
    record.set_status(STATUS_TERMINATED);
    record.clear_encryptedcredentials();
    store.saveSession(record);
    REQUIRE(store.getSessionsForUser("alice").size() == 1);
    REQUIRE(store.getSession("s1")->status() == STATUS_TERMINATED);
    REQUIRE_FALSE(store.getSession("s1")->has_encryptedcredentials());
  }

  SECTION("Status and activity updates") {
    store.updateSessionStatus("s1", STATUS_ERROR);
    store.updateLastActivity("s1", 5000);
    auto updated = store.getSession("s1");
    REQUIRE(updated->status() == STATUS_ERROR);
    REQUIRE(updated->lastactivityms() == 5000);
    REQUIRE(updated->createdms() == 1000);

    // Updating a missing record is not an error
    store.updateSessionStatus("missing", STATUS_ERROR);
  }
}

TEST_CASE("SqliteSessionStore queries by user and status",
          "[SqliteSessionStore]") {
  SqliteSessionStore store(":memory:");
  store.saveSession(makeRecord("old", "alice", STATUS_ACTIVE, 1000));
  store.saveSession(makeRecord("new", "alice", STATUS_INITIALIZING, 2000));
  store.saveSession(makeRecord("done", "alice", STATUS_TERMINATED, 3000));
  store.saveSession(makeRecord("other", "bob", STATUS_ACTIVE, 4000));

  auto alice = store.getSessionsForUser("alice");
  REQUIRE(alice.size() == 3);
  REQUIRE(alice[0].sessionid() == "done");
  REQUIRE(alice[1].sessionid() == "new");
  REQUIRE(alice[2].sessionid() == "old");

  auto active = store.getActiveSessions();
  REQUIRE(active.size() == 3);
  REQUIRE(active[0].sessionid() == "other");

  REQUIRE(store.markStaleSessionsTerminated() == 3);
  REQUIRE(store.getActiveSessions().empty());
  REQUIRE(store.getSession("other")->status() == STATUS_TERMINATED);
  REQUIRE(store.markStaleSessionsTerminated() == 0);
}

TEST_CASE("SqliteSessionStore keeps output history", "[SqliteSessionStore]") {
  SqliteSessionStore store(":memory:");
  store.saveSession(makeRecord("s1", "alice", STATUS_ACTIVE, 1000));
  store.saveSession(makeRecord("s2", "alice", STATUS_ACTIVE, 1000));

  int64_t lastId = 0;
  for (int a = 0; a < 5; a++) {
    int64_t id = store.appendOutputChunk("s1", 1000 + a, "chunk" + to_string(a));
    REQUIRE(id > lastId);
    lastId = id;
  }
  store.appendOutputChunk("s2", 1000, string("\x1b[0m\x00", 5));

  auto all = store.getOutputChunks("s1", 100);
  REQUIRE(all.size() == 5);
  REQUIRE(all[0].data() == "chunk0");
  REQUIRE(all[4].data() == "chunk4");
  REQUIRE(all[4].timestampms() == 1004);
  REQUIRE(all[4].sessionid() == "s1");

  // The limit keeps the most recent chunks, still oldest first
  auto tail = store.getOutputChunks("s1", 2);
  REQUIRE(tail.size() == 2);
  REQUIRE(tail[0].data() == "chunk3");
  REQUIRE(tail[1].data() == "chunk4");

  REQUIRE(store.getOutputChunks("s2", 10)[0].data() == string("\x1b[0m\x00", 5));

  // Output belongs to a known session
  REQUIRE(errorCodeOf([&]() { store.appendOutputChunk("nope", 1, "x"); }) ==
          ErrorCode::INTERNAL_ERROR);

  store.deleteSession("s1");
  REQUIRE_FALSE(store.getSession("s1").has_value());
  REQUIRE(store.getOutputChunks("s1", 100).empty());
  REQUIRE(store.getOutputChunks("s2", 100).size() == 1);
}

TEST_CASE("SqliteSessionStore persists to disk", "[SqliteSessionStore]") {
  string directory = makeTempDirectory("at_store");
  string path = directory + "/sessions.db";
  {
    SqliteSessionStore store(path);
    store.saveSession(makeRecord("s1", "alice", STATUS_ACTIVE, 1000));
    store.appendOutputChunk("s1", 1000, "hello");
  }
  {
    SqliteSessionStore store(path);
    REQUIRE(store.getSession("s1")->status() == STATUS_ACTIVE);
    REQUIRE(store.getOutputChunks("s1", 10).size() == 1);
  }
  fs::remove_all(directory);

  REQUIRE(errorCodeOf([]() {
            SqliteSessionStore store("/nonexistent-directory/at/sessions.db");
          }) == ErrorCode::INTERNAL_ERROR);
}
