#include "PseudoUserTerminal.hpp"
#include "TestHeaders.hpp"

using namespace at;

#ifdef __linux__
namespace {
/** @brief Counts the pty masters held open by `pid`. */
int countPtyMasters(pid_t pid) {
  int count = 0;
  std::error_code ec;
  fs::path fdDir = fs::path("/proc") / to_string(pid) / "fd";
  for (const auto& entry : fs::directory_iterator(fdDir, ec)) {
    fs::path target = fs::read_symlink(entry.path(), ec);
    if (!ec && target == "/dev/ptmx") {
      count++;
    }
  }
  REQUIRE_FALSE(ec);
  return count;
}
}  // namespace

TEST_CASE("Concurrent spawns do not share pty masters", "[PseudoUserTerminal][pty]") {
  const int NUM_TERMINALS = 16;
  vector<shared_ptr<PseudoUserTerminal>> terminals;
  for (int a = 0; a < NUM_TERMINALS; a++) {
    terminals.push_back(make_shared<PseudoUserTerminal>());
  }

  atomic<int> failures(0);
  vector<thread> spawners;
  for (int a = 0; a < NUM_TERMINALS; a++) {
    spawners.emplace_back([&terminals, &failures, a]() {
      TerminalLaunch launch;
      launch.command = "sleep";
      launch.args = {"5"};
      try {
        terminals[a]->setup(launch);
      } catch (const SessionError& se) {
        LOG(ERROR) << se.what();
        failures++;
      }
    });
  }
  for (auto& it : spawners) {
    it.join();
  }
  REQUIRE(failures.load() == 0);

  for (auto& term : terminals) {
    REQUIRE(term->getPid() > 0);
    REQUIRE(countPtyMasters(term->getPid()) == 0);
  }

  for (auto& term : terminals) {
    term->terminate(chrono::milliseconds(200));
    term->cleanup();
    REQUIRE(term->getPid() == -1);
  }
}
#endif
