#ifndef __AT_SESSION_TERMINAL__
#define __AT_SESSION_TERMINAL__

#include "Headers.hpp"

namespace at {
/**
 * @brief Everything needed to launch an agent process in its workspace.
 *
 * `environment` holds variables added on top of the server's own
 * environment and may contain plaintext credentials, so callers wipe() it
 * as soon as the process is spawned.
 */
struct TerminalLaunch {
  string command;
  vector<string> args;
  string workingDirectory;
  map<string, string> environment;

  void wipe() {
    for (auto& it : environment) {
      wipeString(&it.second);
    }
    environment.clear();
  }
};

/**
 * @brief Abstract child process attached to a terminal that can be started,
 * written to, resized, and observed through a fd.
 */
class SessionTerminal {
 public:
  virtual ~SessionTerminal() {}

  /**
   * @brief Spawns the process described by `launch`.
   * @returns File descriptor used for reading process output (typically a
   * master pty).  The descriptor is non-blocking.
   * @throws SessionError(SPAWN_FAILURE) if the process cannot be started.
   */
  virtual int setup(const TerminalLaunch& launch) = 0;
  /** @brief Returns the descriptor that can be polled for output. */
  virtual int getFd() = 0;
  /**
   * @brief Writes bytes to the process input.
   * @throws SessionError(IO_FAILURE) on a failed or stalled write.
   */
  virtual void write(const string& data) = 0;
  /**
   * @brief Applies a window geometry to the running terminal.
   * @throws SessionError(IO_FAILURE) if the geometry cannot be applied.
   */
  virtual void setInfo(const winsize& tmpwin) = 0;
  /**
   * @brief Asks the process to exit, escalates to SIGKILL after
   * `gracePeriod`, and reaps it.
   */
  virtual void terminate(chrono::milliseconds gracePeriod) = 0;
  /** @brief Reclaims the descriptor and any other terminal resources. */
  virtual void cleanup() = 0;
};
}  // namespace at

#endif  // __AT_SESSION_TERMINAL__
