#ifndef __AT_SESSION__
#define __AT_SESSION__

#include "Headers.hpp"
#include "OutputBuffer.hpp"
#include "ServerConfig.hpp"
#include "SessionError.hpp"
#include "SessionTerminal.hpp"

namespace at {
enum class SessionState { INITIALIZING, ACTIVE, TERMINATED, ERROR };

string sessionStateToString(SessionState state);

inline bool isTerminalState(SessionState state) {
  return state == SessionState::TERMINATED || state == SessionState::ERROR;
}

/**
 * @brief Point-in-time copy of a session's observable fields.
 */
struct SessionStatus {
  string sessionId;
  string userId;
  SessionState state;
  string workspacePath;
  chrono::system_clock::time_point created;
  chrono::system_clock::time_point lastActivity;
  size_t outputBufferLength;
};

/**
 * @brief Receives events from a session's draining thread and command path.
 *
 * Callbacks are made without any session lock held.
 */
class SessionObserver {
 public:
  virtual ~SessionObserver() {}

  virtual void onSessionOutput(const string& sessionId,
                               const OutputChunk& chunk) = 0;
  virtual void onSessionActivity(
      const string& sessionId, chrono::system_clock::time_point lastActivity) = 0;
  /**
   * @brief The agent process ended without cleanup() being called.  The
   * session has already released its resources.
   */
  virtual void onSessionEnded(const string& sessionId,
                              SessionState finalState) = 0;
};

/**
 * @brief One agent process attached to a pty, its output buffer, and the
 * thread that drains the pty into the buffer.
 *
 * State moves initializing -> active -> {terminated, error} and never
 * leaves a terminal state.  Sessions must be owned by a shared_ptr since
 * the draining thread keeps the session alive while it runs.
 */
class Session : public enable_shared_from_this<Session> {
 public:
  Session(const string& _sessionId, const string& _userId,
          const string& _workspacePath, bool _isolatedWorkspace,
          shared_ptr<SessionTerminal> _term, const SessionConfig& _config);

  ~Session();

  void setObserver(weak_ptr<SessionObserver> _observer) {
    observer = _observer;
  }

  /**
   * @brief Spawns the agent and starts draining its output.
   *
   * On failure the terminal and an isolated workspace are released, the
   * session moves to error, and the SessionError is rethrown.
   */
  void start(const TerminalLaunch& launch);

  /**
   * @brief Sanitizes and writes a command to the agent.
   * @throws SessionError INVALID_STATE, VALIDATION_ERROR, LIMIT_EXCEEDED or
   * IO_FAILURE.
   */
  void sendCommand(const string& command);

  /**
   * @brief Records a piece of process output.  Called by the draining thread.
   */
  void handleOutput(const string& data);

  /**
   * @brief Returns the buffered output oldest first, emptying the buffer
   * atomically when `clear` is set.
   */
  vector<OutputChunk> getOutput(bool clear);

  /**
   * @brief Changes the pty geometry.
   * @throws SessionError INVALID_STATE, VALIDATION_ERROR or IO_FAILURE.
   */
  void resize(int cols, int rows);

  SessionStatus getStatus() const;

  /**
   * @brief Stops the draining thread, kills and reaps the agent, closes the
   * pty and removes an isolated workspace.  Safe to call more than once and
   * from any thread.
   */
  void cleanup();

  const string& getId() const { return sessionId; }

  const string& getUserId() const { return userId; }

  const string& getWorkspacePath() const { return workspacePath; }

  SessionState getState() const {
    lock_guard<mutex> guard(sessionMutex);
    return state;
  }

  chrono::system_clock::time_point getLastActivity() const {
    lock_guard<mutex> guard(sessionMutex);
    return lastActivity;
  }

  /** @brief Overrides the activity clock, used to age sessions in tests. */
  void setLastActivity(chrono::system_clock::time_point tp) {
    lock_guard<mutex> guard(sessionMutex);
    lastActivity = tp;
  }

 protected:
  void drainOutput();
  void handleProcessExit();
  void releaseResources(SessionState finalState);
  void stopDrainThread();

  string sessionId;
  string userId;
  string workspacePath;
  bool isolatedWorkspace;
  shared_ptr<SessionTerminal> term;
  SessionConfig config;
  weak_ptr<SessionObserver> observer;

  /** @brief Guards state, the activity clocks and the output buffer. */
  mutable mutex sessionMutex;
  SessionState state;
  chrono::system_clock::time_point created;
  chrono::system_clock::time_point lastActivity;
  optional<chrono::steady_clock::time_point> lastCommandTime;
  OutputBuffer outputBuffer;

  /** @brief Serializes writes, resizes and the one-time release. */
  mutex terminalMutex;
  bool terminalReleased;
  int terminalFd;

  mutex cleanupMutex;
  atomic<bool> shuttingDown;
  std::thread drainThread;
};
}  // namespace at

#endif  // __AT_SESSION__
