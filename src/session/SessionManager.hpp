#ifndef __AT_SESSION_MANAGER__
#define __AT_SESSION_MANAGER__

#include "CredentialCipher.hpp"
#include "Headers.hpp"
#include "ServerConfig.hpp"
#include "Session.hpp"
#include "SessionError.hpp"
#include "SessionTerminal.hpp"
#include "StoreWriter.hpp"

namespace at {
/**
 * @brief Registry of every live session.  Enforces per-user quotas and
 * ownership, allocates workspaces, evicts idle sessions and hands session
 * changes to the store.
 *
 * Must be owned by a shared_ptr: sessions report back through a weak
 * reference to their manager.
 */
class SessionManager : public SessionObserver,
                       public enable_shared_from_this<SessionManager> {
 public:
  typedef function<shared_ptr<SessionTerminal>()> TerminalFactory;

  /**
   * @param _terminalFactory Creates the terminal for each new session.
   * @param _storeWriter Optional persistence, null runs purely in memory.
   * @param _cipher Optional credential encryption.  Without it credentials
   * are never persisted.
   */
  SessionManager(const SessionConfig& _config, TerminalFactory _terminalFactory,
                 shared_ptr<StoreWriter> _storeWriter = nullptr,
                 shared_ptr<CredentialCipher> _cipher = nullptr);

  virtual ~SessionManager();

  /**
   * @brief Validates the request, allocates a workspace, spawns the agent
   * and registers the new session.
   *
   * `credentials` are wiped before this returns or throws.
   * @param workspaceType "isolated", "persistent", or empty for the
   * configured default.
   * @throws SessionError VALIDATION_ERROR, LIMIT_EXCEEDED, WORKSPACE_ERROR
   * or SPAWN_FAILURE.  Nothing is registered when it throws.
   */
  shared_ptr<Session> createSession(const string& userId,
                                    SessionCredentials credentials,
                                    const string& workspaceType = "");

  /**
   * @brief Looks up a live session owned by `userId`.
   * @throws SessionError(NOT_FOUND) for a missing and for a foreign
   * session alike.
   */
  shared_ptr<Session> getSessionForUser(const string& sessionId,
                                        const string& userId);

  /**
   * @brief Removes the session from the registry and cleans it up.
   * @throws SessionError(NOT_FOUND) as getSessionForUser.
   */
  void terminateSessionForUser(const string& sessionId, const string& userId);

  vector<SessionStatus> listSessionsForUser(const string& userId);

  int activeSessionCount();

  /**
   * @brief Evicts every session idle for longer than the timeout.
   * @return The number of sessions evicted.
   */
  int checkTimeouts();
  int checkTimeouts(chrono::system_clock::time_point now);

  /** @brief Starts the periodic sweep.  Does nothing if already running. */
  void startTimeoutChecker();
  void stopTimeoutChecker();

  /** @brief Terminates every session, used on shutdown. */
  void cleanupAll();

  /**
   * @brief Marks records left active by a previous run as terminated.
   * @return The number of records changed, 0 without a store.
   */
  int recoverSessions();

  /**
   * @brief Persisted output history of an owned live session, oldest first.
   * @throws SessionError(NOT_FOUND) as getSessionForUser.
   */
  vector<StoredOutputChunk> getOutputHistory(const string& sessionId,
                                             const string& userId, int limit);

  /** @brief Rejects ids that are empty or unsafe as a path component. */
  static void validateUserId(const string& userId);

  const SessionConfig& getConfig() const { return config; }

  virtual void onSessionOutput(const string& sessionId,
                               const OutputChunk& chunk);
  virtual void onSessionActivity(const string& sessionId,
                                 chrono::system_clock::time_point lastActivity);
  virtual void onSessionEnded(const string& sessionId, SessionState finalState);

 protected:
  string allocateWorkspace(const string& userId, const string& sessionId,
                           bool isolated);
  void persistNewSession(const shared_ptr<Session>& session,
                         const SessionCredentials& credentials);
  void sweepLoop();

  SessionConfig config;
  TerminalFactory terminalFactory;
  shared_ptr<StoreWriter> storeWriter;
  shared_ptr<CredentialCipher> cipher;

  /** @brief Guards sessions and pendingCreates.  Taken before any session
   * lock, never after. */
  mutex registryMutex;
  map<string, shared_ptr<Session>> sessions;
  map<string, int> pendingCreates;

  mutex sweepMutex;
  std::condition_variable sweepCondition;
  bool stopSweep;
  std::thread sweepThread;
};
}  // namespace at

#endif  // __AT_SESSION_MANAGER__
