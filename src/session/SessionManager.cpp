#include "SessionManager.hpp"

namespace at {
namespace {
const size_t MAX_USER_ID_LENGTH = 255;

/**
 * @brief Counts a creation in flight against the user's quota until it is
 * either registered or abandoned.
 */
class PendingCreate {
 public:
  PendingCreate(mutex* _registryMutex, map<string, int>* _pendingCreates,
                const string& _userId)
      : registryMutex(_registryMutex),
        pendingCreates(_pendingCreates),
        userId(_userId),
        released(false) {}

  ~PendingCreate() {
    if (!released) {
      lock_guard<mutex> guard(*registryMutex);
      release();
    }
  }

  /**
   * @brief Stops counting the creation.  The caller holds the registry mutex
   * and registers the session in the same critical section.
   */
  void release() {
    released = true;
    auto it = pendingCreates->find(userId);
    if (it != pendingCreates->end() && --(it->second) <= 0) {
      pendingCreates->erase(it);
    }
  }

 private:
  mutex* registryMutex;
  map<string, int>* pendingCreates;
  string userId;
  bool released;
};

/**
 * @brief Wipes plaintext secrets however createSession exits.
 */
class SecretWiper {
 public:
  SecretWiper(SessionCredentials* _credentials, TerminalLaunch* _launch)
      : credentials(_credentials), launch(_launch) {}

  ~SecretWiper() {
    wipeString(credentials->mutable_anthropicapikey());
    wipeString(credentials->mutable_githubtoken());
    launch->wipe();
  }

 private:
  SessionCredentials* credentials;
  TerminalLaunch* launch;
};
}  // namespace

SessionManager::SessionManager(const SessionConfig& _config,
                               TerminalFactory _terminalFactory,
                               shared_ptr<StoreWriter> _storeWriter,
                               shared_ptr<CredentialCipher> _cipher)
    : config(_config),
      terminalFactory(_terminalFactory),
      storeWriter(_storeWriter),
      cipher(_cipher),
      stopSweep(false) {
  if (storeWriter && !cipher) {
    LOG(WARNING) << "******************************************************";
    LOG(WARNING) << "No encryption key configured (" << ENCRYPTION_KEY_ENV
                 << "): session credentials will NOT be persisted";
    LOG(WARNING) << "******************************************************";
  }
}

SessionManager::~SessionManager() {
  stopTimeoutChecker();
  cleanupAll();
}

void SessionManager::validateUserId(const string& userId) {
  if (userId.empty()) {
    throw SessionError(ErrorCode::VALIDATION_ERROR, "userId is required");
  }
  if (userId.length() > MAX_USER_ID_LENGTH) {
    throw SessionError(ErrorCode::VALIDATION_ERROR, "userId is too long");
  }
  if (userId == "." || userId.find("..") != string::npos) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "userId contains a path traversal sequence");
  }
  for (char c : userId) {
    unsigned char b = static_cast<unsigned char>(c);
    if (b < 0x20 || b == 0x7F) {
      throw SessionError(ErrorCode::VALIDATION_ERROR,
                         "userId contains control characters");
    }
    if (c == '/' || c == '\\') {
      throw SessionError(ErrorCode::VALIDATION_ERROR,
                         "userId contains path separators");
    }
  }
}

shared_ptr<Session> SessionManager::createSession(
    const string& userId, SessionCredentials credentials,
    const string& workspaceType) {
  TerminalLaunch launch;
  SecretWiper wiper(&credentials, &launch);

  validateUserId(userId);
  string type = workspaceType.empty() ? config.workspaceType : workspaceType;
  if (type != WORKSPACE_ISOLATED && type != WORKSPACE_PERSISTENT) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "workspaceType must be '" + WORKSPACE_ISOLATED +
                           "' or '" + WORKSPACE_PERSISTENT + "'");
  }
  bool isolated = (type == WORKSPACE_ISOLATED);

  {
    lock_guard<mutex> guard(registryMutex);
    int count = 0;
    auto pendingIt = pendingCreates.find(userId);
    if (pendingIt != pendingCreates.end()) {
      count += pendingIt->second;
    }
    for (const auto& it : sessions) {
      if (it.second->getUserId() == userId &&
          !isTerminalState(it.second->getState())) {
        count++;
      }
    }
    if (count >= config.maxPerUser) {
      throw SessionError(ErrorCode::LIMIT_EXCEEDED,
                         "maximum sessions per user (" +
                             to_string(config.maxPerUser) + ") reached");
    }
    pendingCreates[userId]++;
  }
  PendingCreate pending(&registryMutex, &pendingCreates, userId);

  string sessionId = sole::uuid4().str();
  string workspacePath = allocateWorkspace(userId, sessionId, isolated);

  auto session = make_shared<Session>(sessionId, userId, workspacePath,
                                      isolated, terminalFactory(), config);
  session->setObserver(weak_from_this());
  persistNewSession(session, credentials);

  launch.command = config.agentCommand;
  launch.args = config.agentArgs;
  launch.workingDirectory = workspacePath;
  launch.environment[AGENT_API_KEY_ENV] = credentials.anthropicapikey();
  if (!credentials.githubtoken().empty()) {
    launch.environment[AGENT_GITHUB_TOKEN_ENV] = credentials.githubtoken();
  }
  launch.environment["HOME"] = workspacePath;
  launch.environment["PWD"] = workspacePath;

  try {
    session->start(launch);
  } catch (const SessionError&) {
    if (storeWriter) {
      storeWriter->deleteSession(sessionId);
    }
    throw;
  }

  {
    lock_guard<mutex> guard(registryMutex);
    sessions[sessionId] = session;
    pending.release();
  }
  if (storeWriter) {
    storeWriter->updateSessionStatus(sessionId, STATUS_ACTIVE);
  }
  LOG(INFO) << "Created session " << sessionId << " for user " << userId
            << " in " << workspacePath;

  if (isTerminalState(session->getState())) {
    // The agent exited before the session was registered
    onSessionEnded(sessionId, session->getState());
  }
  return session;
}

shared_ptr<Session> SessionManager::getSessionForUser(const string& sessionId,
                                                      const string& userId) {
  lock_guard<mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end() || it->second->getUserId() != userId ||
      isTerminalState(it->second->getState())) {
    throw SessionError(ErrorCode::NOT_FOUND, "session not found");
  }
  return it->second;
}

void SessionManager::terminateSessionForUser(const string& sessionId,
                                             const string& userId) {
  shared_ptr<Session> session;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end() || it->second->getUserId() != userId) {
      throw SessionError(ErrorCode::NOT_FOUND, "session not found");
    }
    session = it->second;
    sessions.erase(it);
  }

  session->cleanup();
  if (storeWriter) {
    storeWriter->updateSessionStatus(sessionId, STATUS_TERMINATED);
    storeWriter->deleteSession(sessionId);
  }
  LOG(INFO) << "Terminated session " << sessionId << " for user " << userId;
}

vector<SessionStatus> SessionManager::listSessionsForUser(const string& userId) {
  vector<SessionStatus> retval;
  {
    lock_guard<mutex> guard(registryMutex);
    for (const auto& it : sessions) {
      if (it.second->getUserId() == userId) {
        retval.push_back(it.second->getStatus());
      }
    }
  }
  std::sort(retval.begin(), retval.end(),
            [](const SessionStatus& a, const SessionStatus& b) {
              return a.created < b.created;
            });
  return retval;
}

int SessionManager::activeSessionCount() {
  lock_guard<mutex> guard(registryMutex);
  return int(sessions.size());
}

int SessionManager::checkTimeouts() {
  return checkTimeouts(chrono::system_clock::now());
}

int SessionManager::checkTimeouts(chrono::system_clock::time_point now) {
  auto cutoff = now - chrono::minutes(config.timeoutMinutes);
  vector<shared_ptr<Session>> expired;
  {
    lock_guard<mutex> guard(registryMutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
      if (!isTerminalState(it->second->getState()) &&
          it->second->getLastActivity() < cutoff) {
        expired.push_back(it->second);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& session : expired) {
    LOG(INFO) << "Session " << session->getId() << " for user "
              << session->getUserId() << " timed out";
    try {
      session->cleanup();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Error cleaning up session " << session->getId() << ": "
                 << ex.what();
    }
    if (storeWriter) {
      storeWriter->updateSessionStatus(session->getId(), STATUS_TERMINATED);
    }
  }
  return int(expired.size());
}

void SessionManager::startTimeoutChecker() {
  lock_guard<mutex> guard(sweepMutex);
  if (sweepThread.joinable()) {
    return;
  }
  stopSweep = false;
  sweepThread = std::thread([this]() { sweepLoop(); });
}

void SessionManager::stopTimeoutChecker() {
  {
    lock_guard<mutex> guard(sweepMutex);
    stopSweep = true;
  }
  sweepCondition.notify_all();
  if (sweepThread.joinable()) {
    sweepThread.join();
  }
}

void SessionManager::sweepLoop() {
  el::Helpers::setThreadName("session-sweep");
  unique_lock<mutex> lock(sweepMutex);
  while (!stopSweep) {
    sweepCondition.wait_for(lock, config.sweepInterval,
                            [this]() { return stopSweep; });
    if (stopSweep) {
      break;
    }
    lock.unlock();
    try {
      int evicted = checkTimeouts();
      if (evicted) {
        LOG(INFO) << "Evicted " << evicted << " idle session(s)";
      }
    } catch (const std::exception& ex) {
      STERROR << "Timeout sweep failed: " << ex.what();
    }
    lock.lock();
  }
}

void SessionManager::cleanupAll() {
  map<string, shared_ptr<Session>> toClean;
  {
    lock_guard<mutex> guard(registryMutex);
    toClean.swap(sessions);
  }
  if (toClean.empty()) {
    return;
  }
  LOG(INFO) << "Cleaning up " << toClean.size() << " session(s)";
  for (auto& it : toClean) {
    try {
      it.second->cleanup();
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Error cleaning up session " << it.first << ": "
                 << ex.what();
    }
    if (storeWriter) {
      storeWriter->updateSessionStatus(it.first, STATUS_TERMINATED);
    }
  }
}

int SessionManager::recoverSessions() {
  if (!storeWriter) {
    return 0;
  }
  try {
    int count = storeWriter->getStore()->markStaleSessionsTerminated();
    LOG(INFO) << "Marked " << count << " stale session(s) as terminated";
    return count;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to recover sessions from store: " << ex.what();
    return 0;
  }
}

vector<StoredOutputChunk> SessionManager::getOutputHistory(
    const string& sessionId, const string& userId, int limit) {
  // Ownership check
  getSessionForUser(sessionId, userId);
  if (!storeWriter) {
    return vector<StoredOutputChunk>();
  }
  // Pending appends have to land before the history is read
  storeWriter->flush();
  return storeWriter->getStore()->getOutputChunks(sessionId, limit);
}

void SessionManager::onSessionOutput(const string& sessionId,
                                     const OutputChunk& chunk) {
  if (storeWriter) {
    storeWriter->appendOutputChunk(sessionId, toEpochMillis(chunk.timestamp),
                                   chunk.data);
  }
}

void SessionManager::onSessionActivity(
    const string& sessionId, chrono::system_clock::time_point lastActivity) {
  if (storeWriter) {
    storeWriter->updateLastActivity(sessionId, toEpochMillis(lastActivity));
  }
}

void SessionManager::onSessionEnded(const string& sessionId,
                                    SessionState finalState) {
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      // Already removed by terminate, the sweep, or shutdown
      return;
    }
    sessions.erase(it);
  }
  LOG(INFO) << "Session " << sessionId << " ended on its own ("
            << sessionStateToString(finalState) << ")";
  if (storeWriter) {
    storeWriter->updateSessionStatus(sessionId, STATUS_TERMINATED);
  }
}

string SessionManager::allocateWorkspace(const string& userId,
                                         const string& sessionId,
                                         bool isolated) {
  std::error_code ec;
  fs::path base = fs::absolute(config.workspaceBasePath, ec).lexically_normal();
  if (ec) {
    throw SessionError(ErrorCode::WORKSPACE_ERROR,
                       "invalid workspace base path: " + ec.message());
  }
  fs::path path = base / userId;
  if (isolated) {
    path /= sessionId;
  }
  path = path.lexically_normal();

  fs::path relative = path.lexically_relative(base);
  if (relative.empty() || *relative.begin() == "..") {
    throw SessionError(ErrorCode::WORKSPACE_ERROR,
                       "workspace path escapes the base directory");
  }

  fs::create_directories(path, ec);
  if (ec) {
    throw SessionError(ErrorCode::WORKSPACE_ERROR,
                       "failed to create workspace: " + ec.message());
  }

  // A symlinked user directory must not lead outside the base
  fs::path canonicalBase = fs::canonical(base, ec);
  fs::path canonicalPath = ec ? fs::path() : fs::canonical(path, ec);
  if (ec) {
    throw SessionError(ErrorCode::WORKSPACE_ERROR,
                       "failed to resolve workspace: " + ec.message());
  }
  relative = canonicalPath.lexically_relative(canonicalBase);
  if (relative.empty() || *relative.begin() == "..") {
    if (isolated) {
      fs::remove_all(path, ec);
    }
    throw SessionError(ErrorCode::WORKSPACE_ERROR,
                       "workspace path escapes the base directory");
  }
  return path.string();
}

void SessionManager::persistNewSession(const shared_ptr<Session>& session,
                                       const SessionCredentials& credentials) {
  if (!storeWriter) {
    return;
  }
  SessionStatus status = session->getStatus();
  SessionRecord record;
  record.set_sessionid(status.sessionId);
  record.set_userid(status.userId);
  record.set_workspacepath(status.workspacePath);
  record.set_status(STATUS_INITIALIZING);
  record.set_lastactivityms(toEpochMillis(status.lastActivity));
  record.set_createdms(toEpochMillis(status.created));
  if (cipher) {
    string plaintext = protoToString(credentials);
    record.set_encryptedcredentials(cipher->encrypt(plaintext));
    wipeString(&plaintext);
  }
  storeWriter->saveSession(record);
}
}  // namespace at
