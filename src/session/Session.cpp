#include "Session.hpp"

#include "CommandSanitizer.hpp"

namespace at {
namespace {
const int BUF_SIZE = 16 * 1024;
const int MAX_GEOMETRY = 65535;
// Only this many bytes of a command ever reach the log
const size_t COMMAND_LOG_PREVIEW = 50;
}  // namespace

string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::INITIALIZING:
      return "initializing";
    case SessionState::ACTIVE:
      return "active";
    case SessionState::TERMINATED:
      return "terminated";
    case SessionState::ERROR:
      return "error";
  }
  return "unknown";
}

Session::Session(const string& _sessionId, const string& _userId,
                 const string& _workspacePath, bool _isolatedWorkspace,
                 shared_ptr<SessionTerminal> _term,
                 const SessionConfig& _config)
    : sessionId(_sessionId),
      userId(_userId),
      workspacePath(_workspacePath),
      isolatedWorkspace(_isolatedWorkspace),
      term(_term),
      config(_config),
      state(SessionState::INITIALIZING),
      created(chrono::system_clock::now()),
      lastActivity(created),
      outputBuffer(_config.outputBufferSize),
      terminalReleased(false),
      terminalFd(-1),
      shuttingDown(false) {}

Session::~Session() { cleanup(); }

void Session::start(const TerminalLaunch& launch) {
  {
    lock_guard<mutex> guard(sessionMutex);
    if (state != SessionState::INITIALIZING) {
      throw SessionError(ErrorCode::INVALID_STATE,
                         "session cannot be started (status: " +
                             sessionStateToString(state) + ")");
    }
  }

  LOG(INFO) << "Initializing session " << sessionId << " for user " << userId;
  try {
    lock_guard<mutex> guard(terminalMutex);
    terminalFd = term->setup(launch);
  } catch (const SessionError& se) {
    LOG(ERROR) << "Session " << sessionId << " failed to start: " << se.what();
    releaseResources(SessionState::ERROR);
    throw;
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Session " << sessionId << " failed to start: " << ex.what();
    releaseResources(SessionState::ERROR);
    throw SessionError(ErrorCode::SPAWN_FAILURE, ex.what());
  }

  {
    lock_guard<mutex> guard(sessionMutex);
    state = SessionState::ACTIVE;
    lastActivity = chrono::system_clock::now();
  }

  auto self = shared_from_this();
  drainThread = std::thread([self]() { self->drainOutput(); });
  LOG(INFO) << "Session " << sessionId << " initialized successfully";
}

void Session::sendCommand(const string& command) {
  {
    lock_guard<mutex> guard(sessionMutex);
    if (state != SessionState::ACTIVE) {
      throw SessionError(ErrorCode::INVALID_STATE,
                         "session is not active (status: " +
                             sessionStateToString(state) + ")");
    }
    if (command.length() > config.maxCommandLength) {
      throw SessionError(ErrorCode::VALIDATION_ERROR,
                         "command too long (max " +
                             to_string(config.maxCommandLength) + " bytes)");
    }
    auto now = chrono::steady_clock::now();
    if (lastCommandTime && now - *lastCommandTime < config.commandInterval) {
      throw SessionError(ErrorCode::LIMIT_EXCEEDED,
                         "command rate limit exceeded, try again shortly");
    }
    lastCommandTime = now;
  }

  string sanitized = sanitizeCommand(command);
  {
    lock_guard<mutex> guard(terminalMutex);
    if (terminalReleased) {
      throw SessionError(ErrorCode::INVALID_STATE, "session is not active");
    }
    term->write(sanitized);
  }

  chrono::system_clock::time_point now = chrono::system_clock::now();
  {
    lock_guard<mutex> guard(sessionMutex);
    lastActivity = now;
  }
  VLOG(1) << "Command sent to session " << sessionId << ": "
          << sanitized.substr(0, COMMAND_LOG_PREVIEW);

  auto obs = observer.lock();
  if (obs) {
    obs->onSessionActivity(sessionId, now);
  }
}

void Session::handleOutput(const string& data) {
  OutputChunk chunk{chrono::system_clock::now(), data};
  {
    lock_guard<mutex> guard(sessionMutex);
    lastActivity = chunk.timestamp;
    outputBuffer.append(chunk.timestamp, chunk.data);
  }
  auto obs = observer.lock();
  if (obs) {
    obs->onSessionOutput(sessionId, chunk);
  }
}

vector<OutputChunk> Session::getOutput(bool clear) {
  lock_guard<mutex> guard(sessionMutex);
  if (clear) {
    return outputBuffer.drain();
  }
  return outputBuffer.snapshot();
}

void Session::resize(int cols, int rows) {
  {
    lock_guard<mutex> guard(sessionMutex);
    if (state != SessionState::ACTIVE) {
      throw SessionError(ErrorCode::INVALID_STATE,
                         "session is not active (status: " +
                             sessionStateToString(state) + ")");
    }
  }
  if (cols < 1 || cols > MAX_GEOMETRY || rows < 1 || rows > MAX_GEOMETRY) {
    throw SessionError(ErrorCode::VALIDATION_ERROR,
                       "cols and rows must be between 1 and " +
                           to_string(MAX_GEOMETRY));
  }

  winsize tmpwin;
  memset(&tmpwin, 0, sizeof(winsize));
  tmpwin.ws_col = (unsigned short)cols;
  tmpwin.ws_row = (unsigned short)rows;
  {
    lock_guard<mutex> guard(terminalMutex);
    if (terminalReleased) {
      throw SessionError(ErrorCode::INVALID_STATE, "session is not active");
    }
    term->setInfo(tmpwin);
  }

  chrono::system_clock::time_point now = chrono::system_clock::now();
  {
    lock_guard<mutex> guard(sessionMutex);
    lastActivity = now;
  }
  VLOG(1) << "Resized session " << sessionId << " to " << cols << "x" << rows;
  auto obs = observer.lock();
  if (obs) {
    obs->onSessionActivity(sessionId, now);
  }
}

SessionStatus Session::getStatus() const {
  lock_guard<mutex> guard(sessionMutex);
  SessionStatus status;
  status.sessionId = sessionId;
  status.userId = userId;
  status.state = state;
  status.workspacePath = workspacePath;
  status.created = created;
  status.lastActivity = lastActivity;
  status.outputBufferLength = outputBuffer.size();
  return status;
}

void Session::cleanup() {
  lock_guard<mutex> guard(cleanupMutex);
  shuttingDown = true;
  stopDrainThread();
  releaseResources(SessionState::TERMINATED);
}

void Session::drainOutput() {
  el::Helpers::setThreadName("session-" + sessionId.substr(0, 8));
  char b[BUF_SIZE];

  while (!shuttingDown) {
    fd_set rfd;
    timeval tv;

    FD_ZERO(&rfd);
    FD_SET(terminalFd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    int selectRc = select(terminalFd + 1, &rfd, NULL, NULL, &tv);
    if (selectRc < 0) {
      int selectErrno = GetErrno();
      if (selectErrno == EINTR) {
        continue;
      }
      LOG(ERROR) << "Session " << sessionId
                 << " select error: " << strerror(selectErrno);
      handleProcessExit();
      break;
    }
    if (selectRc == 0 || !FD_ISSET(terminalFd, &rfd) || shuttingDown) {
      continue;
    }

    int rc = read(terminalFd, b, BUF_SIZE);
    int readErrno = errno;  // Save errno before any logging
    if (rc > 0) {
      VLOG(4) << "Read " << rc << " bytes from session " << sessionId;
      handleOutput(string(b, rc));
    } else if (rc == 0) {
      LOG(INFO) << "Agent process for session " << sessionId << " ended";
      handleProcessExit();
      break;
    } else if (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
               readErrno == EINTR) {
      // Transient error, retry
      continue;
    } else {
      // A pty master reports EIO once the child side has closed
      if (readErrno == EIO) {
        LOG(INFO) << "Agent process for session " << sessionId << " ended";
      } else {
        LOG(ERROR) << "Session " << sessionId << " read error: " << readErrno
                   << " " << strerror(readErrno);
      }
      handleProcessExit();
      break;
    }
  }
  VLOG(1) << "Output reader for session " << sessionId << " terminated";
}

void Session::handleProcessExit() {
  bool expected = false;
  if (!shuttingDown.compare_exchange_strong(expected, true)) {
    // cleanup() got here first and owns the release
    return;
  }
  releaseResources(SessionState::ERROR);
  auto obs = observer.lock();
  if (obs) {
    obs->onSessionEnded(sessionId, SessionState::ERROR);
  }
}

void Session::releaseResources(SessionState finalState) {
  {
    lock_guard<mutex> guard(terminalMutex);
    if (terminalReleased) {
      return;
    }
    terminalReleased = true;
    LOG(INFO) << "Cleaning up session " << sessionId;
    try {
      term->terminate(config.killGracePeriod);
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Error killing process for session " << sessionId << ": "
                   << ex.what();
    }
    term->cleanup();
    terminalFd = -1;

    if (isolatedWorkspace) {
      std::error_code ec;
      fs::remove_all(workspacePath, ec);
      if (ec) {
        LOG(WARNING) << "Error removing workspace " << workspacePath << ": "
                     << ec.message();
      }
    }
  }

  lock_guard<mutex> guard(sessionMutex);
  state = finalState;
}

void Session::stopDrainThread() {
  if (!drainThread.joinable()) {
    return;
  }
  if (drainThread.get_id() == std::this_thread::get_id()) {
    // The last reference was dropped by the draining thread itself
    drainThread.detach();
  } else {
    drainThread.join();
  }
}
}  // namespace at
