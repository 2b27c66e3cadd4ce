#ifndef __AT_PSEUDO_USER_TERMINAL__
#define __AT_PSEUDO_USER_TERMINAL__

#include <stdlib.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#else
#include <pty.h>
#endif

#include "RawSocketUtils.hpp"
#include "SessionError.hpp"
#include "SessionTerminal.hpp"

extern char** environ;

namespace at {
/**
 * @brief Forks a pseudo-terminal and runs the agent command inside it.
 */
class PseudoUserTerminal : public SessionTerminal {
 public:
  PseudoUserTerminal() : pid(-1), masterFd(-1) {}

  virtual ~PseudoUserTerminal() {
    if (pid > 0) {
      terminate(chrono::milliseconds(0));
    }
    cleanup();
  }

  virtual int setup(const TerminalLaunch& launch) {
    // Everything the child needs is built before forking so the child only
    // makes async-signal-safe calls.
    vector<string> argStorage;
    argStorage.push_back(launch.command);
    argStorage.insert(argStorage.end(), launch.args.begin(), launch.args.end());
    vector<char*> argv;
    for (auto& arg : argStorage) {
      argv.push_back(&arg[0]);
    }
    argv.push_back(NULL);

    vector<string> envStorage;
    for (char** env = environ; env && *env; env++) {
      string entry(*env);
      auto eq = entry.find('=');
      string name = entry.substr(0, eq);
      if (launch.environment.find(name) == launch.environment.end()) {
        envStorage.push_back(entry);
      }
    }
    for (const auto& it : launch.environment) {
      envStorage.push_back(it.first + "=" + it.second);
    }
    vector<char*> envp;
    for (auto& entry : envStorage) {
      envp.push_back(&entry[0]);
    }
    envp.push_back(NULL);

    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd <= 0) {
      maxFd = 1024;
    }

    // Reports a failed chdir/exec back to the parent.  The write end closes
    // on a successful exec.
    int errorPipe[2];
    {
      // Every descriptor created here must be close-on-exec before another
      // thread forks, or an unrelated agent inherits this session's pty.
      lock_guard<mutex> guard(spawnMutex());
      if (openCloexecPipe(errorPipe) == -1) {
        int localErrno = GetErrno();
        wipeEnvironment(&envStorage);
        throw SessionError(
            ErrorCode::SPAWN_FAILURE,
            string("Cannot create pipe: ") + strerror(localErrno));
      }

      pid = forkpty(&masterFd, NULL, NULL, NULL);
      switch (pid) {
        case -1: {
          int localErrno = GetErrno();
          ::close(errorPipe[0]);
          ::close(errorPipe[1]);
          wipeEnvironment(&envStorage);
          masterFd = -1;
          throw SessionError(ErrorCode::SPAWN_FAILURE,
                             string("forkpty failed: ") + strerror(localErrno));
        }
        case 0: {
          ::close(errorPipe[0]);
          closeInheritedFds(errorPipe[1], static_cast<int>(maxFd));
          runTerminal(launch.workingDirectory, argv.data(), envp.data(),
                      errorPipe[1]);
          // only get here if exec fails
          _exit(127);
        }
        default: {
          // parent
        }
      }
      FATAL_FAIL(::fcntl(masterFd, F_SETFD, FD_CLOEXEC));
    }

    ::close(errorPipe[1]);
    wipeEnvironment(&envStorage);

    int childErrno = 0;
    ssize_t rc;
    do {
      rc = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
    } while (rc == -1 && GetErrno() == EINTR);
    ::close(errorPipe[0]);
    if (rc > 0) {
      int status;
      ::waitpid(pid, &status, 0);
      pid = -1;
      cleanup();
      throw SessionError(ErrorCode::SPAWN_FAILURE,
                         "Cannot launch " + launch.command + ": " +
                             strerror(childErrno));
    }

    int flags = ::fcntl(masterFd, F_GETFL, 0);
    FATAL_FAIL(flags);
    FATAL_FAIL(::fcntl(masterFd, F_SETFL, flags | O_NONBLOCK));
    VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
    return masterFd;
  }

  virtual int getFd() { return masterFd; }

  virtual void write(const string& data) {
    try {
      RawSocketUtils::writeAll(masterFd, data.c_str(), data.length());
    } catch (const std::runtime_error& re) {
      throw SessionError(ErrorCode::IO_FAILURE, re.what());
    }
  }

  /**
   * @brief Applies terminal resize changes via `ioctl(TIOCSWINSZ)`.
   */
  virtual void setInfo(const winsize& tmpwin) {
    if (masterFd < 0 || ::ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
      throw SessionError(ErrorCode::IO_FAILURE,
                         string("Cannot resize terminal: ") +
                             strerror(masterFd < 0 ? EBADF : GetErrno()));
    }
  }

  virtual void terminate(chrono::milliseconds gracePeriod) {
    if (pid <= 0) {
      return;
    }
    // forkpty makes the child a session leader, so signal the whole group
    ::kill(-pid, SIGHUP);
    ::kill(-pid, SIGTERM);
    auto deadline = chrono::steady_clock::now() + gracePeriod;
    while (true) {
      if (reapChild(WNOHANG)) {
        return;
      }
      if (chrono::steady_clock::now() >= deadline) {
        break;
      }
      std::this_thread::sleep_for(chrono::milliseconds(10));
    }
    LOG(INFO) << "Process " << pid << " ignored SIGTERM, sending SIGKILL";
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    reapChild(0);
  }

  virtual void cleanup() {
    if (masterFd >= 0) {
      ::close(masterFd);
      masterFd = -1;
    }
  }

  pid_t getPid() { return pid; }

 protected:
  /**
   * @brief Executes the agent after setting up the PTY child process.
   */
  static void runTerminal(const string& workingDirectory, char* const* argv,
                          char** envp, int errorFd) {
    // The server ignores SIGPIPE and may have SIGCHLD changed, and ignored
    // dispositions survive exec.  Restore the defaults so the agent and the
    // tools it launches see a normal process.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    sigset_t emptySet;
    sigemptyset(&emptySet);
    sigprocmask(SIG_SETMASK, &emptySet, NULL);

    if (!workingDirectory.empty() && ::chdir(workingDirectory.c_str()) == -1) {
      int localErrno = GetErrno();
      (void)!::write(errorFd, &localErrno, sizeof(localErrno));
      _exit(127);
    }
    environ = envp;
    ::execvp(argv[0], argv);
    int localErrno = GetErrno();
    (void)!::write(errorFd, &localErrno, sizeof(localErrno));
  }

  /** @brief Serializes every pty spawn in the process. */
  static mutex& spawnMutex() {
    static mutex m;
    return m;
  }

  static int openCloexecPipe(int fds[2]) {
#if __APPLE__
    if (::pipe(fds) == -1) {
      return -1;
    }
    FATAL_FAIL(::fcntl(fds[0], F_SETFD, FD_CLOEXEC));
    FATAL_FAIL(::fcntl(fds[1], F_SETFD, FD_CLOEXEC));
    return 0;
#else
    return ::pipe2(fds, O_CLOEXEC);
#endif
  }

  /**
   * @brief Closes every descriptor above stderr except `keepFd`.  Runs in
   * the forked child, so it only makes async-signal-safe calls.
   */
  static void closeInheritedFds(int keepFd, int maxFd) {
#ifdef SYS_close_range
    bool lowClosed =
        keepFd <= 3 || ::syscall(SYS_close_range, 3U,
                                 static_cast<unsigned>(keepFd - 1), 0U) == 0;
    if (lowClosed && ::syscall(SYS_close_range,
                               static_cast<unsigned>(keepFd + 1), ~0U,
                               0U) == 0) {
      return;
    }
#endif
    for (int fd = 3; fd < maxFd; fd++) {
      if (fd != keepFd) {
        ::close(fd);
      }
    }
  }

  /**
   * @brief Reaps the child.  Returns true once it is gone.
   */
  bool reapChild(int options) {
    int status;
    pid_t rc;
    do {
      rc = ::waitpid(pid, &status, options);
    } while (rc == -1 && GetErrno() == EINTR);
    if (rc == 0) {
      return false;
    }
    if (rc == -1) {
      LOG(WARNING) << "waitpid(" << pid << ") failed: " << strerror(GetErrno());
    } else {
      VLOG(1) << "Process " << pid << " exited with status " << status;
    }
    pid = -1;
    return true;
  }

  static void wipeEnvironment(vector<string>* envStorage) {
    for (auto& entry : *envStorage) {
      wipeString(&entry);
    }
    envStorage->clear();
  }

  /** @brief PID of the child spawned by `forkpty`. */
  pid_t pid;
  /** @brief Master PTY file descriptor. */
  int masterFd;
};
}  // namespace at

#endif  // __AT_PSEUDO_USER_TERMINAL__
