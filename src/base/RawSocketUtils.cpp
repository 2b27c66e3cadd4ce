#include "RawSocketUtils.hpp"

namespace at {
namespace {
bool waitOnDescriptor(int fd, bool forWrite, chrono::milliseconds timeout) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = timeout.count() / 1000;
  tv.tv_usec = (timeout.count() % 1000) * 1000;
  int rc = forWrite ? select(fd + 1, NULL, &fdset, NULL, &tv)
                    : select(fd + 1, &fdset, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw std::runtime_error(string("select failed: ") + strerror(GetErrno()));
  }
  return FD_ISSET(fd, &fdset);
}
}  // namespace

bool RawSocketUtils::waitOnWritable(int fd, chrono::milliseconds timeout) {
  return waitOnDescriptor(fd, true, timeout);
}

bool RawSocketUtils::waitOnReadable(int fd, chrono::milliseconds timeout) {
  return waitOnDescriptor(fd, false, timeout);
}

void RawSocketUtils::writeAll(int fd, const char* buf, size_t count,
                              chrono::milliseconds timeout) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  auto deadline = chrono::steady_clock::now() + timeout;
  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        auto remaining = chrono::duration_cast<chrono::milliseconds>(
            deadline - chrono::steady_clock::now());
        if (remaining.count() <= 0) {
          throw std::runtime_error("Timed out writing to descriptor");
        }
        waitOnWritable(fd, remaining);
        continue;
      }
      LOG(ERROR) << "Cannot write to descriptor: " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

void RawSocketUtils::readAll(int fd, char* buf, size_t count,
                             chrono::milliseconds timeout) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAll");
  }
  if (count == 0) {
    return;
  }

  auto deadline = chrono::steady_clock::now() + timeout;
  size_t bytesRead = 0;
  do {
    auto remaining = chrono::duration_cast<chrono::milliseconds>(
        deadline - chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      throw std::runtime_error("Timed out reading from descriptor");
    }
    if (!waitOnReadable(fd, remaining)) {
      continue;
    }
    int rc = ::read(fd, buf + bytesRead, count - bytesRead);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        continue;
      }
      LOG(ERROR) << "Cannot read from descriptor: " << strerror(localErrno);
      throw std::runtime_error("Cannot read from descriptor");
    }
    if (rc == 0) {
      throw std::runtime_error("Descriptor has closed abruptly.");
    }
    bytesRead += rc;
  } while (bytesRead != count);
}
}  // namespace at
