#ifndef __AT_HEADERS__
#define __AT_HEADERS__

#define CPPHTTPLIB_ZLIB_SUPPORT (1)
#define CPPHTTPLIB_OPENSSL_SUPPORT (1)
// httplib has to come before the system networking headers
#include "httplib.h"

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#else
#include <pty.h>
#endif

#include <arpa/inet.h>
#include <paths.h>
#include <pthread.h>
#include <pwd.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "AT.pb.h"
#include "ThreadPool.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Environment variables that carry server secrets.  They are read once at
// startup and scrubbed so agent processes never inherit them.
const string ENCRYPTION_KEY_ENV = "AT_ENCRYPTION_KEY";
const string API_AUTH_TOKEN_ENV = "AT_API_AUTH_TOKEN";

// Environment variables that carry user credentials into the agent process.
const string AGENT_API_KEY_ENV = "ANTHROPIC_API_KEY";
const string AGENT_GITHUB_TOKEN_ENV = "GITHUB_TOKEN";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef AT_VERSION
#define AT_VERSION "unknown"
#endif

namespace at {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  const char *whitespace = " \t\r\n";
  auto start = s.find_first_not_of(whitespace);
  if (start == string::npos) return "";
  auto end = s.find_last_not_of(whitespace);
  return s.substr(start, end - start + 1);
}

template <typename T>
inline T stringToProto(const string &s) {
  T t;
  if (!t.ParseFromString(s)) {
    throw std::runtime_error("Error parsing string to proto");
  }
  return t;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

/**
 * @brief Overwrites the contents of a string that held secret material.
 */
inline void wipeString(string *s) {
  if (!s->empty()) {
    sodium_memzero(&(*s)[0], s->size());
  }
  s->clear();
}

inline int64_t toEpochMillis(const chrono::system_clock::time_point &tp) {
  return chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch())
      .count();
}

inline chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
  return chrono::system_clock::time_point(chrono::milliseconds(ms));
}

/**
 * @brief Formats a timestamp as RFC3339 in UTC, e.g. 2024-01-31T12:00:00Z.
 */
inline string formatRfc3339(const chrono::system_clock::time_point &tp) {
  time_t rawtime = chrono::system_clock::to_time_t(tp);
  struct tm timeinfo;
  gmtime_r(&rawtime, &timeinfo);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &timeinfo);
  return string(buffer);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}
}  // namespace at

#endif
