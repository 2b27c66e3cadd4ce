#ifndef __AT_RAW_SOCKET_UTILS__
#define __AT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace at {
/**
 * @brief Bounded-wait wrappers around POSIX read/write loops on
 * non-blocking descriptors.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, waiting for the
   * descriptor to become writable between partial writes.
   * @throws std::runtime_error on a write error or if the descriptor stays
   * unwritable for longer than `timeout`.
   */
  static void writeAll(int fd, const char* buf, size_t count,
                       chrono::milliseconds timeout = chrono::seconds(5));

  /**
   * @brief Reads exactly `count` bytes from the descriptor, waiting for data.
   * @throws std::runtime_error on EOF, a read error, or timeout.
   */
  static void readAll(int fd, char* buf, size_t count,
                      chrono::milliseconds timeout = chrono::seconds(5));

  /**
   * @brief Waits up to `timeout` for the descriptor to become writable.
   */
  static bool waitOnWritable(int fd, chrono::milliseconds timeout);

  /**
   * @brief Waits up to `timeout` for the descriptor to become readable.
   */
  static bool waitOnReadable(int fd, chrono::milliseconds timeout);
};
}  // namespace at
#endif  // __AT_RAW_SOCKET_UTILS__
