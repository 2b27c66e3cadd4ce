#ifndef __AT_COMMAND_SANITIZER__
#define __AT_COMMAND_SANITIZER__

#include "Headers.hpp"

namespace at {
/**
 * @brief Strips control bytes from a command before it reaches the pty.
 *
 * Every byte below 0x20 is dropped except tab, newline and carriage return.
 * Everything else, including 0x7F and multi-byte UTF-8 sequences, passes
 * through untouched.  Applying it twice gives the same result as once.
 */
inline string sanitizeCommand(const string& command) {
  string retval;
  retval.reserve(command.length());
  for (char c : command) {
    unsigned char b = static_cast<unsigned char>(c);
    if (b >= 0x20 || b == '\n' || b == '\r' || b == '\t') {
      retval.push_back(c);
    }
  }
  return retval;
}
}  // namespace at

#endif  // __AT_COMMAND_SANITIZER__
