#ifndef __AT_OUTPUT_BUFFER__
#define __AT_OUTPUT_BUFFER__

#include "Headers.hpp"

namespace at {
/**
 * @brief One piece of captured process output and the time it was read.
 */
struct OutputChunk {
  chrono::system_clock::time_point timestamp;
  string data;
};

/**
 * @brief Bounded, ordered log of output chunks.
 *
 * When the buffer is full the oldest chunk is dropped to make room, so a
 * slow or absent reader never stalls the producer.  The buffer itself is
 * not synchronized; the owning Session guards it with its own mutex.
 */
class OutputBuffer {
 public:
  /** @brief Capacity used when a non-positive capacity is requested. */
  static constexpr int DEFAULT_CAPACITY = 100;

  explicit OutputBuffer(int _capacity)
      : capacity(_capacity > 0 ? size_t(_capacity) : size_t(DEFAULT_CAPACITY)) {}

  /**
   * @brief Appends a chunk, evicting from the front above capacity.
   * @return The number of chunks evicted.
   */
  size_t append(const chrono::system_clock::time_point &timestamp,
                const string &data) {
    chunks.push_back(OutputChunk{timestamp, data});
    size_t dropped = 0;
    while (chunks.size() > capacity) {
      chunks.pop_front();
      dropped++;
    }
    return dropped;
  }

  /**
   * @brief Returns a copy of every chunk, oldest first.
   */
  vector<OutputChunk> snapshot() const {
    return vector<OutputChunk>(chunks.begin(), chunks.end());
  }

  /**
   * @brief Returns every chunk, oldest first, and empties the buffer.
   */
  vector<OutputChunk> drain() {
    vector<OutputChunk> retval(std::make_move_iterator(chunks.begin()),
                               std::make_move_iterator(chunks.end()));
    chunks.clear();
    return retval;
  }

  size_t size() const { return chunks.size(); }

  size_t getCapacity() const { return capacity; }

  void clear() { chunks.clear(); }

 private:
  std::deque<OutputChunk> chunks;
  size_t capacity;
};
}  // namespace at

#endif  // __AT_OUTPUT_BUFFER__
