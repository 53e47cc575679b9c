#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace gateway {

// Splits an arriving byte stream into newline-delimited message lines.
//
// Chunks are appended in arrival order. When the accumulated data exceeds
// max_bytes without a line terminator the buffer is discarded and the
// overflow is reported. Bytes up to the next newline belong to the same
// oversized line and are dropped too; the reader stays usable afterwards.
class FrameReader {
 public:
  static constexpr size_t kDefaultMaxBytes = 1024 * 1024;

  struct FeedResult {
    std::vector<std::string> lines;
    bool overflowed = false;
    size_t overflow_bytes = 0;
  };

  explicit FrameReader(size_t max_bytes = kDefaultMaxBytes) : max_bytes_(max_bytes) {}

  FeedResult Feed(const char* data, size_t size);
  FeedResult Feed(const std::string& chunk) { return Feed(chunk.data(), chunk.size()); }

  size_t Buffered() const { return buffer_.size(); }
  size_t MaxBytes() const { return max_bytes_; }
  bool Discarding() const { return discarding_; }
  void Reset() {
    buffer_.clear();
    discarding_ = false;
  }

 private:
  size_t max_bytes_;
  std::string buffer_;
  bool discarding_ = false;
};

}  // namespace gateway
