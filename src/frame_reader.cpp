#include "frame_reader.hpp"

namespace gateway {
namespace {

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r') return false;
  }
  return true;
}

}  // namespace

FrameReader::FeedResult FrameReader::Feed(const char* data, size_t size) {
  FeedResult out;
  if (discarding_) {
    size_t i = 0;
    while (i < size && data[i] != '\n') i++;
    if (i == size) return out;
    discarding_ = false;
    data += i + 1;
    size -= i + 1;
  }
  if (size > 0) buffer_.append(data, size);

  size_t start = 0;
  while (true) {
    size_t pos = buffer_.find('\n', start);
    if (pos == std::string::npos) break;
    std::string line = buffer_.substr(start, pos - start);
    start = pos + 1;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (IsBlank(line)) continue;
    out.lines.push_back(std::move(line));
  }
  if (start > 0) buffer_.erase(0, start);

  // Only an unterminated tail can grow without bound.
  if (buffer_.size() > max_bytes_) {
    out.overflowed = true;
    out.overflow_bytes = buffer_.size();
    buffer_.clear();
    buffer_.shrink_to_fit();
    discarding_ = true;
  }
  return out;
}

}  // namespace gateway
