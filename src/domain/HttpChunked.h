// HttpChunked.h
// Chunk-size line parsing for HTTP/1.1 chunked transfer decoding.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace HttpChunked {

// Largest chunk accepted; bigger sizes are treated as corrupt.
constexpr size_t kMaxChunkBytes = 16u * 1024u * 1024u;

// Parses "<hex>[;ext][ ]" into `size`. Returns false when the line has no
// hex digits, carries anything else after them, or the size exceeds
// kMaxChunkBytes. A size of 0 marks the last chunk.
inline bool parseSize(const std::string& line, size_t& size) {
  size_t value = 0;
  size_t i = 0;
  for (; i < line.size(); ++i) {
    const char c = line[i];
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      break;
    }
    value = value * 16 + static_cast<size_t>(digit);
    if (value > kMaxChunkBytes) return false;
  }
  if (i == 0) return false;
  for (size_t j = i; j < line.size(); ++j) {
    if (line[j] == ';') break;
    if (line[j] != ' ' && line[j] != '\t') return false;
  }
  size = value;
  return true;
}

}  // namespace HttpChunked
