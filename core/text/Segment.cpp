#include "core/text/Segment.h"

#include <cstddef>

WordSegments classifySegments(const CodePoints& token) {
  std::size_t start = 0;
  std::size_t end = token.size();

  while (start < token.size() && !isLetter(token[start])) {
    ++start;
  }
  while (end > start && !isLetter(token[end - 1])) {
    --end;
  }

  WordSegments segments;
  segments.prefix.assign(token.begin(), token.begin() + static_cast<std::ptrdiff_t>(start));
  segments.core.assign(token.begin() + static_cast<std::ptrdiff_t>(start),
                       token.begin() + static_cast<std::ptrdiff_t>(end));
  segments.suffix.assign(token.begin() + static_cast<std::ptrdiff_t>(end), token.end());
  return segments;
}
