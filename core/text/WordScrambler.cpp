#include "core/text/WordScrambler.h"

#include <cstddef>

#include "core/random/Shuffle.h"

namespace {

constexpr std::size_t kMinScrambleLength = 4;

} // namespace

CodePoints scrambleWord(const CodePoints& word, const RandomSource& draw, bool preserveCase) {
  if (word.size() < kMinScrambleLength) {
    return word;
  }

  const CodePoints interior(word.begin() + 1, word.end() - 1);

  CodePoints mixed;
  if (preserveCase) {
    CodePoints lowered;
    lowered.reserve(interior.size());
    for (CodePoint c : interior) {
      lowered.push_back(toLowerCase(c));
    }
    mixed = shuffled(lowered, draw);
    for (std::size_t i = 0; i < mixed.size(); ++i) {
      if (isUpperCase(interior[i])) {
        mixed[i] = toUpperCase(mixed[i]);
      }
    }
  } else {
    mixed = shuffled(interior, draw);
  }

  CodePoints result;
  result.reserve(word.size());
  result.push_back(word.front());
  result.insert(result.end(), mixed.begin(), mixed.end());
  result.push_back(word.back());
  return result;
}
