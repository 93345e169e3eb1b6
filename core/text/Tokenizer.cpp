#include "core/text/Tokenizer.h"

#include <utility>

std::vector<TextToken> splitWhitespaceRuns(const CodePoints& text) {
  std::vector<TextToken> tokens;
  if (text.empty()) {
    return tokens;
  }

  TextToken current;
  current.whitespace = isWhitespace(text.front());
  for (CodePoint c : text) {
    const bool space = isWhitespace(c);
    if (space != current.whitespace) {
      tokens.push_back(std::move(current));
      current = TextToken{};
      current.whitespace = space;
    }
    current.text.push_back(c);
  }
  tokens.push_back(std::move(current));
  return tokens;
}
