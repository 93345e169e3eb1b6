#include "core/scramble/Scrambler.h"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/text/Segment.h"
#include "core/text/Tokenizer.h"
#include "core/text/Utf8.h"
#include "core/text/WordScrambler.h"

namespace {

void append(CodePoints& out, const CodePoints& part) {
  out.insert(out.end(), part.begin(), part.end());
}

} // namespace

Scrambler::Scrambler(ScrambleOptions defaults, AmbientSourceFactory ambient)
    : defaults_(std::move(defaults)), ambient_(std::move(ambient)) {}

std::string Scrambler::operator()(std::string_view text, const ScrambleOptions& overrides) const {
  return run(text, overrides).text;
}

ScrambleReport Scrambler::run(std::string_view text, const ScrambleOptions& overrides) const {
  ScrambleReport report;
  if (text.empty()) {
    return report;
  }

  const ScrambleConfig config = ScrambleConfig::resolve(defaults_.mergedWith(overrides));
  // 本次调用独占的取值来源，概率门与洗牌共用同一序列
  const RandomSource draw = makeRandomSource(config.seed, ambient_);

  const CodePoints units = decodeUtf8(text);
  const std::vector<TextToken> tokens = splitWhitespaceRuns(units);

  const bool gated = config.scramble_probability < 1.0;
  // 以空白开头时，按正则 split 语义首个空白前还有一个空内容词元，
  // 它同样经过概率门并消耗一次取值
  if (gated && !tokens.empty() && tokens.front().whitespace) {
    draw();
  }

  CodePoints output;
  output.reserve(units.size());

  for (const auto& token : tokens) {
    if (token.whitespace) {
      append(output, token.text);
      continue;
    }
    ++report.content_tokens;

    // 概率门先于长度过滤：每个内容词元恰好消耗一次取值
    if (gated && draw() > config.scramble_probability) {
      append(output, token.text);
      continue;
    }

    WordSegments segments = classifySegments(token.text);
    if (static_cast<long long>(segments.core.size()) < config.min_length) {
      append(output, token.text);
      continue;
    }

    CodePoints mixed = scrambleWord(segments.core, draw, config.preserve_case);
    ++report.scrambled_words;
    if (mixed != segments.core) {
      ++report.changed_words;
    }
    append(output, segments.prefix);
    append(output, mixed);
    append(output, segments.suffix);
  }

  report.text = encodeUtf8(output);
  spdlog::trace("scramble: {} tokens, {} scrambled, {} changed, seeded={}", report.content_tokens,
                report.scrambled_words, report.changed_words, config.seed.has_value());
  return report;
}

std::string scramble(std::string_view text, const ScrambleOptions& options) {
  return Scrambler(options)(text);
}

Scrambler createScrambler(ScrambleOptions defaults) {
  return Scrambler(std::move(defaults));
}
