#include "core/scramble/ScrambleOptions.h"

namespace {

template <typename T>
void overrideIfSet(std::optional<T>& target, const std::optional<T>& value) {
  if (value) {
    target = value;
  }
}

} // namespace

ScrambleOptions ScrambleOptions::mergedWith(const ScrambleOptions& overrides) const {
  ScrambleOptions merged = *this;
  overrideIfSet(merged.min_length, overrides.min_length);
  overrideIfSet(merged.seed, overrides.seed);
  overrideIfSet(merged.preserve_case, overrides.preserve_case);
  overrideIfSet(merged.scramble_probability, overrides.scramble_probability);
  return merged;
}

bool ScrambleOptions::operator==(const ScrambleOptions& other) const {
  return min_length == other.min_length && seed == other.seed && preserve_case == other.preserve_case &&
         scramble_probability == other.scramble_probability;
}

ScrambleConfig ScrambleConfig::resolve(const ScrambleOptions& options) {
  ScrambleConfig config;
  config.min_length = options.min_length.value_or(kDefaultMinLength);
  config.seed = options.seed;
  config.preserve_case = options.preserve_case.value_or(true);
  config.scramble_probability = options.scramble_probability.value_or(1.0);
  return config;
}
