#include "core/random/RandomSource.h"

#include <memory>
#include <random>

#include "core/random/SeededRandom.h"

RandomSource makeAmbientRandomSource() {
  std::random_device device;
  auto engine = std::make_shared<std::mt19937>(device());
  return [engine]() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(*engine);
  };
}

RandomSource makeRandomSource(const std::optional<std::int64_t>& seed, const AmbientSourceFactory& ambient) {
  if (seed) {
    auto generator = std::make_shared<SeededRandom>(*seed);
    return [generator]() { return generator->next(); };
  }
  if (ambient) {
    return ambient();
  }
  return makeAmbientRandomSource();
}
