#include "core/config/OptionsJson.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace {

using json = nlohmann::json;

constexpr auto kMinLengthKey = "minLength";
constexpr auto kSeedKey = "seed";
constexpr auto kPreserveCaseKey = "preserveCase";
constexpr auto kProbabilityKey = "scrambleProbability";

/**
 * @brief 读取整数字段。
 * @note 浮点数仅在为整数值且在范围内时接受，例如 42.0。
 */
template <typename Int>
std::optional<Int> readInteger(const json& node, const char* key) {
  auto it = node.find(key);
  if (it == node.end()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    if (it->is_number_unsigned()) {
      const auto value = it->get<std::uint64_t>();
      if (value > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
        return std::nullopt;
      }
      return static_cast<Int>(value);
    }
    const auto value = it->get<std::int64_t>();
    if (value < static_cast<std::int64_t>(std::numeric_limits<Int>::min()) ||
        value > static_cast<std::int64_t>(std::numeric_limits<Int>::max())) {
      return std::nullopt;
    }
    return static_cast<Int>(value);
  }
  if (it->is_number_float()) {
    const double value = it->get<double>();
    const double bound = std::ldexp(1.0, std::numeric_limits<Int>::digits);
    if (std::isfinite(value) && std::trunc(value) == value && value >= -bound && value < bound) {
      return static_cast<Int>(value);
    }
  }
  return std::nullopt;
}

} // namespace

ScrambleOptions optionsFromJson(const json& node) {
  ScrambleOptions options;
  if (!node.is_object()) {
    return options;
  }

  options.min_length = readInteger<int>(node, kMinLengthKey);
  options.seed = readInteger<std::int64_t>(node, kSeedKey);

  if (auto it = node.find(kPreserveCaseKey); it != node.end() && it->is_boolean()) {
    options.preserve_case = it->get<bool>();
  }
  if (auto it = node.find(kProbabilityKey); it != node.end() && it->is_number()) {
    options.scramble_probability = it->get<double>();
  }
  return options;
}

json optionsToJson(const ScrambleOptions& options) {
  json j = json::object();
  if (options.min_length) j[kMinLengthKey] = *options.min_length;
  if (options.seed) j[kSeedKey] = *options.seed;
  if (options.preserve_case) j[kPreserveCaseKey] = *options.preserve_case;
  if (options.scramble_probability) j[kProbabilityKey] = *options.scramble_probability;
  return j;
}
