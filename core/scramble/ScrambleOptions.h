#pragma once

#include <cstdint>
#include <optional>

/**
 * @file ScrambleOptions.h
 * @brief scramble 的选项记录与生效配置。
 */

/**
 * @brief 可部分填写的选项记录。
 *
 * 未设置的字段在 resolve() 时取默认值；mergedWith() 按字段覆盖，
 * 只有覆盖方显式设置的字段才会生效。
 */
struct ScrambleOptions {
  std::optional<int> min_length;              ///< 字母主体最小长度，默认 4。
  std::optional<std::int64_t> seed;           ///< 有值时进入可复现模式。
  std::optional<bool> preserve_case;          ///< 默认 true。
  std::optional<double> scramble_probability; ///< 每个词独立被打乱的概率，默认 1。

  /// 以 overrides 中已设置的字段覆盖本记录，返回新记录。
  ScrambleOptions mergedWith(const ScrambleOptions& overrides) const;

  bool operator==(const ScrambleOptions& other) const;
  bool operator!=(const ScrambleOptions& other) const { return !(*this == other); }
};

/// 补齐默认值后的生效配置。
struct ScrambleConfig {
  static constexpr int kDefaultMinLength = 4;

  int min_length{kDefaultMinLength};
  std::optional<std::int64_t> seed;
  bool preserve_case{true};
  double scramble_probability{1.0};

  static ScrambleConfig resolve(const ScrambleOptions& options);
};
