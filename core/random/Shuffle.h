#pragma once

#include <cmath>
#include <cstddef>
#include <utility>
#include <vector>

#include "core/random/RandomSource.h"

/**
 * @file Shuffle.h
 * @brief Fisher–Yates 洗牌。
 */

/**
 * @brief 返回 items 的一个打乱副本，输入保持不变。
 *
 * i 从 size-1 递减到 1，每步取 j = floor(draw() * (i + 1)) 并交换 i 与 j。
 * 结果是否确定完全取决于 draw。
 */
template <typename T>
std::vector<T> shuffled(const std::vector<T>& items, const RandomSource& draw) {
  std::vector<T> out(items);
  for (std::size_t i = out.size() > 0 ? out.size() - 1 : 0; i > 0; --i) {
    const double scaled = std::floor(draw() * static_cast<double>(i + 1));
    // 来源越界时夹到 [0, i]
    std::size_t j = 0;
    if (scaled >= static_cast<double>(i)) {
      j = i;
    } else if (scaled > 0.0) {
      j = static_cast<std::size_t>(scaled);
    }
    std::swap(out[i], out[j]);
  }
  return out;
}
