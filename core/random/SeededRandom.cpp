#include "core/random/SeededRandom.h"

/**
 * @file SeededRandom.cpp
 * @brief SeededRandom 实现：种子归一化与状态推进。
 */

SeededRandom::SeededRandom(std::int64_t seed) {
  state_ = seed % kModulus;
  if (state_ <= 0) {
    state_ += kModulus - 1;
  }
  // seed ≡ 1 - M 时上一步仍得到 0，状态会永远停在 0，next() 返回负数
  if (state_ <= 0) {
    state_ = kModulus - 1;
  }
}

double SeededRandom::next() {
  state_ = (state_ * kMultiplier) % kModulus;
  return static_cast<double>(state_ - 1) / static_cast<double>(kModulus - 1);
}
