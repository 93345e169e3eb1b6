#pragma once

#include <cstdint>

/**
 * @file SeededRandom.h
 * @brief Park–Miller 最小标准线性同余发生器。
 */

/**
 * @brief 可复现的 [0,1) 浮点序列发生器。
 *
 * 状态更新为 state = state * 16807 mod 2147483647，输出 (state - 1) / (M - 1)。
 * 常量固定，保证同一种子在任何实现下得到逐位一致的序列。
 * 每个实例独占自己的状态，不可在多次 scramble 调用之间共享。
 */
class SeededRandom {
public:
  static constexpr std::int64_t kModulus = 2147483647;
  static constexpr std::int64_t kMultiplier = 16807;

  /**
   * @brief 以整数种子构造。
   * @param seed 任意整数；先取 seed % M，结果 <= 0 时加上 M - 1。
   */
  explicit SeededRandom(std::int64_t seed);

  /** @brief 推进一步并返回 [0,1) 内的值。 */
  double next();

  /** @brief 当前内部状态，范围 [1, M-1]。 */
  std::int64_t state() const { return state_; }

private:
  std::int64_t state_{1};
};
