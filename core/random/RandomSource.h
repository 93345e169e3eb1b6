#pragma once

#include <cstdint>
#include <functional>
#include <optional>

/**
 * @file RandomSource.h
 * @brief 打乱与概率门使用的 [0,1) 取值来源。
 */

/// 每次调用返回一个 [0,1) 内的值。
using RandomSource = std::function<double()>;

/// 未提供种子时用于创建非确定性来源的工厂，可在测试中替换。
using AmbientSourceFactory = std::function<RandomSource()>;

/**
 * @brief 创建一个新的非确定性来源。
 *
 * 每次调用都以 std::random_device 播种一个独立的 std::mt19937，
 * 不依赖任何进程级共享状态。
 */
RandomSource makeAmbientRandomSource();

/**
 * @brief 为一次 scramble 调用选择来源。
 * @param seed 有值时返回独占的 SeededRandom 序列；否则调用 ambient 工厂。
 * @param ambient 非确定性来源工厂；为空时使用 makeAmbientRandomSource。
 */
RandomSource makeRandomSource(const std::optional<std::int64_t>& seed, const AmbientSourceFactory& ambient);
