#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "core/random/RandomSource.h"
#include "core/scramble/ScrambleOptions.h"

/**
 * @file Scrambler.h
 * @brief 文本打乱入口：按空白切词、概率门、长度过滤、逐词打乱并拼回。
 */

/// 一次打乱的输出及统计，供界面展示。
struct ScrambleReport {
  std::string text;
  std::size_t content_tokens{0};  ///< 非空白词元数量。
  std::size_t scrambled_words{0}; ///< 通过概率门与长度过滤、被送去打乱的词数。
  std::size_t changed_words{0};   ///< 打乱后确实与原词不同的词数。
};

/**
 * @brief 绑定一组默认选项的打乱器。
 *
 * 自身不持有任何随机状态：每次调用先将覆盖选项合并到默认选项上，
 * 再为这一次调用创建独占的取值来源（有种子时为新的 SeededRandom）。
 * 因此相同文本与相同生效选项总得到相同结果，也可以在多个线程中同时调用。
 */
class Scrambler {
public:
  /**
   * @param defaults 每次调用的默认选项。
   * @param ambient 无种子时的取值来源工厂；为空则使用 makeAmbientRandomSource。
   */
  explicit Scrambler(ScrambleOptions defaults = {}, AmbientSourceFactory ambient = {});

  std::string operator()(std::string_view text, const ScrambleOptions& overrides = {}) const;

  /** @brief 与 operator() 相同，额外返回统计信息。 */
  ScrambleReport run(std::string_view text, const ScrambleOptions& overrides = {}) const;

  const ScrambleOptions& defaults() const { return defaults_; }

private:
  ScrambleOptions defaults_;
  AmbientSourceFactory ambient_;
};

/**
 * @brief 打乱 UTF-8 文本。
 *
 * 纯函数，对任意输入（包括空串、无字母文本、非法 UTF-8）都有定义且不抛异常。
 * 空白原样保留，每个词只在首尾字母之间换位。
 */
std::string scramble(std::string_view text, const ScrambleOptions& options = {});

/// 创建绑定默认选项的打乱器，调用时可传入覆盖选项。
Scrambler createScrambler(ScrambleOptions defaults = {});
