#pragma once

#include "core/text/Utf8.h"

/**
 * @file Segment.h
 * @brief 将内容词元拆分为前缀标点、字母主体与后缀标点。
 */

/// 词元的三段拆分；prefix + core + suffix 恒等于原词元。
struct WordSegments {
  CodePoints prefix; ///< 开头连续的非字母字符。
  CodePoints core;   ///< 从第一个字母到最后一个字母；无字母时为空。
  CodePoints suffix; ///< 结尾连续的非字母字符。
};

/**
 * @brief 拆分词元。
 *
 * 不含任何字母的词元整体归入 prefix，core 与 suffix 为空。
 */
WordSegments classifySegments(const CodePoints& token);
