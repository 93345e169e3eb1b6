#pragma once

#include <vector>

#include "core/text/Utf8.h"

/**
 * @file Tokenizer.h
 * @brief 按空白游程切分文本。
 */

/// 一个词元：要么是完整的空白游程，要么是两段空白之间的内容。
struct TextToken {
  CodePoints text;
  bool whitespace{false};
};

/**
 * @brief 将文本切分为交替的空白游程与内容词元。
 *
 * 依次拼接所有词元可还原原文；空文本返回空序列。
 */
std::vector<TextToken> splitWhitespaceRuns(const CodePoints& text);
