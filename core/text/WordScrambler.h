#pragma once

#include "core/random/RandomSource.h"
#include "core/text/Utf8.h"

/**
 * @file WordScrambler.h
 * @brief 保留首尾字母、打乱中间字母。
 */

/**
 * @brief 打乱单词内部。
 * @param word 纯字母主体（通常来自 WordSegments::core）。
 * @param draw 洗牌取值来源，与调用方的概率门共享同一序列。
 * @param preserveCase 为 true 时先将内部转为小写再洗牌，
 *        然后按“位置”恢复大小写：原内部第 i 位等于自身大写形式时（包括撇号、数字
 *        等无大小写字符），输出第 i 位转大写。
 * @return 长度不超过 3 的单词原样返回。
 *
 * 大小写跟随位置而不是跟随字母，例如 "aBcd" 的 B 位置上无论换来哪个字母都会是大写。
 */
CodePoints scrambleWord(const CodePoints& word, const RandomSource& draw, bool preserveCase);
